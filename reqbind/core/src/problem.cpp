#include "reqbind/core/problem.hpp"

#include <cstdio>
#include <sstream>

namespace reqbind {

namespace {

problem_details make(int status, std::string_view title, std::string_view detail) {
    problem_details p;
    p.status = status;
    p.title = std::string(title);
    if (!detail.empty()) {
        p.detail = std::string(detail);
    }
    return p;
}

std::string_view code_name(error_code code) noexcept {
    switch (code) {
    case error_code::ok:
        return "ok";
    case error_code::malformed_input:
        return "malformed_input";
    case error_code::conversion_failed:
        return "conversion_failed";
    case error_code::invalid_destination:
        return "invalid_destination";
    case error_code::unsupported_content_type:
        return "unsupported_content_type";
    case error_code::body_too_large:
        return "body_too_large";
    case error_code::nesting_too_deep:
        return "nesting_too_deep";
    }
    return "unknown";
}

} // namespace

std::string escape_json_string(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string problem_details::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"" << escape_json_string(type) << "\"";
    oss << ",\"title\":\"" << escape_json_string(title) << "\"";
    oss << ",\"status\":" << status;

    if (detail) {
        oss << ",\"detail\":\"" << escape_json_string(*detail) << "\"";
    }

    if (instance) {
        oss << ",\"instance\":\"" << escape_json_string(*instance) << "\"";
    }

    for (const auto& [key, value] : extensions) {
        oss << ",\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
    }

    oss << "}";
    return oss.str();
}

problem_details problem_details::bad_request(std::string_view detail) {
    return make(400, "Bad Request", detail);
}

problem_details problem_details::payload_too_large(std::string_view detail) {
    return make(413, "Payload Too Large", detail);
}

problem_details problem_details::unsupported_media_type(std::string_view detail) {
    return make(415, "Unsupported Media Type", detail);
}

problem_details problem_details::internal_server_error(std::string_view detail) {
    return make(500, "Internal Server Error", detail);
}

problem_details to_problem(const decode_error& err) {
    problem_details p;
    switch (err.http_status()) {
    case 413:
        p = problem_details::payload_too_large(err.message);
        break;
    case 415:
        p = problem_details::unsupported_media_type(err.message);
        break;
    case 500:
        p = problem_details::internal_server_error(err.message);
        break;
    default:
        p = problem_details::bad_request(err.message);
        break;
    }

    p.extensions["code"] = std::string(code_name(err.code));
    if (err.code == error_code::malformed_input || err.code == error_code::nesting_too_deep) {
        p.extensions["offset"] = std::to_string(err.offset);
    }
    if (!err.input.empty()) {
        p.extensions["input"] = err.input;
    }
    if (!err.type_name.empty()) {
        p.extensions["type"] = err.type_name;
    }
    return p;
}

} // namespace reqbind
