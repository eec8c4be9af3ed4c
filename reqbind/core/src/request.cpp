#include "reqbind/core/request.hpp"
#include "reqbind/core/log.hpp"

#include <cctype>
#include <utility>

namespace reqbind {

namespace {

result<source> refuse(decode_error err) {
    log::warn("request", err.message);
    return std::unexpected(std::move(err));
}

} // namespace

std::string extract_media_type(std::string_view content_type) {
    auto semicolon_pos = content_type.find(';');
    if (semicolon_pos != std::string_view::npos) {
        content_type = content_type.substr(0, semicolon_pos);
    }
    while (!content_type.empty() && (content_type.front() == ' ' || content_type.front() == '\t')) {
        content_type.remove_prefix(1);
    }
    while (!content_type.empty() && (content_type.back() == ' ' || content_type.back() == '\t')) {
        content_type.remove_suffix(1);
    }

    std::string out;
    out.reserve(content_type.size());
    for (char c : content_type) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

result<source> download(const request_view& req, const decode_limits& limits) {
    if (req.body.size() > limits.max_body_size) {
        return refuse(body_too_large(req.body.size(), limits.max_body_size));
    }

    auto type = extract_media_type(req.content_type);

    if (type.empty()) {
        if (!req.body.empty()) {
            return refuse(unsupported_content_type(type));
        }
        auto query = req.query;
        if (!query.empty() && query.front() == '?') {
            query.remove_prefix(1);
        }
        auto parsed = form::from_query(query);
        if (!parsed) {
            return refuse(parsed.error());
        }
        return source(std::move(*parsed));
    }

    if (type == TYPE_FORM) {
        auto parsed = form::from_query(req.body);
        if (!parsed) {
            return refuse(parsed.error());
        }
        return source(std::move(*parsed));
    }

    if (type == TYPE_JSON) {
        return source(json_body(std::string(req.body)));
    }

    return refuse(unsupported_content_type(type));
}

} // namespace reqbind
