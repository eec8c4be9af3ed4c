#include "reqbind/core/result.hpp"
#include "reqbind/core/charset.hpp"

#include <string>

namespace reqbind {

namespace {

std::string_view trim_ws(std::string_view sv) noexcept {
    while (!sv.empty() && charset::whitespace.has(sv.front())) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && charset::whitespace.has(sv.back())) {
        sv.remove_suffix(1);
    }
    return sv;
}

std::string quoted(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 2);
    out.push_back('"');
    out.append(sv);
    out.push_back('"');
    return out;
}

} // namespace

int decode_error::http_status() const noexcept {
    switch (code) {
    case error_code::ok:
        return 200;
    case error_code::malformed_input:
    case error_code::conversion_failed:
    case error_code::nesting_too_deep:
        return 400;
    case error_code::body_too_large:
        return 413;
    case error_code::unsupported_content_type:
        // A body without any declared type is a malformed request.
        return input.empty() ? 400 : 415;
    case error_code::invalid_destination:
        return 500;
    }
    return 500;
}

decode_error malformed_input(size_t offset, std::string_view rest) {
    decode_error err;
    err.code = error_code::malformed_input;
    err.offset = offset;

    auto trimmed = trim_ws(rest);
    if (trimmed.empty()) {
        err.message = "unexpected JSON EOF in position " + std::to_string(offset);
        return err;
    }

    err.fragment.assign(trimmed.substr(0, MAX_FRAGMENT_LENGTH));
    err.message = "invalid JSON syntax in position " + std::to_string(offset) + ": unexpected " +
                  quoted(err.fragment);
    return err;
}

decode_error malformed_query(size_t offset, std::string_view fragment) {
    decode_error err;
    err.code = error_code::malformed_input;
    err.offset = offset;
    err.fragment.assign(fragment.substr(0, MAX_FRAGMENT_LENGTH));
    err.message = "invalid URL query in position " + std::to_string(offset) + ": unexpected " +
                  quoted(err.fragment);
    return err;
}

decode_error nesting_too_deep(size_t offset, size_t limit) {
    decode_error err;
    err.code = error_code::nesting_too_deep;
    err.offset = offset;
    err.message = "JSON nesting exceeds " + std::to_string(limit) + " levels in position " +
                  std::to_string(offset);
    return err;
}

decode_error conversion_failed(std::string_view input,
                               std::string_view type_name,
                               std::string_view reason) {
    decode_error err;
    err.code = error_code::conversion_failed;
    err.input.assign(input);
    err.type_name.assign(type_name);
    err.message = "failed to parse " + quoted(input) + " into " + err.type_name;
    if (!reason.empty()) {
        err.message += ": ";
        err.message.append(reason);
    }
    return err;
}

decode_error unsupported_kind(std::string_view input, std::string_view type_name) {
    return conversion_failed(input, type_name, "unsupported destination kind");
}

decode_error invalid_destination(std::string_view detail) {
    decode_error err;
    err.code = error_code::invalid_destination;
    err.message = "invalid destination: ";
    err.message.append(detail);
    return err;
}

decode_error unsupported_content_type(std::string_view media_type) {
    decode_error err;
    err.code = error_code::unsupported_content_type;
    err.input.assign(media_type);
    if (media_type.empty()) {
        err.message = "unspecified content type";
    } else {
        err.message = "unsupported content type " + quoted(media_type);
    }
    return err;
}

decode_error body_too_large(size_t size, size_t limit) {
    decode_error err;
    err.code = error_code::body_too_large;
    err.message = "request body of " + std::to_string(size) + " bytes exceeds limit of " +
                  std::to_string(limit) + " bytes";
    return err;
}

} // namespace reqbind
