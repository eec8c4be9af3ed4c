#pragma once

#include "limits.hpp"
#include "result.hpp"
#include "source.hpp"

#include <string>
#include <string_view>

namespace reqbind {

inline constexpr std::string_view TYPE_JSON = "application/json";
inline constexpr std::string_view TYPE_FORM = "application/x-www-form-urlencoded";
inline constexpr std::string_view TYPE_MULTIPART = "multipart/form-data";

// What the request adapter needs from an HTTP request. Views must outlive the
// call to download().
struct request_view {
    std::string_view content_type; // raw Content-Type header value
    std::string_view query;         // URL query, with or without the leading '?'
    std::string_view body;
};

// Media type of a Content-Type value, lowercased, without parameters
// (e.g. "; charset=utf-8").
[[nodiscard]] std::string extract_media_type(std::string_view content_type);

// Chooses and builds the input source for a request:
//   no content type, no body -> the URL query as a form
//   url-encoded              -> the body as a form
//   JSON                     -> the body as raw JSON
// A body without a content type, multipart and other types are refused, as
// are bodies larger than limits.max_body_size.
[[nodiscard]] result<source> download(const request_view& req,
                                      const decode_limits& limits = default_limits());

template <record_type T>
result<void> decode_request(const request_view& req,
                            T& out,
                            const decode_limits& limits = default_limits()) {
    auto src = download(req, limits);
    if (!src) {
        return std::unexpected(src.error());
    }
    return src->decode(out, limits);
}

} // namespace reqbind
