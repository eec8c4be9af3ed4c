#pragma once

#include "result.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reqbind {

// RFC 7807 body describing why a request could not be decoded.
struct problem_details {
    std::string type = "about:blank";
    std::string title;
    int status = 500;
    std::optional<std::string> detail;
    std::optional<std::string> instance;
    std::map<std::string, std::string> extensions;

    std::string to_json() const;

    static problem_details bad_request(std::string_view detail = "");
    static problem_details payload_too_large(std::string_view detail = "");
    static problem_details unsupported_media_type(std::string_view detail = "");
    static problem_details internal_server_error(std::string_view detail = "");
};

// Status and title follow err.http_status(); the error code and, where set,
// the offending input and destination type become extensions.
[[nodiscard]] problem_details to_problem(const decode_error& err);

[[nodiscard]] std::string escape_json_string(std::string_view sv);

} // namespace reqbind
