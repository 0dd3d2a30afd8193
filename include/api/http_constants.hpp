#pragma once

#include <string>
#include <string_view>

namespace polystore::http {

inline constexpr const char* kJsonContentType = "application/json";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kContentTypeHeader = "Content-Type";

inline constexpr int kOk = 200;
inline constexpr int kCreated = 201;
inline constexpr int kNoContent = 204;
inline constexpr int kBadRequest = 400;
inline constexpr int kNotFound = 404;
inline constexpr int kInternalError = 500;
inline constexpr int kServiceUnavailable = 503;

inline constexpr std::string_view kPageParam = "page";
inline constexpr std::string_view kLimitParam = "limit";

} // namespace polystore::http
