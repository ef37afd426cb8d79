#pragma once

namespace wolfcache::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kServiceName = "wolf-logic-timesync";

inline constexpr int kOk = 200;
inline constexpr int kBadRequest = 400;
inline constexpr int kNotFound = 404;
inline constexpr int kTooManyRequests = 429;
inline constexpr int kInternalError = 500;

} // namespace wolfcache::http
