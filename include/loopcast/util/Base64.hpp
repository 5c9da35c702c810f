// Repository: loopcast
// Component: Base64
// Purpose: Standard (RFC 4648) base64 encoding for HTTP and SMTP credentials.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_BASE64_HPP_
#define LOOPCAST_UTIL_BASE64_HPP_

#include <string>

namespace loopcast::util {

std::string Base64Encode(const std::string& data);

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_BASE64_HPP_
