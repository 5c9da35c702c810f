// Repository: loopcast
// Component: Base64
// Purpose: Standard (RFC 4648) base64 encoding for HTTP and SMTP credentials.
// Copyright (c) 2026 Loopcast

#include "loopcast/util/Base64.hpp"

#include <vector>

#include <openssl/evp.h>

namespace loopcast::util {

std::string Base64Encode(const std::string& data) {
  std::vector<unsigned char> encoded(4 * ((data.size() + 2) / 3) + 1);
  const int len = EVP_EncodeBlock(encoded.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(len));
}

}  // namespace loopcast::util
