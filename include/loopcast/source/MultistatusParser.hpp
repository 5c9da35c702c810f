// Repository: loopcast
// Component: WebDAV Multistatus Parser
// Purpose: 207 Multi-Status XML body → directory entries (libxml2).
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_MULTISTATUS_PARSER_HPP_
#define LOOPCAST_SOURCE_MULTISTATUS_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loopcast::source {

struct DavEntry {
  std::string server_path;  // Decoded, origin stripped, no trailing slash.
  bool is_collection = false;
  std::optional<int64_t> content_length;
  std::string display_name;
};

// Throws SourceUnavailableError when the body is not a DAV multistatus
// document. Responses whose propstat status is not 2xx are dropped.
std::vector<DavEntry> ParseMultistatus(const std::string& xml);

// Strips "scheme://authority" from an href, percent-decodes it and removes
// trailing slashes ("/" stays "/").
std::string NormalizeHref(const std::string& href);

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_MULTISTATUS_PARSER_HPP_
