// Repository: loopcast
// Component: Media Info
// Purpose: libavformat read of duration and video geometry of a local file.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_MEDIA_INFO_HPP_
#define LOOPCAST_SOURCE_MEDIA_INFO_HPP_

#include <string>

#include "loopcast/source/MediaItem.hpp"

namespace loopcast::source {

// Opens the container, reads stream info and closes it again. Fields that
// cannot be determined stay unset; an unreadable file yields an empty result.
ItemMetadata ReadMediaInfo(const std::string& uri);

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_MEDIA_INFO_HPP_
