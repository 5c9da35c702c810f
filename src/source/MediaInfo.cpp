// Repository: loopcast
// Component: Media Info
// Purpose: libavformat read of duration and video geometry of a local file.
// Copyright (c) 2026 Loopcast

#include "loopcast/source/MediaInfo.hpp"

#include <sstream>

#include "loopcast/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

namespace loopcast::source {

using util::Logger;

ItemMetadata ReadMediaInfo(const std::string& uri) {
  ItemMetadata meta;

  AVFormatContext* format_ctx = nullptr;
  int ret = avformat_open_input(&format_ctx, uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, sizeof(errbuf));
    Logger::Debug("[MediaInfo] open_input failed uri=" + uri + " err=" + errbuf);
    return meta;
  }

  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, sizeof(errbuf));
    Logger::Debug("[MediaInfo] find_stream_info failed uri=" + uri + " err=" + errbuf);
    avformat_close_input(&format_ctx);
    return meta;
  }

  if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
    meta.duration_ms = format_ctx->duration / (AV_TIME_BASE / 1000);
  }

  const int video_index =
      av_find_best_stream(format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_index >= 0) {
    const AVCodecParameters* par = format_ctx->streams[video_index]->codecpar;
    if (par->width > 0 && par->height > 0) {
      meta.width = par->width;
      meta.height = par->height;
    }
    meta.video_codec = avcodec_get_name(par->codec_id);
  }

  avformat_close_input(&format_ctx);
  return meta;
}

}  // namespace loopcast::source
