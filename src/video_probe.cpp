/**
 * @file video_probe.cpp
 * @brief Source probing implementation
 */

#include "chunk_encode/video_probe.hpp"

#include <cmath>
#include <cstdint>

extern "C" {
#include <libavutil/pixdesc.h>
}

#include "chunk_encode/logging.hpp"

namespace chunk_encode {

VideoProbe::VideoProbe(std::string source_path) : path(std::move(source_path)) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
}

VideoProbe::~VideoProbe() {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_frame_free(&frame);
  av_packet_free(&pkt);
}

bool VideoProbe::initialize() {
  if (!frame || !pkt) {
    LOG_ERROR("Failed to allocate AVFrame/AVPacket");
    return false;
  }

  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("avformat_open_input failed for {}", path);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}", path);
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("No video stream found in {}", path);
    return false;
  }

  /// Discard non-video streams to save processing time
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVStream *stream = fmt_ctx->streams[video_stream_idx];
  AVCodecParameters *param = stream->codecpar;

  // **--- STREAM PROPERTIES ---**

  props.width = param->width;
  props.height = param->height;
  props.is_pq = (param->color_trc == AVCOL_TRC_SMPTE2084);

  AVRational rate = stream->avg_frame_rate;
  if (rate.num <= 0 || rate.den <= 0)
    rate = stream->r_frame_rate;
  props.fps = (rate.num > 0 && rate.den > 0) ? av_q2d(rate) : 25.0;
  props.fps_ceil = static_cast<int>(std::ceil(props.fps));

  const AVPixFmtDescriptor *desc =
      av_pix_fmt_desc_get(static_cast<AVPixelFormat>(param->format));
  if (desc)
    props.bit_depth = desc->comp[0].depth;

  if (stream->nb_frames > 0) {
    props.frame_count = static_cast<int>(stream->nb_frames);
  } else {
    double seconds = 0.0;
    if (stream->duration != AV_NOPTS_VALUE) {
      seconds = stream->duration * av_q2d(stream->time_base);
    } else if (fmt_ctx->duration != AV_NOPTS_VALUE) {
      seconds = fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);
    }
    props.frame_count = static_cast<int>(std::llround(seconds * props.fps));
  }

  // **--- DECODER ---**

  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder found for codec ID {}", (int)param->codec_id);
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  if (avcodec_parameters_to_context(dec_ctx, param) < 0) {
    LOG_ERROR("avcodec_parameters_to_context failed");
    return false;
  }

  /// Only the luma plane is read
  dec_ctx->flags |= AV_CODEC_FLAG_GRAY;
  dec_ctx->thread_count = 0;

  if (avcodec_open2(dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("avcodec_open2 failed");
    return false;
  }

  LOG_INFO("Source: {}x{}, {} frames at {:.3f} fps, {}-bit{}", props.width,
           props.height, props.frame_count, props.fps, props.bit_depth,
           props.is_pq ? ", PQ" : "");
  return true;
}

double frame_luma(const AVFrame *f) {
  const AVPixFmtDescriptor *desc =
      av_pix_fmt_desc_get(static_cast<AVPixelFormat>(f->format));
  const int depth = desc ? desc->comp[0].depth : 8;
  const int shift = desc ? desc->comp[0].shift : 0;
  const double max_value = static_cast<double>((1 << depth) - 1);
  const bool wide = depth > 8;

  double sum = 0.0;
  for (int y = 0; y < f->height; ++y) {
    const uint8_t *row = f->data[0] + static_cast<ptrdiff_t>(y) * f->linesize[0];
    uint64_t row_sum = 0;
    if (wide) {
      const uint16_t *px = reinterpret_cast<const uint16_t *>(row);
      for (int x = 0; x < f->width; ++x)
        row_sum += px[x] >> shift;
    } else {
      for (int x = 0; x < f->width; ++x)
        row_sum += row[x];
    }
    sum += static_cast<double>(row_sum);
  }

  const double pixels = static_cast<double>(f->width) * f->height;
  return pixels > 0 ? sum / pixels / max_value : 0.0;
}

double VideoProbe::measure_average_luma(int start_frame, int end_frame,
                                        int skip) {
  if (!dec_ctx || end_frame < start_frame)
    return -1.0;
  if (skip < 1)
    skip = 1;

  AVStream *stream = fmt_ctx->streams[video_stream_idx];
  const double time_base = av_q2d(stream->time_base);
  const double start_sec = start_frame / props.fps;

  /// Seek to the keyframe at or before the range
  int64_t seek_ts = static_cast<int64_t>(start_sec / time_base);
  if (stream->start_time != AV_NOPTS_VALUE)
    seek_ts += stream->start_time;
  if (av_seek_frame(fmt_ctx, video_stream_idx, seek_ts, AVSEEK_FLAG_BACKWARD) <
      0) {
    LOG_WARN("Seek to frame {} failed, decoding from the current position",
             start_frame);
  }
  avcodec_flush_buffers(dec_ctx);

  const int64_t origin =
      stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  double luma_sum = 0.0;
  int sampled = 0;
  bool past_end = false;

  auto consume_frames = [&]() {
    while (avcodec_receive_frame(dec_ctx, frame) >= 0) {
      int64_t pts = frame->best_effort_timestamp;
      if (pts == AV_NOPTS_VALUE) {
        av_frame_unref(frame);
        continue;
      }
      int index = static_cast<int>(
          std::llround((pts - origin) * time_base * props.fps));
      if (index > end_frame) {
        past_end = true;
      } else if (index >= start_frame && (index - start_frame) % skip == 0) {
        luma_sum += frame_luma(frame);
        ++sampled;
      }
      av_frame_unref(frame);
    }
  };

  while (!past_end && av_read_frame(fmt_ctx, pkt) >= 0) {
    if (pkt->stream_index == video_stream_idx &&
        avcodec_send_packet(dec_ctx, pkt) >= 0) {
      consume_frames();
    }
    av_packet_unref(pkt);
  }

  /// Drain frames still buffered in the decoder
  if (!past_end && avcodec_send_packet(dec_ctx, nullptr) >= 0)
    consume_frames();

  if (sampled == 0) {
    LOG_WARN("No frames decoded in range {}-{}", start_frame, end_frame);
    return -1.0;
  }
  return luma_sum / sampled;
}

} // namespace chunk_encode
