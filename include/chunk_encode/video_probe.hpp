/**
 * @file video_probe.hpp
 * @brief Source video properties and luma measurement
 *
 * @details The VideoProbe class opens the source with libavformat to read
 *          stream properties and decodes frame ranges with libavcodec to
 *          measure average luma.
 *
 * @attention THREAD MODEL:
 *            - One VideoProbe per thread. FFmpeg decoder state is not
 *              thread-safe.
 */

#ifndef CHUNK_ENCODE_VIDEO_PROBE_HPP
#define CHUNK_ENCODE_VIDEO_PROBE_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <string>

namespace chunk_encode {

/**
 * @struct VideoInfo
 * @brief Properties of the source's best video stream.
 */
struct VideoInfo {
  int width = 0;
  int height = 0;
  int frame_count = 0;
  double fps = 0.0;
  int fps_ceil = 0;
  int bit_depth = 8;
  bool is_pq = false; //< SMPTE ST 2084 transfer characteristic
};

/**
 * @brief Mean luma of one decoded frame, normalized to [0, 1].
 * @note Samples are shifted down by the format's bit offset, so
 *       MSB-aligned formats such as P010 scale like planar 10-bit.
 */
double frame_luma(const AVFrame *f);

/**
 * @class VideoProbe
 * @brief Opens a source once and answers property and luma queries.
 *
 * @attention `MANAGEMENT`:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 */
class VideoProbe {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;
  std::string path;
  VideoInfo props;

public:
  explicit VideoProbe(std::string source_path);
  ~VideoProbe();

  /// Disable copy (FFmpeg contexts are not copyable)
  VideoProbe(const VideoProbe &) = delete;
  VideoProbe &operator=(const VideoProbe &) = delete;

  /**
   * @brief Open the source and decoder.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  const VideoInfo &info() const { return props; }

  /**
   * @brief Average normalized luma over an inclusive frame range.
   *
   * @param start_frame First frame
   * @param end_frame Last frame
   * @param skip Sample every skip-th frame (>= 1)
   * @return Mean luma in [0, 1], or -1.0 if nothing could be decoded
   */
  double measure_average_luma(int start_frame, int end_frame, int skip);
};

} // namespace chunk_encode

#endif // CHUNK_ENCODE_VIDEO_PROBE_HPP
