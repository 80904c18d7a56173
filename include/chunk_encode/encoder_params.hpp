/**
 * @file encoder_params.hpp
 * @brief Typed encoder settings and per-family command formatting
 *
 * @details One EncoderParameters value describes an encoder invocation
 *          independent of the family's CLI dialect. Formatters turn it into
 *          an argv for SvtAv1EncApp, x265, aomenc or rav1e. The
 *          PipelineFactory pairs that with the ffmpeg decode stage for a
 *          chunk.
 */

#ifndef CHUNK_ENCODE_ENCODER_PARAMS_HPP
#define CHUNK_ENCODE_ENCODER_PARAMS_HPP

#include <string>
#include <vector>

#include "process_pipeline.hpp"
#include "types.hpp"

namespace chunk_encode {

/**
 * @struct EncoderParameters
 * @brief Family-independent encoder settings.
 * @note Negative integers mean "leave at the encoder default".
 */
struct EncoderParameters {
  EncoderFamily family = EncoderFamily::Svt;
  double quantizer = 18.0;
  std::string preset = "2"; //< Speed level, or a named x265 preset
  int threads = 4;
  int keyint = -1;
  int tile_columns = -1;
  int tile_rows = -1;
  int film_grain = -1;
  bool analysis = false;          //< Analysis-pass speed settings
  std::vector<std::string> extra; //< Passed through verbatim, last
};

/**
 * @brief Derive analysis-pass settings from the final-pass settings.
 *
 * @note SVT-AV1: preset = analysis_preset, film grain 0, tiles 1x0.
 *       x265: preset fast plus lighter search and lookahead options.
 */
EncoderParameters make_analysis_parameters(const EncoderParameters &final_params,
                                           int analysis_preset);

/// Encoder executable for a family (overridable through the environment)
std::string encoder_binary(EncoderFamily family);

/// Output file extension for a family, without the dot
const char *encoder_output_extension(EncoderFamily family);

/// Whether the family encodes AV1 (10-bit decode stage)
bool is_av1_family(EncoderFamily family);

/**
 * @brief Format the encoder argv for one chunk.
 *
 * @param params Settings (quantizer already chosen for the chunk)
 * @param output_path Encoded chunk file
 * @param frames Chunk length (x265 needs it up front)
 * @return argv, first element the executable
 */
std::vector<std::string> build_encode_argv(const EncoderParameters &params,
                                           const std::string &output_path,
                                           int frames);

/**
 * @brief Format the ffmpeg decode argv writing a y4m range to stdout.
 */
std::vector<std::string> build_decode_argv(const std::string &source,
                                           const Chunk &chunk,
                                           EncoderFamily family);

/**
 * @brief SVT-AV1 keyint aligned to the mini-GOP structure.
 *
 * @param fps Frame rate
 * @param seconds Minimum keyint duration
 * @param startup_levels Hierarchical levels of the first mini-GOP
 * @param hierarchical_levels Hierarchical levels of the following mini-GOPs
 * @return Smallest startup + n * regular mini-GOP sizes >= fps * seconds
 */
int svt_aligned_keyint(double fps, double seconds, int startup_levels,
                       int hierarchical_levels);

/**
 * @brief Effective SVT-AV1 mini-GOP levels for the given extra arguments.
 * @note Honours --hierarchical-levels and --startup-mg-size in `extra`.
 */
void svt_gop_levels(const std::vector<std::string> &extra, int &startup_levels,
                    int &hierarchical_levels);

/**
 * @brief Default minimum chunk length for a family.
 * @note SVT-AV1: aligned keyint for 2 s; others: ceil(fps) * 2.
 */
int default_min_chunk_length(EncoderFamily family, double fps,
                             const std::vector<std::string> &extra);

/**
 * @brief Default keyint for the final encode (10 s of frames, GOP aligned
 *        for SVT-AV1).
 */
int default_keyint(EncoderFamily family, double fps,
                   const std::vector<std::string> &extra);

/// Split a user-supplied parameter string on whitespace, honouring quotes
std::vector<std::string> split_arguments(const std::string &text);

/// Join an argv for logging
std::string join_argv(const std::vector<std::string> &argv);

/**
 * @class PipelineFactory
 * @brief Builds the decode | encode job for each chunk of a pass.
 */
class PipelineFactory {
public:
  /**
   * @param source Source video
   * @param chunks_dir Folder for encoded chunks
   * @param logs_dir Folder for per-chunk encoder logs (empty = discard)
   * @param params Settings for regular chunks
   * @param credits_preset Preset for the credits chunk (empty = same)
   * @param tag File name tag separating passes ("" for the final pass)
   */
  PipelineFactory(std::string source, std::string chunks_dir,
                  std::string logs_dir, EncoderParameters params,
                  std::string credits_preset, std::string tag);

  /// Output path for a chunk id in this pass
  std::string output_path(int chunk_id) const;

  PipelineJob make_job(const Chunk &chunk) const;

  /**
   * @brief Jobs for a plan in processing order.
   * @param chunks Chunks, longest first
   * @param skip_credits Leave the credits chunk out (analysis passes)
   */
  std::vector<PipelineJob> make_jobs(const std::vector<Chunk> &chunks,
                                     bool skip_credits) const;

  const EncoderParameters &parameters() const { return params_; }

private:
  std::string source_;
  std::string chunks_dir_;
  std::string logs_dir_;
  EncoderParameters params_;
  std::string credits_preset_;
  std::string tag_;
};

} // namespace chunk_encode

#endif // CHUNK_ENCODE_ENCODER_PARAMS_HPP
