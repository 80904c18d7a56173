/**
 * @file concat.hpp
 * @brief Final concatenation of encoded chunks
 *
 * @details The chunk list is written to an anonymous memory file and handed
 *          to the ffmpeg concat demuxer through /proc/<pid>/fd/<n>, so no
 *          list file is left in the run folder.
 */

#ifndef CHUNK_ENCODE_CONCAT_HPP
#define CHUNK_ENCODE_CONCAT_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace chunk_encode {

/**
 * @brief Concat demuxer list, one "file '<absolute path>'" line per chunk.
 * @note Single quotes in paths are escaped the way the demuxer expects.
 */
std::string build_concat_list(const std::vector<std::string> &chunk_paths);

/**
 * @brief ffmpeg command line for the concat step.
 *
 * @param list_path Path of the concat list (usually a /proc fd path)
 * @param output_path Output container
 * @param family Encoder family (raw HEVC needs generated timestamps)
 * @param fps Source frame rate, used for raw HEVC only
 */
std::string build_concat_command(const std::string &list_path,
                                 const std::string &output_path,
                                 EncoderFamily family, double fps);

/**
 * @brief Concatenate chunk outputs into one file.
 *
 * @param chunk_paths Encoded chunks in id order
 * @param output_path Output container (.mkv)
 * @param family Encoder family of the chunks
 * @param fps Source frame rate
 * @return 0 on success, non-zero on error
 */
int concat_chunks(const std::vector<std::string> &chunk_paths,
                  const std::string &output_path, EncoderFamily family,
                  double fps);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_CONCAT_HPP
