/**
 * @file scene_changes.hpp
 * @brief Scene-change list loading
 *
 * @details Two on-disk formats are accepted:
 *
 *          - QP file: one "<frame> <type>" pair per line (e.g. "240 I")
 *
 *          - JSON: {"scene_changes": [0, 240, ...]} or a bare array
 *
 *          The format is picked by a leading '{' or '['.
 */

#ifndef CHUNK_ENCODE_SCENE_CHANGES_HPP
#define CHUNK_ENCODE_SCENE_CHANGES_HPP

#include <string>
#include <vector>

namespace chunk_encode {

/**
 * @brief Parse scene changes from text already in memory.
 * @param text File contents
 * @param frames Output frame indices, in file order
 * @return true on success, false if the text is malformed
 */
bool parse_scene_changes(const std::string &text, std::vector<int> &frames);

/**
 * @brief Load a scene-change file.
 * @param path File to read
 * @param frames Output frame indices, in file order
 * @return true on success, false on IO or parse error (logged)
 */
bool load_scene_changes(const std::string &path, std::vector<int> &frames);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_SCENE_CHANGES_HPP
