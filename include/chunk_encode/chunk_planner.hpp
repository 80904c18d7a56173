/**
 * @file chunk_planner.hpp
 * @brief Scene-change driven chunk planning
 *
 * @details Turns a flat list of scene-change frame indices into a chunk plan:
 *
 *          1. Sanitize the boundaries (ascending, in range, starting at 0)
 *
 *          2. Greedy left-to-right merge of scenes shorter than the minimum
 *             chunk length
 *
 *          3. Optional credits carve-out at the end of the source
 *
 *          A second planning mode samples short, evenly spaced probe windows
 *          for the probe-curve quality policy.
 *
 * @note All functions are pure; frame indices are inclusive.
 */

#ifndef CHUNK_ENCODE_CHUNK_PLANNER_HPP
#define CHUNK_ENCODE_CHUNK_PLANNER_HPP

#include <vector>

#include "types.hpp"

namespace chunk_encode {

/**
 * @brief Clean a raw scene-change list against the source length.
 *
 * @note Drops boundaries outside [0, source_length), duplicates and
 *       non-ascending entries, and inserts an implicit boundary at frame 0.
 *
 * @param scene_changes Raw boundaries as read from the scene file
 * @param source_length Total frames in the source
 * @return Ascending boundaries, first element 0 (empty if source_length <= 0)
 */
std::vector<int> sanitize_scene_changes(const std::vector<int> &scene_changes,
                                        int source_length);

/**
 * @brief Merge scenes into chunks of at least min_chunk_length frames.
 *
 * @attention Single greedy pass: a short scene absorbs following boundaries
 *            until it is long enough or the boundaries run out, in which
 *            case it extends to the end of the source. Only the last chunk
 *            may stay shorter than the minimum.
 *
 * @param scene_changes Sanitized boundaries (see sanitize_scene_changes)
 * @param source_length Total frames in the source
 * @param min_chunk_length Minimum frames per chunk
 * @param default_q Quantizer assigned to every chunk
 * @return Chunks in id order (ids start at 1)
 */
std::vector<Chunk> merge_scenes(const std::vector<int> &scene_changes,
                                int source_length, int min_chunk_length,
                                double default_q);

/**
 * @brief Carve a credits chunk out of the end of an id-ordered chunk list.
 *
 * @param chunks Chunks in id order covering the whole source
 * @param credits_start First frame of the credits
 * @param min_chunk_length Minimum frames per chunk
 * @param credits_q Quantizer for the credits chunk
 * @return New id-ordered list whose last chunk is the credits chunk
 */
std::vector<Chunk> apply_credits(std::vector<Chunk> chunks, int credits_start,
                                 int min_chunk_length, double credits_q);

/**
 * @brief Build both views of a plan from an id-ordered chunk list.
 * @note by_length is sorted longest first, ties by ascending id.
 */
ChunkPlan make_plan(std::vector<Chunk> chunks);

/**
 * @brief Plan the chunks for an encoding run.
 *
 * @param scene_changes Raw scene-change frame indices
 * @param source_length Total frames in the source
 * @param min_chunk_length Minimum frames per chunk
 * @param default_q Quantizer for regular chunks
 * @param credits_start First credits frame (-1 = no credits)
 * @param credits_q Quantizer for the credits chunk
 * @return The plan (empty when source_length <= 0)
 */
ChunkPlan plan_chunks(const std::vector<int> &scene_changes, int source_length,
                      int min_chunk_length, double default_q,
                      int credits_start = -1, double credits_q = 0.0);

/**
 * @brief Plan evenly spaced probe windows for curve fitting.
 *
 * @param source_length Total frames in the source
 * @param probe_count Number of windows
 * @param probe_window_length Frames per window (shrunk if they do not fit)
 * @param skip_fraction Leading fraction of the source never sampled
 * @param credits_start First credits frame (-1 = no credits)
 * @return Non-overlapping windows, ids 1..n, quantizer 0
 */
ChunkPlan plan_probe_chunks(int source_length, int probe_count,
                            int probe_window_length, double skip_fraction,
                            int credits_start = -1);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_CHUNK_PLANNER_HPP
