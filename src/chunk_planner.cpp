/**
 * @file chunk_planner.cpp
 * @brief Chunk planning implementation
 */

#include "chunk_encode/chunk_planner.hpp"

#include <algorithm>
#include <cmath>

#include "chunk_encode/logging.hpp"

namespace chunk_encode {

namespace {

Chunk make_chunk(int id, int start, int end, double q, bool credits) {
  Chunk c;
  c.id = id;
  c.start = start;
  c.end = end;
  c.length = end - start + 1;
  c.is_credits = credits;
  c.quantizer = q;
  return c;
}

} // anonymous namespace

// **----- SANITIZE -----**

std::vector<int> sanitize_scene_changes(const std::vector<int> &scene_changes,
                                        int source_length) {
  std::vector<int> out;
  if (source_length <= 0)
    return out;

  out.reserve(scene_changes.size() + 1);
  out.push_back(0);

  int dropped = 0;
  for (int frame : scene_changes) {
    if (frame < 0 || frame >= source_length || frame <= out.back()) {
      /// Frame 0 is implicit, so a leading 0 is not worth a warning
      if (frame != 0)
        ++dropped;
      continue;
    }
    out.push_back(frame);
  }

  if (dropped > 0) {
    LOG_WARN("Ignored {} scene changes that were out of range or not "
             "ascending",
             dropped);
  }
  return out;
}

// **----- GREEDY MERGE -----**

std::vector<Chunk> merge_scenes(const std::vector<int> &scene_changes,
                                int source_length, int min_chunk_length,
                                double default_q) {
  std::vector<Chunk> chunks;
  if (source_length <= 0)
    return chunks;

  if (scene_changes.empty()) {
    chunks.push_back(make_chunk(1, 0, source_length - 1, default_q, false));
    return chunks;
  }

  const size_t n = scene_changes.size();
  int chunk_id = 1;
  size_t i = 0;

  while (i < n) {
    int start = scene_changes[i];
    size_t next = i + 1;

    /// Absorb boundaries while [start, scene_changes[next]) is too short
    while (next < n && scene_changes[next] - start < min_chunk_length) {
      ++next;
    }

    int end = (next < n) ? scene_changes[next] - 1 : source_length - 1;
    chunks.push_back(make_chunk(chunk_id++, start, end, default_q, false));
    i = next;
  }

  return chunks;
}

// **----- CREDITS -----**

std::vector<Chunk> apply_credits(std::vector<Chunk> chunks, int credits_start,
                                 int min_chunk_length, double credits_q) {
  if (chunks.empty())
    return chunks;

  const int last_frame = chunks.back().end;
  if (credits_start <= chunks.front().start || credits_start > last_frame) {
    LOG_WARN("Credits start frame {} is outside the source, ignoring it",
             credits_start);
    return chunks;
  }

  /// Truncate the chunk containing the credits start. A chunk that starts
  /// exactly on it is the "one past the previous end" case: nothing to
  /// truncate, it is simply replaced by the credits chunk.
  for (auto &c : chunks) {
    if (c.start < credits_start && credits_start <= c.end) {
      c.end = credits_start - 1;
      c.length = c.end - c.start + 1;
      break;
    }
  }

  chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                              [credits_start](const Chunk &c) {
                                return c.start >= credits_start;
                              }),
               chunks.end());

  /// A runt in front of the credits is folded into its predecessor
  if (chunks.size() > 1 && chunks.back().length < min_chunk_length) {
    Chunk &prev = chunks[chunks.size() - 2];
    prev.end = chunks.back().end;
    prev.length = prev.end - prev.start + 1;
    chunks.pop_back();
  }

  int credits_id = static_cast<int>(chunks.size()) + 1;
  chunks.push_back(
      make_chunk(credits_id, credits_start, last_frame, credits_q, true));
  return chunks;
}

// **----- PLAN VIEWS -----**

ChunkPlan make_plan(std::vector<Chunk> chunks) {
  ChunkPlan plan;
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });
  plan.by_id = chunks;

  std::stable_sort(
      chunks.begin(), chunks.end(),
      [](const Chunk &a, const Chunk &b) { return a.length > b.length; });
  plan.by_length = std::move(chunks);
  return plan;
}

ChunkPlan plan_chunks(const std::vector<int> &scene_changes, int source_length,
                      int min_chunk_length, double default_q,
                      int credits_start, double credits_q) {
  auto boundaries = sanitize_scene_changes(scene_changes, source_length);
  auto chunks =
      merge_scenes(boundaries, source_length, min_chunk_length, default_q);

  if (credits_start >= 0) {
    chunks = apply_credits(std::move(chunks), credits_start, min_chunk_length,
                           credits_q);
  }

  return make_plan(std::move(chunks));
}

// **----- PROBE WINDOWS -----**

ChunkPlan plan_probe_chunks(int source_length, int probe_count,
                            int probe_window_length, double skip_fraction,
                            int credits_start) {
  std::vector<Chunk> windows;
  if (source_length <= 0 || probe_count <= 0 || probe_window_length <= 0)
    return make_plan(std::move(windows));

  int range_end = (credits_start > 0 && credits_start < source_length)
                      ? credits_start
                      : source_length;
  int range_start =
      static_cast<int>(std::floor(source_length * std::max(0.0, skip_fraction)));
  if (range_start >= range_end)
    range_start = 0;

  const int usable = range_end - range_start;
  int count = std::min(probe_count, usable);
  int window = std::min(probe_window_length, usable / count);
  const double spacing = static_cast<double>(usable) / count;

  for (int i = 0; i < count; ++i) {
    /// Center each window in its slot
    int start = range_start + static_cast<int>(std::floor(
                                  i * spacing + (spacing - window) / 2.0));
    windows.push_back(make_chunk(i + 1, start, start + window - 1, 0.0, false));
  }

  return make_plan(std::move(windows));
}

} // namespace chunk_encode
