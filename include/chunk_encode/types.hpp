/**
 * @file types.hpp
 * @brief Core data types and constants for Chunk Encode
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Chunk descriptors and the two-view ChunkPlan
 *
 *          - Metric results (ScoredChunk) and curve points (QCurvePoint)
 *
 *          - Encoder family and quality-adjustment mode enums
 */

#ifndef CHUNK_ENCODE_TYPES_HPP
#define CHUNK_ENCODE_TYPES_HPP

#include <string>
#include <vector>

namespace chunk_encode {

// **----- CONSTANTS -----**

/// Attempts per pipeline before a chunk is reported as failed
constexpr int MAX_PIPELINE_ATTEMPTS = 2;

// **----- ENUMS -----**

/**
 * @brief External encoder families with their own CLI dialect.
 */
enum class EncoderFamily { Svt, X265, Aom, Rav1e };

/**
 * @brief Quality-adjustment policy.
 * @note Numbering matches the --qadjust-mode CLI values.
 */
enum class QAdjustMode {
  Percentile = 1, //< SSIMULACRA2-style 5th percentile match
  LinearFit = 2,  //< Butteraugli-style two-pass linear fit
  ProbeCurve = 3  //< CVVDP-style probe curve with luma damping
};

// **----- DATA STRUCTURES -----**

/**
 * @struct Chunk
 * @brief A contiguous, inclusive frame range encoded independently.
 */
struct Chunk {
  int id = 0;              //< 1-based, stable ordering key
  int start = 0;           //< First frame (inclusive)
  int end = 0;             //< Last frame (inclusive)
  int length = 0;          //< end - start + 1
  bool is_credits = false; //< Trailing credits region
  double quantizer = 0.0;  //< Encoder-specific quality value
};

/**
 * @struct ChunkPlan
 * @brief Planned chunks in processing order and in id order.
 * @note by_length is what the scheduler consumes (longest first),
 *       by_id is what reports and aggregation use.
 */
struct ChunkPlan {
  std::vector<Chunk> by_length;
  std::vector<Chunk> by_id;
};

/**
 * @struct ScoredChunk
 * @brief Metric evaluation result for one chunk.
 */
struct ScoredChunk {
  int chunk_id = 0;
  double score = 0.0;               //< Policy-specific aggregate
  std::vector<double> raw_samples;  //< Unfiltered per-frame scores
  double secondary_score = 0.0;     //< e.g. 5th percentile
  bool has_secondary = false;
};

/**
 * @struct QCurvePoint
 * @brief One probed (quantizer, score) sample.
 */
struct QCurvePoint {
  double quantizer = 0.0;
  double score = 0.0;
};

/// Short name used in file names, logs and the persisted record
const char *encoder_family_name(EncoderFamily family);

/// Parse "svt", "x265", "aom" or "rav1e"
bool parse_encoder_family(const std::string &name, EncoderFamily &family);

/// Human-readable policy name
const char *qadjust_mode_name(QAdjustMode mode);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_TYPES_HPP
