/**
 * @file qadjust_record.hpp
 * @brief Persisted quality-adjustment record and reuse validation
 *
 * @details The record is a JSON file in the run folder. It stores the
 *          settings the analysis ran with, the policy-level results and the
 *          per-chunk inputs and outputs, so that a later run can reuse it
 *          (optionally with a new target) without encoding analysis passes.
 */

#ifndef CHUNK_ENCODE_QADJUST_RECORD_HPP
#define CHUNK_ENCODE_QADJUST_RECORD_HPP

#include <string>

#include "qadjust.hpp"
#include "types.hpp"

namespace chunk_encode {

/**
 * @struct RecordParameters
 * @brief Settings that must match for a record to be reusable.
 */
struct RecordParameters {
  QAdjustMode mode = QAdjustMode::Percentile;
  EncoderFamily encoder = EncoderFamily::Svt;
  int min_chunk_length = 0;
  int keyint = 0;
  double base_q = 0.0;
  double target = 0.0;
  int analysis_preset = 0;
  int skip = 1;
};

/**
 * @struct AdjustmentRecord
 * @brief Everything written to and read from the record file.
 */
struct AdjustmentRecord {
  RecordParameters parameters;
  AdjustmentResult result;
  double avg_bitrate_kbps = 0.0; //< Analysis pass (pass 1 for linear fit)
};

/**
 * @brief Write the record as JSON.
 * @return true on success, false on IO error (logged)
 */
bool save_adjustment_record(const std::string &path,
                            const AdjustmentRecord &record);

/**
 * @brief Read a record written by save_adjustment_record().
 * @return true on success, false on IO, parse or field errors (logged)
 */
bool load_adjustment_record(const std::string &path, AdjustmentRecord &record);

/// Serialize to a JSON string (pretty-printed)
std::string adjustment_record_to_json(const AdjustmentRecord &record);

/// Parse from a JSON string
bool adjustment_record_from_json(const std::string &text,
                                 AdjustmentRecord &record);

/**
 * @brief Check that a stored record matches the current run.
 *
 * @param stored Record read from disk
 * @param current Settings of this run
 * @param plan Chunk plan of this run
 * @param reason Output: user-facing mismatch description
 * @return true if the record can be reused
 */
bool validate_reuse(const AdjustmentRecord &stored,
                    const RecordParameters &current, const ChunkPlan &plan,
                    std::string &reason);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_QADJUST_RECORD_HPP
