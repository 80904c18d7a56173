/**
 * @file qadjust_record.cpp
 * @brief JSON persistence of adjustment results
 */

#include "chunk_encode/qadjust_record.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "chunk_encode/logging.hpp"

using json = nlohmann::json;

namespace chunk_encode {

namespace {

json parameters_to_json(const RecordParameters &p) {
  json j;
  j["mode"] = static_cast<int>(p.mode);
  j["encoder"] = encoder_family_name(p.encoder);
  j["minChunkLength"] = p.min_chunk_length;
  j["keyint"] = p.keyint;
  j["baseQ"] = p.base_q;
  j["target"] = p.target;
  j["analysisPreset"] = p.analysis_preset;
  j["skip"] = p.skip;
  return j;
}

bool parameters_from_json(const json &j, RecordParameters &p) {
  int mode = j.at("mode").get<int>();
  if (mode < 1 || mode > 3) {
    LOG_ERROR("Record has unknown qadjust mode {}", mode);
    return false;
  }
  p.mode = static_cast<QAdjustMode>(mode);

  const std::string encoder = j.at("encoder").get<std::string>();
  if (!parse_encoder_family(encoder, p.encoder)) {
    LOG_ERROR("Record has unknown encoder '{}'", encoder);
    return false;
  }

  p.min_chunk_length = j.at("minChunkLength").get<int>();
  p.keyint = j.at("keyint").get<int>();
  p.base_q = j.at("baseQ").get<double>();
  p.target = j.at("target").get<double>();
  p.analysis_preset = j.value("analysisPreset", 0);
  p.skip = j.value("skip", 1);
  return true;
}

json chunk_to_json(QAdjustMode mode, const ChunkAdjustment &c) {
  json j;
  j["chunkNumber"] = c.chunk_id;
  j["length"] = c.length;
  switch (mode) {
  case QAdjustMode::Percentile:
    j["percentile5th"] = c.percentile_5th;
    break;
  case QAdjustMode::LinearFit:
    j["crfPass2"] = c.pass2_q;
    j["butteraugliPass1"] = c.score_pass1;
    j["butteraugliPass2"] = c.score_pass2;
    j["fallback"] = c.fallback;
    break;
  case QAdjustMode::ProbeCurve:
    j["score"] = c.score;
    j["luma"] = c.luma;
    j["deltaQ"] = c.delta_q;
    break;
  }
  j["adjustedQ"] = c.adjusted_q;
  return j;
}

ChunkAdjustment chunk_from_json(QAdjustMode mode, const json &j) {
  ChunkAdjustment c;
  c.chunk_id = j.at("chunkNumber").get<int>();
  c.length = j.at("length").get<int>();
  c.adjusted_q = j.at("adjustedQ").get<double>();
  switch (mode) {
  case QAdjustMode::Percentile:
    c.percentile_5th = j.value("percentile5th", 0.0);
    break;
  case QAdjustMode::LinearFit:
    c.pass2_q = j.value("crfPass2", 0.0);
    c.score_pass1 = j.value("butteraugliPass1", 0.0);
    c.score_pass2 = j.value("butteraugliPass2", 0.0);
    c.fallback = j.value("fallback", false);
    break;
  case QAdjustMode::ProbeCurve:
    c.score = j.value("score", 0.0);
    c.luma = j.value("luma", -1.0);
    c.delta_q = j.value("deltaQ", 0.0);
    break;
  }
  return c;
}

} // anonymous namespace

// **----- SERIALIZATION -----**

std::string adjustment_record_to_json(const AdjustmentRecord &record) {
  const AdjustmentResult &r = record.result;
  json root;
  root["qualityParameters"] = parameters_to_json(record.parameters);

  switch (r.mode) {
  case QAdjustMode::Percentile:
    root["averageScore"] = r.average_score;
    root["avgBitrate"] = record.avg_bitrate_kbps;
    break;
  case QAdjustMode::LinearFit:
    root["scorePass1"] = r.score_pass1;
    root["avgBitratePass1"] = record.avg_bitrate_kbps;
    break;
  case QAdjustMode::ProbeCurve: {
    root["analysisQ"] = r.analysis_q;
    json curve = json::array();
    for (const auto &p : r.curve)
      curve.push_back({{"q", p.quantizer}, {"score", p.score}});
    root["curve"] = curve;
    root["lumaMin"] = r.luma_min;
    root["lumaMax"] = r.luma_max;
    root["pq"] = r.pq;
    root["avgBitrate"] = record.avg_bitrate_kbps;
    break;
  }
  }

  root["weightedCrf"] = r.weighted_q;
  json chunks = json::array();
  for (const auto &c : r.chunks)
    chunks.push_back(chunk_to_json(r.mode, c));
  root["chunks"] = chunks;

  return root.dump(4);
}

bool adjustment_record_from_json(const std::string &text,
                                 AdjustmentRecord &record) {
  try {
    json root = json::parse(text);

    AdjustmentRecord parsed;
    if (!parameters_from_json(root.at("qualityParameters"), parsed.parameters))
      return false;

    AdjustmentResult &r = parsed.result;
    r.mode = parsed.parameters.mode;
    r.base_q = parsed.parameters.base_q;
    r.target = parsed.parameters.target;
    r.weighted_q = root.at("weightedCrf").get<double>();

    switch (r.mode) {
    case QAdjustMode::Percentile:
      r.average_score = root.value("averageScore", 0.0);
      parsed.avg_bitrate_kbps = root.value("avgBitrate", 0.0);
      break;
    case QAdjustMode::LinearFit:
      r.score_pass1 = root.value("scorePass1", 0.0);
      parsed.avg_bitrate_kbps = root.value("avgBitratePass1", 0.0);
      break;
    case QAdjustMode::ProbeCurve:
      r.analysis_q = root.at("analysisQ").get<double>();
      for (const auto &p : root.at("curve")) {
        QCurvePoint point;
        point.quantizer = p.at("q").get<double>();
        point.score = p.at("score").get<double>();
        r.curve.push_back(point);
      }
      r.luma_min = root.at("lumaMin").get<double>();
      r.luma_max = root.at("lumaMax").get<double>();
      r.pq = root.value("pq", false);
      parsed.avg_bitrate_kbps = root.value("avgBitrate", 0.0);
      break;
    }

    for (const auto &c : root.at("chunks"))
      r.chunks.push_back(chunk_from_json(r.mode, c));

    record = std::move(parsed);
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid qadjust record: {}", e.what());
    return false;
  }
}

// **----- FILE IO -----**

bool save_adjustment_record(const std::string &path,
                            const AdjustmentRecord &record) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    LOG_ERROR("Cannot write qadjust record: {}", path);
    return false;
  }
  out << adjustment_record_to_json(record) << '\n';
  if (!out) {
    LOG_ERROR("Failed writing qadjust record: {}", path);
    return false;
  }
  return true;
}

bool load_adjustment_record(const std::string &path, AdjustmentRecord &record) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Cannot open qadjust record: {}", path);
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return adjustment_record_from_json(buffer.str(), record);
}

// **----- REUSE -----**

bool validate_reuse(const AdjustmentRecord &stored,
                    const RecordParameters &current, const ChunkPlan &plan,
                    std::string &reason) {
  const RecordParameters &p = stored.parameters;

  if (p.mode != current.mode) {
    reason = fmt::format("stored qadjust mode {} differs from requested mode {}",
                         static_cast<int>(p.mode),
                         static_cast<int>(current.mode));
    return false;
  }
  if (p.encoder != current.encoder) {
    reason = fmt::format("stored encoder '{}' differs from '{}'",
                         encoder_family_name(p.encoder),
                         encoder_family_name(current.encoder));
    return false;
  }
  if (p.min_chunk_length != current.min_chunk_length) {
    reason = fmt::format(
        "stored minimum chunk length {} differs from {}, re-run the analysis",
        p.min_chunk_length, current.min_chunk_length);
    return false;
  }
  if (p.keyint != current.keyint) {
    reason = fmt::format("stored keyint {} differs from {}", p.keyint,
                         current.keyint);
    return false;
  }

  /// Chunk layout: same ids and lengths, credits excluded
  std::vector<const Chunk *> planned;
  for (const auto &c : plan.by_id)
    if (!c.is_credits)
      planned.push_back(&c);

  const auto &chunks = stored.result.chunks;
  if (planned.size() != chunks.size()) {
    reason = fmt::format("stored record has {} chunks, current plan has {}",
                         chunks.size(), planned.size());
    return false;
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].chunk_id != planned[i]->id ||
        chunks[i].length != planned[i]->length) {
      reason = fmt::format(
          "chunk {} does not match the stored layout (length {} vs {})",
          planned[i]->id, planned[i]->length, chunks[i].length);
      return false;
    }
  }
  return true;
}

} // namespace chunk_encode
