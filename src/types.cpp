/**
 * @file types.cpp
 * @brief Name tables for the core enums
 */

#include "chunk_encode/types.hpp"

namespace chunk_encode {

const char *encoder_family_name(EncoderFamily family) {
  switch (family) {
  case EncoderFamily::Svt:
    return "svt";
  case EncoderFamily::X265:
    return "x265";
  case EncoderFamily::Aom:
    return "aom";
  case EncoderFamily::Rav1e:
    return "rav1e";
  }
  return "unknown";
}

bool parse_encoder_family(const std::string &name, EncoderFamily &family) {
  if (name == "svt") {
    family = EncoderFamily::Svt;
  } else if (name == "x265") {
    family = EncoderFamily::X265;
  } else if (name == "aom") {
    family = EncoderFamily::Aom;
  } else if (name == "rav1e") {
    family = EncoderFamily::Rav1e;
  } else {
    return false;
  }
  return true;
}

const char *qadjust_mode_name(QAdjustMode mode) {
  switch (mode) {
  case QAdjustMode::Percentile:
    return "percentile";
  case QAdjustMode::LinearFit:
    return "linear-fit";
  case QAdjustMode::ProbeCurve:
    return "probe-curve";
  }
  return "unknown";
}

} // namespace chunk_encode
