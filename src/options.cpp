#include <string>

// Local includes
#include "textdet/config.hpp"
#include "textdet/exception.hpp"
#include "textdet/options.hpp"


namespace textdet
{

namespace
{

void check_unit_interval(const char * name, double value)
{
  // Negated comparison also rejects NaN
  if (!(value >= 0.0 && value <= 1.0)) {
    throw InvalidOptionsError(std::string(name) + " must be in [0, 1], got " +
      std::to_string(value));
  }
}

} // namespace

void DecodeOptions::validate() const
{
  if (max_side_len < 32 || max_side_len > config::MAX_SIDE_LEN) {
    throw InvalidOptionsError("max_side_len must be in [32, " +
      std::to_string(config::MAX_SIDE_LEN) + "], got " + std::to_string(max_side_len));
  }
  if (!(unclip_ratio >= 0.0)) {
    throw InvalidOptionsError("unclip_ratio must be >= 0, got " + std::to_string(unclip_ratio));
  }
  check_unit_interval("box_score_threshold", box_score_threshold);
  check_unit_interval("mask_threshold", mask_threshold);
  if (!(min_box_side >= 0.0)) {
    throw InvalidOptionsError("min_box_side must be >= 0, got " + std::to_string(min_box_side));
  }
  if (max_candidates == 0) {
    throw InvalidOptionsError("max_candidates must be positive");
  }
}

} // namespace textdet
