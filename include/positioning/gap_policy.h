#pragma once

#include <string>

namespace positioning {

// Handling of unset values inside the selected feature prefix.
enum class GapPolicy {
  FAIL,     // raise rfpos::DataGapError
  SKIP_ROW  // leave the row out of training; no prediction for it
};

// Accepts "fail" and "skip_row" (case-insensitive). Throws rfpos::ConfigurationError.
GapPolicy ParseGapPolicy(const std::string& text);
const char* GapPolicyName(GapPolicy p);

} // namespace positioning
