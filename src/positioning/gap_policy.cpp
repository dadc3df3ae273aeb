#include "positioning/gap_policy.h"

#include "common/errors.h"

#include <algorithm>
#include <cctype>

namespace positioning {

GapPolicy ParseGapPolicy(const std::string& text) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "fail") return GapPolicy::FAIL;
  if (s == "skip_row") return GapPolicy::SKIP_ROW;
  throw rfpos::ConfigurationError("Unknown gap policy: '" + text + "' (expected fail|skip_row)");
}

const char* GapPolicyName(GapPolicy p) {
  switch (p) {
    case GapPolicy::FAIL: return "fail";
    case GapPolicy::SKIP_ROW: return "skip_row";
  }
  return "fail";
}

} // namespace positioning
