#pragma once

#include <string_view>

namespace rdsync::util {

/*
  Dotted SDK version comparison ("17.1.0" vs "17.10").

  Missing components count as zero, non-numeric suffixes ("-beta") are
  ignored. Returns <0, 0 or >0 like strcmp.
*/
int CompareVersions(std::string_view lhs, std::string_view rhs);

// True when `required` is empty or not newer than `running`.
bool IsVersionSatisfied(std::string_view required, std::string_view running);

} // namespace rdsync::util
