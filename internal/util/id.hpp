#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tending::util {

/*
  Record id helpers.

  Ids look like "<prefix>_<unix ms>_<5 base-36 chars>", e.g.
  "chore_1718000000000_k3x9a". Imported ids are never regenerated and may
  have any shape.
*/

inline constexpr std::string_view kTenderIdPrefix  = "c";
inline constexpr std::string_view kChoreIdPrefix   = "chore";
inline constexpr std::string_view kHistoryIdPrefix = "h";

std::string GenerateId(std::string_view prefix, int64_t now_ms);

// Strips leading and trailing ASCII whitespace.
std::string Trim(std::string_view value);

} // namespace tending::util
