#pragma once

#include "toolsmith/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolsmith::security {

/// Ordered: a higher value is riskier.
enum class RiskLevel { Safe = 0, LowRisk = 1, MediumRisk = 2, HighRisk = 3 };

[[nodiscard]] std::string risk_level_to_string(RiskLevel level);
[[nodiscard]] common::Result<RiskLevel> risk_level_from_string(const std::string &value);

/// Risk of a capability name in the known set, or nullopt when the name is not
/// a known capability.
[[nodiscard]] std::optional<RiskLevel> known_capability_risk(std::string_view name);

struct CapabilityReference {
  std::string name;
  RiskLevel level = RiskLevel::HighRisk;
  int line = 0;
  int column = 0;
};

struct Classification {
  RiskLevel level = RiskLevel::Safe;
  std::vector<CapabilityReference> references;
  /// Set when the source could not be scanned (classified HighRisk).
  std::string error;
};

/// Lexical scan of Lua tool source for capability references. The result is
/// the highest level referenced: known capabilities (as names or exact string
/// literals) map to their fixed level; any other call of a name that is not a
/// sandbox global and not bound in the source (function, parameter, local, loop
/// variable) is HighRisk. Names assembled at run time are not seen.
[[nodiscard]] Classification classify_detailed(const std::string &source);
[[nodiscard]] RiskLevel classify(const std::string &source);

} // namespace toolsmith::security
