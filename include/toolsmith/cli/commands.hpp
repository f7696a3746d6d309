#pragma once

#include "toolsmith/security/approval.hpp"

#include <string>
#include <vector>

namespace toolsmith::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

/// One line per proposal: name, risk, sender, arrival time and, when the
/// sender gave one, the description.
[[nodiscard]] std::string format_pending(const std::vector<security::PendingProposal> &pending);

} // namespace toolsmith::cli
