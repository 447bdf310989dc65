#pragma once

#include "pagebridge/pages/update_command.hpp"
#include "pagebridge/util/result.hpp"

#include <span>
#include <string>
#include <vector>

namespace pagebridge {

// Targets that address a single cell, header cell, or row.
std::vector<std::string> FindTableElementTargets(std::span<const UpdateCommand> commands);

// Tables can only be replaced as a whole. Fails with a Validation error that
// names every offending target and shows the whole-table replacement.
Result CheckTableUpdates(std::span<const UpdateCommand> commands);

} // namespace pagebridge
