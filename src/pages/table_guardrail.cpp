#include "pagebridge/pages/table_guardrail.hpp"

#include <array>
#include <string_view>

namespace pagebridge {

namespace {

constexpr std::array<std::string_view, 3> kTableElementPrefixes = {"td:", "th:", "tr:"};

bool IsTableElementTarget(std::string_view target) {
    for (auto prefix : kTableElementPrefixes) {
        if (target.starts_with(prefix)) return true;
    }
    return false;
}

std::string JoinTargets(const std::vector<std::string>& targets) {
    std::string out = "[";
    for (size_t i = 0; i < targets.size(); ++i) {
        if (i) out += ", ";
        out += "\"" + targets[i] + "\"";
    }
    out += "]";
    return out;
}

} // namespace

std::vector<std::string> FindTableElementTargets(std::span<const UpdateCommand> commands) {
    std::vector<std::string> out;
    for (const auto& c : commands) {
        if (IsTableElementTarget(c.target)) out.push_back(c.target);
    }
    return out;
}

Result CheckTableUpdates(std::span<const UpdateCommand> commands) {
    const auto offending = FindTableElementTargets(commands);
    if (offending.empty()) return Result::Ok();

    std::string msg =
        "TABLE UPDATE RESTRICTION: You are attempting to update individual table elements " +
        JoinTargets(offending) + ".\n\n";
    msg += "OneNote requires that tables be updated as complete units, not individual cells or rows.\n\n";
    msg += "SOLUTION: Instead of updating individual table elements, you must:\n"
           "1. Target the entire table element (table:{table-data-id})\n"
           "2. Replace the complete table HTML with your updated content\n"
           "3. Include all table structure (table, tr, td/th elements) in your replacement\n\n";
    msg += "Example of CORRECT approach:\n"
           "- Target: \"table:{table-data-id}\"\n"
           "- Action: \"replace\"\n"
           "- Content: \"<table>...complete table HTML...</table>\"\n\n";
    msg += "Example of INCORRECT approach:\n"
           "- Target: \"td:{cell-data-id}\"\n"
           "- Action: \"replace\"\n"
           "- Content: \"<td>new content</td>\"";
    return Result::Invalid(std::move(msg));
}

} // namespace pagebridge
