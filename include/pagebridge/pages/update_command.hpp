#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pagebridge {

enum class UpdateAction {
    Append,
    Prepend,
    Insert,
    Replace,
    Delete,
};

enum class UpdatePosition {
    Before,
    After,
};

const char* ActionName(UpdateAction a);
const char* PositionName(UpdatePosition p);
std::optional<UpdateAction> ParseAction(std::string_view s);
std::optional<UpdatePosition> ParsePosition(std::string_view s);

// One entry of the PATCH commands array. `target` is "body", "title", a
// generated element id, or a scoped selector such as "table:{data-id}".
struct UpdateCommand {
    std::string target;
    UpdateAction action = UpdateAction::Replace;
    std::optional<UpdatePosition> position;
    std::string content;
};

// The service rejects append commands that carry a position, so append is
// serialized without one. Every other action carries a position, "after"
// when the caller gave none.
enum class CommandShape {
    WithPosition,
    WithoutPosition,
};

CommandShape ShapeFor(UpdateAction a);

// JSON array text for the multipart "commands" part.
std::expected<std::string, std::string> SerializeCommands(std::span<const UpdateCommand> commands);

// Reads a JSON array of {target, action, position?, content?} objects.
std::expected<std::vector<UpdateCommand>, std::string> ParseCommands(const std::string& json_input);

} // namespace pagebridge
