#include "pagebridge/pages/update_command.hpp"

#include <nlohmann/json.hpp>

namespace pagebridge {

using json = nlohmann::json;

namespace {

struct CommandWithPosition {
    std::string target;
    std::string action;
    std::string position;
    std::string content;
};

struct CommandWithoutPosition {
    std::string target;
    std::string action;
    std::string content;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CommandWithPosition, target, action, position, content)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CommandWithoutPosition, target, action, content)

json ToWire(const UpdateCommand& c) {
    switch (ShapeFor(c.action)) {
    case CommandShape::WithoutPosition:
        return CommandWithoutPosition{
            .target = c.target,
            .action = ActionName(c.action),
            .content = c.content,
        };
    case CommandShape::WithPosition:
        break;
    }
    return CommandWithPosition{
        .target = c.target,
        .action = ActionName(c.action),
        .position = PositionName(c.position.value_or(UpdatePosition::After)),
        .content = c.content,
    };
}

std::expected<std::string, std::string> OptionalString(const json& item, const char* key) {
    if (!item.contains(key) || item[key].is_null()) return std::string{};
    if (!item[key].is_string()) {
        return std::unexpected(std::string("'") + key + "' must be a string");
    }
    return item[key].get<std::string>();
}

} // namespace

const char* ActionName(UpdateAction a) {
    switch (a) {
    case UpdateAction::Append: return "append";
    case UpdateAction::Prepend: return "prepend";
    case UpdateAction::Insert: return "insert";
    case UpdateAction::Replace: return "replace";
    case UpdateAction::Delete: return "delete";
    }
    return "replace";
}

const char* PositionName(UpdatePosition p) {
    return p == UpdatePosition::Before ? "before" : "after";
}

std::optional<UpdateAction> ParseAction(std::string_view s) {
    if (s == "append") return UpdateAction::Append;
    if (s == "prepend") return UpdateAction::Prepend;
    if (s == "insert") return UpdateAction::Insert;
    if (s == "replace") return UpdateAction::Replace;
    if (s == "delete") return UpdateAction::Delete;
    return std::nullopt;
}

std::optional<UpdatePosition> ParsePosition(std::string_view s) {
    if (s == "before") return UpdatePosition::Before;
    if (s == "after") return UpdatePosition::After;
    return std::nullopt;
}

CommandShape ShapeFor(UpdateAction a) {
    return a == UpdateAction::Append ? CommandShape::WithoutPosition : CommandShape::WithPosition;
}

std::expected<std::string, std::string> SerializeCommands(std::span<const UpdateCommand> commands) {
    try {
        json arr = json::array();
        for (const auto& c : commands) {
            arr.push_back(ToWire(c));
        }
        return arr.dump();
    } catch (const json::exception& e) {
        // dump() throws on invalid UTF-8 in targets or content.
        return std::unexpected(std::string("failed to marshal commands: ") + e.what());
    }
}

std::expected<std::vector<UpdateCommand>, std::string> ParseCommands(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_array()) {
            return std::unexpected("commands must be a JSON array");
        }

        std::vector<UpdateCommand> out;
        out.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            const auto& item = j[i];
            const std::string where = "command " + std::to_string(i) + ": ";
            if (!item.is_object()) {
                return std::unexpected(where + "must be an object");
            }

            auto target = OptionalString(item, "target");
            auto action = OptionalString(item, "action");
            auto position = OptionalString(item, "position");
            auto content = OptionalString(item, "content");
            for (const auto* f : {&target, &action, &position, &content}) {
                if (!f->has_value()) return std::unexpected(where + f->error());
            }

            if (target->empty()) return std::unexpected(where + "missing target");
            if (action->empty()) return std::unexpected(where + "missing action");

            UpdateCommand c;
            c.target = std::move(*target);
            auto a = ParseAction(*action);
            if (!a) return std::unexpected(where + "unknown action '" + *action + "'");
            c.action = *a;
            if (!position->empty()) {
                auto p = ParsePosition(*position);
                if (!p) return std::unexpected(where + "unknown position '" + *position + "'");
                c.position = *p;
            }
            c.content = std::move(*content);
            out.push_back(std::move(c));
        }
        return out;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace pagebridge
