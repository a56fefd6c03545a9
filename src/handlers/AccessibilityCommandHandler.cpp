#include "handlers/AccessibilityCommandHandler.hpp"
#include <nlohmann/json.hpp>
#include <set>

using json = nlohmann::json;

namespace handlers {

namespace {

const std::set<std::string> kCommands = {
    "fetch_ui_elements",
    "get_accessibility_snapshot",
    "start_accessibility_polling",
    "stop_accessibility_polling",
    "perform_typing_action",
    "perform_named_action",
    "get_overlay_candidates",
    "get_selection_context",
};

// Empty args parse as an empty object
std::optional<json> parse_args(const std::string& args) {
    if (args.empty()) return json::object();
    json parsed = json::parse(args, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

std::optional<std::string> string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

bool AccessibilityCommandHandler::can_handle(const std::string& cmd) const {
    return kCommands.count(cmd) > 0;
}

std::unique_ptr<core::command::ICommand> AccessibilityCommandHandler::parse_command(
    const std::string& cmd,
    const std::string& args,
    const core::command::CommandContext& ctx
) {
    if (cmd == "fetch_ui_elements") {
        return std::make_unique<FetchUiElementsCommand>(service_, ctx);
    }
    if (cmd == "start_accessibility_polling") {
        return std::make_unique<PollingCommand>(service_, ctx, true);
    }
    if (cmd == "stop_accessibility_polling") {
        return std::make_unique<PollingCommand>(service_, ctx, false);
    }
    if (cmd == "get_overlay_candidates") {
        return std::make_unique<OverlayQueryCommand>(service_, ctx);
    }
    if (cmd == "get_selection_context") {
        return std::make_unique<ContextQueryCommand>(service_, ctx);
    }

    auto parsed = parse_args(args);

    if (cmd == "get_accessibility_snapshot") {
        if (!parsed) {
            ctx.send_error("SNAPSHOT", "arguments must be a JSON object");
            return nullptr;
        }
        return std::make_unique<SnapshotCommand>(
            service_, ctx, string_field(*parsed, "app"), string_field(*parsed, "window"));
    }

    if (cmd == "perform_typing_action") {
        std::optional<std::string> id, text;
        if (parsed) {
            id = string_field(*parsed, "element_id");
            text = string_field(*parsed, "text");
        }
        if (!id || !text) {
            ctx.send_error("TYPING", "expected {\"element_id\": string, \"text\": string}");
            return nullptr;
        }
        return std::make_unique<TypingActionCommand>(service_, ctx, *id, *text);
    }

    if (cmd == "perform_named_action") {
        std::optional<std::string> id, action;
        if (parsed) {
            id = string_field(*parsed, "element_id");
            action = string_field(*parsed, "action");
        }
        if (!id || !action) {
            ctx.send_error("ACTION", "expected {\"element_id\": string, \"action\": string}");
            return nullptr;
        }
        return std::make_unique<NamedActionCommand>(service_, ctx, *id, *action);
    }

    return nullptr;
}

common::EmptyResult FetchUiElementsCommand::execute() {
    json list = json::array();
    for (const auto& e : service_->fetch_ui_elements()) {
        list.push_back(json::object({
            {"role", e.role},
            {"label", e.label},
            {"value", e.value},
            {"x", e.x},
            {"y", e.y},
        }));
    }
    ctx_.send_data("UI_ELEMENTS", list.dump());
    return common::EmptyResult::success();
}

common::EmptyResult TypingActionCommand::execute() {
    auto result = service_->perform_typing_action(element_id_, text_);
    if (result.is_err()) {
        ctx_.send_error("TYPING", result.error().message);
        return common::EmptyResult::err(result.error());
    }
    ctx_.send_data("TYPING", result.unwrap());
    return common::EmptyResult::success();
}

common::EmptyResult NamedActionCommand::execute() {
    auto result = service_->perform_named_action(element_id_, action_name_);
    if (result.is_err()) {
        ctx_.send_error("ACTION", result.error().message);
        return result;
    }
    ctx_.send_status("ACTION", "ok");
    return result;
}

common::EmptyResult OverlayQueryCommand::execute() {
    json list = json::array();
    for (const auto& c : service_->get_overlay_candidates()) {
        list.push_back(json::object({
            {"label", c.label},
            {"bounds", json::array({c.bounds.x, c.bounds.y, c.bounds.width, c.bounds.height})},
        }));
    }
    ctx_.send_data("OVERLAYS", list.dump());
    return common::EmptyResult::success();
}

} // namespace handlers
