#pragma once
#include "core/ICommand.hpp"
#include "core/AccessibilityService.hpp"
#include <memory>
#include <optional>
#include <string>

namespace handlers {

// ============================================================================
// AccessibilityCommandHandler - Handles accessibility commands
// ============================================================================
// Commands: fetch_ui_elements, get_accessibility_snapshot,
//           start_accessibility_polling, stop_accessibility_polling,
//           perform_typing_action, perform_named_action,
//           get_overlay_candidates, get_selection_context
//
// Arguments, where a command takes any, are one JSON object:
//   get_accessibility_snapshot {"app": "Notes", "window": "Untitled"}
//   perform_typing_action {"element_id": "1a2b3c4d", "text": "hello"}
//   perform_named_action {"element_id": "1a2b3c4d", "action": "AXPress"}
// ============================================================================

class AccessibilityCommandHandler final : public core::command::ICommandHandler {
public:
    explicit AccessibilityCommandHandler(std::shared_ptr<core::AccessibilityService> service)
        : service_(std::move(service)) {}

    bool can_handle(const std::string& cmd) const override;

    const char* category() const noexcept override { return "Accessibility"; }

    std::unique_ptr<core::command::ICommand> parse_command(
        const std::string& cmd,
        const std::string& args,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<core::AccessibilityService> service_;
};

// ============================================================================
// Concrete Accessibility Commands
// ============================================================================

class FetchUiElementsCommand final : public core::command::ICommand {
public:
    FetchUiElementsCommand(std::shared_ptr<core::AccessibilityService> service,
                           core::command::CommandContext ctx)
        : service_(std::move(service)), ctx_(std::move(ctx)) {}

    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "fetch_ui_elements"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
};

class SnapshotCommand final : public core::command::ICommand {
public:
    SnapshotCommand(std::shared_ptr<core::AccessibilityService> service,
                    core::command::CommandContext ctx,
                    std::optional<std::string> app,
                    std::optional<std::string> window)
        : service_(std::move(service)), ctx_(std::move(ctx)),
          app_(std::move(app)), window_(std::move(window)) {}

    common::EmptyResult execute() override {
        ctx_.send_data("SNAPSHOT", service_->get_accessibility_snapshot(app_, window_));
        return common::EmptyResult::success();
    }

    const char* type() const noexcept override { return "get_accessibility_snapshot"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
    std::optional<std::string> app_;
    std::optional<std::string> window_;
};

class PollingCommand final : public core::command::ICommand {
public:
    PollingCommand(std::shared_ptr<core::AccessibilityService> service,
                   core::command::CommandContext ctx,
                   bool start)
        : service_(std::move(service)), ctx_(std::move(ctx)), start_(start) {}

    common::EmptyResult execute() override {
        if (start_) {
            service_->start_accessibility_polling();
            ctx_.send_status("POLLING", "started");
        } else {
            service_->stop_accessibility_polling();
            ctx_.send_status("POLLING", "stopped");
        }
        return common::EmptyResult::success();
    }

    const char* type() const noexcept override {
        return start_ ? "start_accessibility_polling" : "stop_accessibility_polling";
    }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
    bool start_;
};

class TypingActionCommand final : public core::command::ICommand {
public:
    TypingActionCommand(std::shared_ptr<core::AccessibilityService> service,
                        core::command::CommandContext ctx,
                        std::string element_id,
                        std::string text)
        : service_(std::move(service)), ctx_(std::move(ctx)),
          element_id_(std::move(element_id)), text_(std::move(text)) {}

    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "perform_typing_action"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
    std::string element_id_;
    std::string text_;
};

class NamedActionCommand final : public core::command::ICommand {
public:
    NamedActionCommand(std::shared_ptr<core::AccessibilityService> service,
                       core::command::CommandContext ctx,
                       std::string element_id,
                       std::string action_name)
        : service_(std::move(service)), ctx_(std::move(ctx)),
          element_id_(std::move(element_id)), action_name_(std::move(action_name)) {}

    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "perform_named_action"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
    std::string element_id_;
    std::string action_name_;
};

class OverlayQueryCommand final : public core::command::ICommand {
public:
    OverlayQueryCommand(std::shared_ptr<core::AccessibilityService> service,
                        core::command::CommandContext ctx)
        : service_(std::move(service)), ctx_(std::move(ctx)) {}

    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "get_overlay_candidates"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
};

class ContextQueryCommand final : public core::command::ICommand {
public:
    ContextQueryCommand(std::shared_ptr<core::AccessibilityService> service,
                        core::command::CommandContext ctx)
        : service_(std::move(service)), ctx_(std::move(ctx)) {}

    common::EmptyResult execute() override {
        auto context = service_->get_selection_context();
        std::string app;
        if (context && context->app_element.owning_application) {
            app = *context->app_element.owning_application;
        }
        ctx_.send_data("CONTEXT", app);
        return common::EmptyResult::success();
    }

    const char* type() const noexcept override { return "get_selection_context"; }

private:
    std::shared_ptr<core::AccessibilityService> service_;
    core::command::CommandContext ctx_;
};

} // namespace handlers
