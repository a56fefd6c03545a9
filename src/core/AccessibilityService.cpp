#include "core/AccessibilityService.hpp"

namespace core {

AccessibilityService::AccessibilityService(
    std::shared_ptr<interfaces::IAccessibilityProvider> provider,
    std::shared_ptr<interfaces::IElementScanner> scanner,
    ServiceOptions options,
    std::shared_ptr<common::ILogger> logger
) : logger_(std::move(logger)),
    scanner_(std::move(scanner)),
    pool_(std::make_shared<ThreadPool>(options.native_workers)),
    context_(std::make_shared<AccessibilityContext>()),
    bridge_(std::make_shared<HierarchyBridge>(provider, pool_, logger_)),
    actions_(provider, logger_),
    polling_(std::make_unique<PollingSession>(bridge_, context_, options.polling, logger_)) {
    if (!provider) {
        logger_->warn("[AccessibilityService] No accessibility provider on this platform");
    }
}

AccessibilityService::~AccessibilityService() {
    // Worker must be gone before the pool it submits to
    polling_.reset();
    pool_->shutdown();
}

std::vector<common::UIElementSummary> AccessibilityService::fetch_ui_elements() {
    if (!scanner_) {
        logger_->warn("[AccessibilityService] fetch_ui_elements is only supported on macOS. "
                      "Returning an empty list.");
        return {};
    }
    auto elements = scanner_->scan_focused_window();
    logger_->info("[AccessibilityService] Total UI elements found: " + std::to_string(elements.size()));
    return elements;
}

std::string AccessibilityService::get_accessibility_snapshot(
    const std::optional<std::string>& app,
    const std::optional<std::string>& window
) {
    return bridge_->fetch(app, window);
}

void AccessibilityService::start_accessibility_polling() {
    auto result = polling_->start();
    if (result.is_err()) {
        logger_->error("[AccessibilityService] Could not start polling: " + result.error().message);
    }
}

void AccessibilityService::stop_accessibility_polling() {
    polling_->stop();
}

common::Result<std::string> AccessibilityService::perform_typing_action(
    const std::string& element_id,
    const std::string& text
) {
    return actions_.type_text(element_id, text);
}

common::EmptyResult AccessibilityService::perform_named_action(
    const std::string& element_id,
    const std::string& action_name
) {
    return actions_.invoke_named_action(element_id, action_name);
}

std::vector<common::OverlayCandidate> AccessibilityService::get_overlay_candidates() const {
    return context_->overlays.current();
}

std::optional<common::SelectionContext> AccessibilityService::get_selection_context() const {
    return context_->selection.read();
}

} // namespace core
