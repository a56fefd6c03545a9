#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/ElementTypes.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/AccessibilityContext.hpp"
#include "core/ActionDispatcher.hpp"
#include "core/HierarchyBridge.hpp"
#include "core/PollingSession.hpp"
#include "core/ThreadPool.hpp"
#include "interfaces/IAccessibilityProvider.hpp"
#include "interfaces/IElementScanner.hpp"

namespace core {

struct ServiceOptions {
    PollingOptions polling;
    size_t native_workers = 2;
};

// ============================================================================
// AccessibilityService - command surface exposed to the hosting shell
// ============================================================================
// Owns the native-call pool, the shared context and the polling session.
// Provider and scanner may be null (unsupported platform): snapshot and
// action calls then report "only available on macOS" and fetch_ui_elements
// returns an empty list.
// ============================================================================

class AccessibilityService {
public:
    AccessibilityService(
        std::shared_ptr<interfaces::IAccessibilityProvider> provider,
        std::shared_ptr<interfaces::IElementScanner> scanner,
        ServiceOptions options,
        std::shared_ptr<common::ILogger> logger
    );
    ~AccessibilityService();

    std::vector<common::UIElementSummary> fetch_ui_elements();

    // Raw tree payload or {"error": "..."}
    std::string get_accessibility_snapshot(const std::optional<std::string>& app,
                                           const std::optional<std::string>& window);

    void start_accessibility_polling();
    void stop_accessibility_polling();

    common::Result<std::string> perform_typing_action(const std::string& element_id,
                                                      const std::string& text);
    common::EmptyResult perform_named_action(const std::string& element_id,
                                             const std::string& action_name);

    std::vector<common::OverlayCandidate> get_overlay_candidates() const;
    std::optional<common::SelectionContext> get_selection_context() const;

    PollingSession& polling() { return *polling_; }

private:
    std::shared_ptr<common::ILogger> logger_;
    std::shared_ptr<interfaces::IElementScanner> scanner_;
    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<AccessibilityContext> context_;
    std::shared_ptr<HierarchyBridge> bridge_;
    ActionDispatcher actions_;
    std::unique_ptr<PollingSession> polling_;
};

} // namespace core
