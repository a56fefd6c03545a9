#include "core/HierarchyBridge.hpp"
#include "core/NativeString.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace core {

HierarchyBridge::HierarchyBridge(
    std::shared_ptr<interfaces::IAccessibilityProvider> provider,
    std::shared_ptr<ThreadPool> pool,
    std::shared_ptr<common::ILogger> logger
) : provider_(std::move(provider)), pool_(std::move(pool)), logger_(std::move(logger)) {}

std::string HierarchyBridge::error_payload(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump();
}

std::string HierarchyBridge::fetch(
    const std::optional<std::string>& app_filter,
    const std::optional<std::string>& window_filter
) const {
    if (!provider_) {
        return error_payload("This feature is only available on macOS");
    }

    auto pending = pool_->submit([this, app_filter, window_filter]() {
        return fetch_blocking(app_filter, window_filter);
    });

    try {
        return pending.get();
    } catch (const std::exception& e) {
        logger_->error(std::string("[HierarchyBridge] Snapshot task failed: ") + e.what());
        return error_payload("Failed to execute task");
    }
}

std::string HierarchyBridge::fetch_blocking(
    const std::optional<std::string>& app_filter,
    const std::optional<std::string>& window_filter
) const {
    if ((app_filter && has_embedded_nul(*app_filter)) ||
        (window_filter && has_embedded_nul(*window_filter))) {
        return error_payload("Invalid filter: embedded NUL byte");
    }

    auto start = std::chrono::steady_clock::now();

    char* raw = nullptr;
    if (!app_filter && !window_filter) {
        raw = provider_->get_hierarchy();
    } else {
        raw = provider_->get_hierarchy_filtered(
            app_filter ? app_filter->c_str() : nullptr,
            window_filter ? window_filter->c_str() : nullptr);
    }
    NativeString payload(*provider_, raw);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->debug("[HierarchyBridge] Provider call took " + std::to_string(elapsed) + "ms");

    if (payload.is_null()) {
        return error_payload("Failed to get accessibility hierarchy");
    }
    return payload.str();
}

} // namespace core
