#pragma once
#include <memory>
#include <optional>
#include <string>
#include "common/Logger.hpp"
#include "core/ThreadPool.hpp"
#include "interfaces/IAccessibilityProvider.hpp"

namespace core {

// ============================================================================
// HierarchyBridge - snapshot requests to the native provider
// ============================================================================
// fetch() never fails with an exception or error type. Every failure path
// degrades to a structured payload {"error": "..."} that the decoder
// recognises, so callers always decode the result:
//
//   provider missing      -> "This feature is only available on macOS"
//   native returned null  -> "Failed to get accessibility hierarchy"
//   worker task failed    -> "Failed to execute task"
//   filter with NUL byte  -> "Invalid filter: embedded NUL byte"
//
// The native call runs on a pool worker; fetch() blocks until it returns.
// There is no timeout.
// ============================================================================

class HierarchyBridge {
public:
    // `provider` may be null on platforms without accessibility support
    HierarchyBridge(std::shared_ptr<interfaces::IAccessibilityProvider> provider,
                    std::shared_ptr<ThreadPool> pool,
                    std::shared_ptr<common::ILogger> logger);

    std::string fetch(const std::optional<std::string>& app_filter,
                      const std::optional<std::string>& window_filter) const;

    bool is_available() const { return provider_ != nullptr; }

    static std::string error_payload(const std::string& message);

private:
    std::string fetch_blocking(const std::optional<std::string>& app_filter,
                               const std::optional<std::string>& window_filter) const;

    std::shared_ptr<interfaces::IAccessibilityProvider> provider_;
    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<common::ILogger> logger_;
};

} // namespace core
