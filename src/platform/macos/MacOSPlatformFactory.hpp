#pragma once
#include "interfaces/IPlatformFactory.hpp"
#include "common/Logger.hpp"

#ifdef PLATFORM_MACOS

namespace platform {
namespace macos {

/**
 * macOS Platform Factory
 *
 * Creates the ui_monitor-backed provider and the AX focused-window scanner
 */
class MacOSPlatformFactory : public interfaces::IPlatformFactory {
public:
    explicit MacOSPlatformFactory(std::shared_ptr<common::ILogger> logger = nullptr);
    ~MacOSPlatformFactory() override = default;

    // Factory Methods
    std::unique_ptr<interfaces::IAccessibilityProvider> create_accessibility_provider() override;
    std::unique_ptr<interfaces::IElementScanner> create_element_scanner() override;

    // Platform Info
    const char* platform_name() const noexcept override { return "macOS"; }
    bool is_current_platform() const noexcept override { return PLATFORM_IS_MACOS; }
    bool is_fully_supported() const noexcept override { return true; }

    // Lifecycle
    void initialize() override;
    void shutdown() override;

private:
    std::shared_ptr<common::ILogger> logger_;
    bool initialized_ = false;
};

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
