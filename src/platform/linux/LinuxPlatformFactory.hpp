#pragma once
#include "interfaces/IPlatformFactory.hpp"
#include "common/Logger.hpp"

#ifdef PLATFORM_LINUX

namespace platform {
namespace linux_platform {

// ============================================================================
// LinuxPlatformFactory - Factory for Linux platform components
// ============================================================================
// There is no accessibility hierarchy provider on Linux. Both factory
// methods return nullptr; the service answers hierarchy requests with the
// "only available on macOS" payload and actions with ProviderUnavailable.
// ============================================================================

class LinuxPlatformFactory final : public interfaces::IPlatformFactory {
public:
    explicit LinuxPlatformFactory(std::shared_ptr<common::ILogger> logger = nullptr);
    ~LinuxPlatformFactory() override = default;

    // ========== IPlatformFactory Implementation ==========

    std::unique_ptr<interfaces::IAccessibilityProvider> create_accessibility_provider() override;
    std::unique_ptr<interfaces::IElementScanner> create_element_scanner() override;

    const char* platform_name() const noexcept override { return "Linux"; }

    bool is_current_platform() const noexcept override {
        return PLATFORM_IS_LINUX;
    }

    bool is_fully_supported() const noexcept override { return false; }

    void initialize() override;
    void shutdown() override;

private:
    std::shared_ptr<common::ILogger> logger_;
    bool initialized_ = false;
};

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
