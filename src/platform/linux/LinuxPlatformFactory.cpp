#ifdef PLATFORM_LINUX

#include "LinuxPlatformFactory.hpp"

namespace platform {
namespace linux_platform {

LinuxPlatformFactory::LinuxPlatformFactory(std::shared_ptr<common::ILogger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()) {}

// ============================================================================
// Factory Method Implementations
// ============================================================================

std::unique_ptr<interfaces::IAccessibilityProvider> LinuxPlatformFactory::create_accessibility_provider() {
    return nullptr;
}

std::unique_ptr<interfaces::IElementScanner> LinuxPlatformFactory::create_element_scanner() {
    return nullptr;
}

// ============================================================================
// Lifecycle
// ============================================================================

void LinuxPlatformFactory::initialize() {
    if (initialized_) return;

    logger_->info("[LinuxPlatform] Initializing...");

    logger_->warn("[LinuxPlatform] No accessibility provider, running degraded");

    initialized_ = true;
}

void LinuxPlatformFactory::shutdown() {
    if (!initialized_) return;

    logger_->info("[LinuxPlatform] Shutting down...");
    initialized_ = false;
}

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
