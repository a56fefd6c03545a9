#ifdef PLATFORM_MACOS

#include "MacOSPlatformFactory.hpp"
#include "MacOSAccessibilityProvider.hpp"
#include "MacOSElementScanner.hpp"
#include <ApplicationServices/ApplicationServices.h>

namespace platform {
namespace macos {

MacOSPlatformFactory::MacOSPlatformFactory(std::shared_ptr<common::ILogger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()) {}

// ============================================================================
// Factory Method Implementations
// ============================================================================

std::unique_ptr<interfaces::IAccessibilityProvider> MacOSPlatformFactory::create_accessibility_provider() {
    return std::make_unique<MacOSAccessibilityProvider>();
}

std::unique_ptr<interfaces::IElementScanner> MacOSPlatformFactory::create_element_scanner() {
    return std::make_unique<MacOSElementScanner>(logger_);
}

// ============================================================================
// Lifecycle
// ============================================================================

void MacOSPlatformFactory::initialize() {
    if (initialized_) return;

    logger_->info("[MacOSPlatform] Initializing...");

    // Shows the system prompt once if the process is not yet trusted
    const void* keys[] = { kAXTrustedCheckOptionPrompt };
    const void* values[] = { kCFBooleanTrue };
    CFDictionaryRef options = CFDictionaryCreate(
        kCFAllocatorDefault, keys, values, 1,
        &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);

    bool trusted = AXIsProcessTrustedWithOptions(options);
    if (options) CFRelease(options);

    if (trusted) {
        logger_->info("[MacOSPlatform] Accessibility permission granted");
    } else {
        logger_->warn("[MacOSPlatform] Accessibility permission missing. "
                      "Grant it in System Settings > Privacy & Security > Accessibility");
    }

    initialized_ = true;
}

void MacOSPlatformFactory::shutdown() {
    if (!initialized_) return;

    logger_->info("[MacOSPlatform] Shutting down...");
    initialized_ = false;
}

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
