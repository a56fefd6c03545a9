#pragma once
#include <memory>
#include <string>
#include "interfaces/IAccessibilityProvider.hpp"
#include "interfaces/IElementScanner.hpp"

namespace interfaces {

// ============================================================================
// IPlatformFactory - Abstract Factory for platform-specific components
// ============================================================================
// Each platform provides its own implementation. A platform without an
// accessibility hierarchy returns nullptr from the factory methods and the
// service degrades every command to ProviderUnavailable.
//
// Usage:
//   auto* factory = PlatformRegistry::instance().get_current_platform();
//   auto provider = factory->create_accessibility_provider();
// ============================================================================

class IPlatformFactory {
public:
    virtual ~IPlatformFactory() = default;

    // ========== Component Factory Methods ==========

    // Native hierarchy/action provider
    // May return nullptr if not supported on this platform
    virtual std::unique_ptr<IAccessibilityProvider> create_accessibility_provider() = 0;

    // Direct focused-window scanner used by fetch_ui_elements
    // May return nullptr if not supported on this platform
    virtual std::unique_ptr<IElementScanner> create_element_scanner() = 0;

    // ========== Platform Info ==========

    // Platform name for logging/debugging (e.g., "macOS", "Linux")
    virtual const char* platform_name() const noexcept = 0;

    // Check if this platform is currently the running platform
    virtual bool is_current_platform() const noexcept = 0;

    // False when the factory cannot produce a provider
    virtual bool is_fully_supported() const noexcept { return true; }

    // ========== Optional: Lazy Initialization ==========

    // Called once before first use (e.g. permission prompt)
    virtual void initialize() {}

    virtual void shutdown() {}
};

// ============================================================================
// Helper: Platform Detection Macros
// ============================================================================

#if defined(__APPLE__)
    #define PLATFORM_IS_LINUX 0
    #define PLATFORM_IS_MACOS 1
#elif defined(__linux__)
    #define PLATFORM_IS_LINUX 1
    #define PLATFORM_IS_MACOS 0
#else
    #define PLATFORM_IS_LINUX 0
    #define PLATFORM_IS_MACOS 0
#endif

} // namespace interfaces
