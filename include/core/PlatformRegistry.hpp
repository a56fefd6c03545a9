#pragma once
#include <memory>
#include <vector>
#include <string>
#include <mutex>
#include "common/Logger.hpp"
#include "interfaces/IPlatformFactory.hpp"

namespace core {

// ============================================================================
// PlatformRegistry - Singleton registry for platform factories
// ============================================================================
// Usage:
//   // At startup (in main.cpp):
//   #ifdef PLATFORM_MACOS
//   PlatformRegistry::instance().register_factory(
//       std::make_unique<platform::macos::MacOSPlatformFactory>());
//   #endif
//
//   auto* factory = PlatformRegistry::instance().get_current_platform();
//   auto provider = factory ? factory->create_accessibility_provider() : nullptr;
// ============================================================================

class PlatformRegistry {
public:
    static PlatformRegistry& instance();

    PlatformRegistry(const PlatformRegistry&) = delete;
    PlatformRegistry& operator=(const PlatformRegistry&) = delete;

    // Defaults to a NullLogger until set
    void set_logger(std::shared_ptr<common::ILogger> logger);

    void register_factory(std::unique_ptr<interfaces::IPlatformFactory> factory);

    // Factory for the running platform, initialized on first access.
    // Returns nullptr if no matching factory is registered.
    interfaces::IPlatformFactory* get_current_platform();

    // Shutdown all platforms and release resources
    void shutdown();

private:
    PlatformRegistry();
    ~PlatformRegistry();

    mutable std::mutex mutex_;
    std::shared_ptr<common::ILogger> logger_;
    std::vector<std::unique_ptr<interfaces::IPlatformFactory>> factories_;
    interfaces::IPlatformFactory* current_platform_ = nullptr;
    bool initialized_ = false;
};

} // namespace core
