#include "core/PlatformRegistry.hpp"

namespace core {

// ============================================================================
// Singleton Instance
// ============================================================================

PlatformRegistry& PlatformRegistry::instance() {
    static PlatformRegistry instance;
    return instance;
}

PlatformRegistry::PlatformRegistry() : logger_(std::make_shared<common::NullLogger>()) {}

PlatformRegistry::~PlatformRegistry() {
    shutdown();
}

void PlatformRegistry::set_logger(std::shared_ptr<common::ILogger> logger) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger) logger_ = std::move(logger);
}

// ============================================================================
// Factory Registration
// ============================================================================

void PlatformRegistry::register_factory(
    std::unique_ptr<interfaces::IPlatformFactory> factory
) {
    if (!factory) return;

    std::lock_guard<std::mutex> lock(mutex_);

    logger_->debug(std::string("[Platform] Registered: ") + factory->platform_name());
    factories_.push_back(std::move(factory));
}

// ============================================================================
// Platform Access
// ============================================================================

interfaces::IPlatformFactory* PlatformRegistry::get_current_platform() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_platform_) {
        return current_platform_;
    }

    for (auto& factory : factories_) {
        if (!factory->is_current_platform()) continue;

        current_platform_ = factory.get();
        if (!initialized_) {
            current_platform_->initialize();
            initialized_ = true;
        }

        logger_->info(std::string("[Platform] Using: ") + current_platform_->platform_name() +
                      (current_platform_->is_fully_supported() ? "" : " (accessibility unsupported)"));
        return current_platform_;
    }

    logger_->warn("[Platform] No factory for current platform");
    return nullptr;
}

// ============================================================================
// Lifecycle
// ============================================================================

void PlatformRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) return;

    for (auto& factory : factories_) {
        factory->shutdown();
    }

    current_platform_ = nullptr;
    initialized_ = false;
}

} // namespace core
