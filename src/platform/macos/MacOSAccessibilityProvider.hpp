#pragma once
#include "interfaces/IAccessibilityProvider.hpp"

#ifdef PLATFORM_MACOS

namespace platform {
namespace macos {

/**
 * macOS accessibility provider
 *
 * Forwards to the C entry points exported by the ui_monitor library
 * (get_accessibility_hierarchy*, perform_type_action,
 * perform_named_action). Result buffers are strdup-allocated there and
 * released here with free().
 *
 * REQUIRES: Accessibility permission in System Settings
 *           Privacy & Security → Accessibility
 */
class MacOSAccessibilityProvider final : public interfaces::IAccessibilityProvider {
public:
    char* get_hierarchy() override;
    char* get_hierarchy_filtered(const char* app_name, const char* window_title) override;
    char* perform_type_action(const char* element_id, const char* text) override;
    char* perform_named_action(const char* element_id, const char* action_name) override;
    void release(char* buffer) noexcept override;
};

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
