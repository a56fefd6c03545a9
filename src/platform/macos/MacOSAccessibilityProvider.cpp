#ifdef PLATFORM_MACOS

#include "MacOSAccessibilityProvider.hpp"
#include <cstdlib>

// Exported by ui_monitor (C ABI)
extern "C" {
    char* get_accessibility_hierarchy(void);
    char* get_accessibility_hierarchy_filtered(const char* app_name, const char* window_title);
    char* perform_type_action(const char* element_id, const char* text);
    char* perform_named_action(const char* element_id, const char* action_name);
}

namespace platform {
namespace macos {

char* MacOSAccessibilityProvider::get_hierarchy() {
    return ::get_accessibility_hierarchy();
}

char* MacOSAccessibilityProvider::get_hierarchy_filtered(const char* app_name, const char* window_title) {
    return ::get_accessibility_hierarchy_filtered(app_name, window_title);
}

char* MacOSAccessibilityProvider::perform_type_action(const char* element_id, const char* text) {
    return ::perform_type_action(element_id, text);
}

char* MacOSAccessibilityProvider::perform_named_action(const char* element_id, const char* action_name) {
    return ::perform_named_action(element_id, action_name);
}

void MacOSAccessibilityProvider::release(char* buffer) noexcept {
    std::free(buffer);
}

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
