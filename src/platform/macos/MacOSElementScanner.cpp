#ifdef PLATFORM_MACOS

#include "MacOSElementScanner.hpp"
#include <ApplicationServices/ApplicationServices.h>
#include <CoreFoundation/CoreFoundation.h>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace platform {
namespace macos {

namespace {

// ============================================================================
// CoreFoundation ownership helpers
// ============================================================================

struct CFReleaser {
    void operator()(const void* ref) const noexcept {
        if (ref) CFRelease(ref);
    }
};

using ScopedCF = std::unique_ptr<const void, CFReleaser>;

constexpr int kMaxScanDepth = 64;

const char* const kScannedRoles[] = {
    "AXButton", "AXSlider", "AXTextField", "AXCheckBox"
};

// Copy rule: caller owns the returned reference
ScopedCF copy_attribute(AXUIElementRef element, CFStringRef attribute) {
    CFTypeRef value = nullptr;
    if (AXUIElementCopyAttributeValue(element, attribute, &value) != kAXErrorSuccess) {
        return ScopedCF();
    }
    return ScopedCF(value);
}

std::string to_std_string(CFTypeRef ref) {
    if (!ref || CFGetTypeID(ref) != CFStringGetTypeID()) return std::string();

    auto str = static_cast<CFStringRef>(ref);
    if (const char* fast = CFStringGetCStringPtr(str, kCFStringEncodingUTF8)) {
        return std::string(fast);
    }

    CFIndex length = CFStringGetLength(str);
    CFIndex max_size = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;
    std::vector<char> buffer(static_cast<size_t>(max_size));
    if (!CFStringGetCString(str, buffer.data(), max_size, kCFStringEncodingUTF8)) {
        return std::string();
    }
    return std::string(buffer.data());
}

// AXValue is reported as a string, number or boolean depending on role
std::string value_to_string(CFTypeRef ref) {
    if (!ref) return std::string();

    CFTypeID type = CFGetTypeID(ref);
    if (type == CFStringGetTypeID()) {
        return to_std_string(ref);
    }
    if (type == CFNumberGetTypeID()) {
        double number = 0.0;
        if (CFNumberGetValue(static_cast<CFNumberRef>(ref), kCFNumberDoubleType, &number)) {
            char buf[64];
            snprintf(buf, sizeof(buf), "%g", number);
            return buf;
        }
        return std::string();
    }
    if (type == CFBooleanGetTypeID()) {
        return CFBooleanGetValue(static_cast<CFBooleanRef>(ref)) ? "true" : "false";
    }
    return std::string();
}

bool is_scanned_role(const std::string& role) {
    for (const char* candidate : kScannedRoles) {
        if (role == candidate) return true;
    }
    return false;
}

bool read_position(AXUIElementRef element, CGPoint& out) {
    ScopedCF value = copy_attribute(element, kAXPositionAttribute);
    if (!value || CFGetTypeID(value.get()) != AXValueGetTypeID()) return false;

    auto ax_value = static_cast<AXValueRef>(value.get());
    if (AXValueGetType(ax_value) != kAXValueTypeCGPoint) return false;
    return AXValueGetValue(ax_value, kAXValueTypeCGPoint, &out);
}

std::string read_label(AXUIElementRef element) {
    std::string label = to_std_string(copy_attribute(element, kAXTitleAttribute).get());
    if (!label.empty()) return label;

    label = to_std_string(copy_attribute(element, CFSTR("AXLabel")).get());
    if (!label.empty()) return label;

    return to_std_string(copy_attribute(element, kAXDescriptionAttribute).get());
}

void collect(AXUIElementRef element, int depth,
             std::vector<common::UIElementSummary>& out) {
    if (depth > kMaxScanDepth) return;

    std::string role = to_std_string(copy_attribute(element, kAXRoleAttribute).get());
    if (is_scanned_role(role)) {
        CGPoint position;
        if (read_position(element, position)) {
            common::UIElementSummary summary;
            summary.role = role;
            summary.label = read_label(element);
            summary.value = value_to_string(copy_attribute(element, kAXValueAttribute).get());
            summary.x = position.x;
            summary.y = position.y;
            out.push_back(std::move(summary));
        }
    }

    ScopedCF children = copy_attribute(element, kAXChildrenAttribute);
    if (!children || CFGetTypeID(children.get()) != CFArrayGetTypeID()) return;

    auto array = static_cast<CFArrayRef>(children.get());
    CFIndex count = CFArrayGetCount(array);
    for (CFIndex i = 0; i < count; ++i) {
        auto child = static_cast<AXUIElementRef>(
            const_cast<void*>(CFArrayGetValueAtIndex(array, i)));
        if (child) collect(child, depth + 1, out);
    }
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

MacOSElementScanner::MacOSElementScanner(std::shared_ptr<common::ILogger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()) {}

// ============================================================================
// Scan
// ============================================================================

std::vector<common::UIElementSummary> MacOSElementScanner::scan_focused_window() {
    std::vector<common::UIElementSummary> elements;

    if (!AXIsProcessTrusted()) {
        logger_->warn("[MacOSScanner] Accessibility permission not granted");
        return elements;
    }

    ScopedCF system_wide(AXUIElementCreateSystemWide());
    if (!system_wide) {
        logger_->error("[MacOSScanner] Failed to create system-wide element");
        return elements;
    }
    auto system_ref = static_cast<AXUIElementRef>(const_cast<void*>(system_wide.get()));

    // Focused window of the focused app, else everything reachable system-wide
    ScopedCF focused_app = copy_attribute(system_ref, kAXFocusedApplicationAttribute);
    ScopedCF focused_window;
    if (focused_app) {
        focused_window = copy_attribute(
            static_cast<AXUIElementRef>(const_cast<void*>(focused_app.get())),
            kAXFocusedWindowAttribute);
    }

    AXUIElementRef start = focused_window
        ? static_cast<AXUIElementRef>(const_cast<void*>(focused_window.get()))
        : system_ref;
    if (!focused_window) {
        logger_->debug("[MacOSScanner] No focused window, scanning system-wide");
    }

    collect(start, 0, elements);
    logger_->debug("[MacOSScanner] Found " + std::to_string(elements.size()) + " elements");
    return elements;
}

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
