#pragma once
#include "interfaces/IElementScanner.hpp"
#include "common/Logger.hpp"
#include <memory>

#ifdef PLATFORM_MACOS

namespace platform {
namespace macos {

/**
 * Focused-window scanner using the AXUIElement API directly
 *
 * Walks the focused window of the focused application (falls back to the
 * system-wide element) and keeps AXButton, AXSlider, AXTextField and
 * AXCheckBox elements that report an AXPosition.
 */
class MacOSElementScanner final : public interfaces::IElementScanner {
public:
    explicit MacOSElementScanner(std::shared_ptr<common::ILogger> logger);

    std::vector<common::UIElementSummary> scan_focused_window() override;

private:
    std::shared_ptr<common::ILogger> logger_;
};

} // namespace macos
} // namespace platform

#endif // PLATFORM_MACOS
