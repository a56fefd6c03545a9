#pragma once
#include <vector>
#include "common/ElementTypes.hpp"

namespace interfaces {

    // Walks the focused window directly through the OS accessibility API
    // and returns the interactive elements that report a position.
    class IElementScanner {
    public:
        virtual ~IElementScanner() = default;

        virtual std::vector<common::UIElementSummary> scan_focused_window() = 0;
    };

}
