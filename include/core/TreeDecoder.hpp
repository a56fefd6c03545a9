#pragma once
#include <string>
#include "common/ElementTypes.hpp"
#include "common/Result.hpp"

namespace core {

// ============================================================================
// TreeDecoder - compact snapshot wire format <-> element model
// ============================================================================
// Wire format:
//   {"ts"?: "...", "e": [Element, ...]}
//   Element: {"id"?, "e", "p"?, "d"?, "f"?: [x,y,w,h], "a"?: {k: v},
//             "m"?: [name], "c"?: [Element], "app"?, "focused"?,
//             "main"?, "appActive"?}
// Unknown keys are ignored. Decoding is pure.
// ============================================================================

class TreeDecoder {
public:
    // Errors:
    //   DecodeError        - not JSON, missing/mistyped fields
    //   ProviderCallFailed - payload is an {"error": "..."} marker
    static common::Result<common::Tree> decode(const std::string& raw);

    // Absent optionals and empty attribute/action/child lists are omitted
    static std::string encode(const common::Tree& tree);
};

} // namespace core
