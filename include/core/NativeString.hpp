#pragma once
#include <memory>
#include <string>
#include "interfaces/IAccessibilityProvider.hpp"

namespace core {

// ============================================================================
// NativeString - owning handle for a provider-allocated C string
// ============================================================================
// Hands the buffer back to the provider that allocated it when the handle
// goes out of scope, whichever path the caller leaves by.
// ============================================================================

class NativeString {
public:
    NativeString(interfaces::IAccessibilityProvider& provider, char* buffer)
        : buffer_(buffer, Releaser{&provider}) {}

    bool is_null() const { return buffer_ == nullptr; }

    // Copy of the contents; empty string for a null buffer
    std::string str() const {
        return buffer_ ? std::string(buffer_.get()) : std::string();
    }

private:
    struct Releaser {
        interfaces::IAccessibilityProvider* provider;
        void operator()(char* p) const noexcept {
            if (p) provider->release(p);
        }
    };

    std::unique_ptr<char, Releaser> buffer_;
};

// C APIs cannot carry strings with interior NUL bytes
inline bool has_embedded_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

} // namespace core
