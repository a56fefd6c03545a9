#pragma once

namespace interfaces {

    // Native accessibility provider (C ABI).
    //
    // Every call returns a NUL-terminated buffer allocated by the provider,
    // or nullptr on failure. The caller owns the buffer and must hand it
    // back through release() exactly once.
    //
    // get_hierarchy*() return either a tree payload {"e": [...]} or an
    // error marker {"error": "..."}. All calls may block on the OS.
    class IAccessibilityProvider {
    public:
        virtual ~IAccessibilityProvider() = default;

        virtual char* get_hierarchy() = 0;

        // Either filter may be nullptr (at least one is set)
        virtual char* get_hierarchy_filtered(const char* app_name, const char* window_title) = 0;

        virtual char* perform_type_action(const char* element_id, const char* text) = 0;

        virtual char* perform_named_action(const char* element_id, const char* action_name) = 0;

        virtual void release(char* buffer) noexcept = 0;
    };

}
