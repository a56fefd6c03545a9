#pragma once
#include <memory>
#include <string>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "interfaces/IAccessibilityProvider.hpp"

namespace core {

// ============================================================================
// ActionDispatcher - text entry and named actions on one element
// ============================================================================
// Element ids come from an earlier snapshot. Calls run on the caller's
// thread and are not retried.
// ============================================================================

class ActionDispatcher {
public:
    // `provider` may be null; every call then fails with ProviderUnavailable
    ActionDispatcher(std::shared_ptr<interfaces::IAccessibilityProvider> provider,
                     std::shared_ptr<common::ILogger> logger);

    // Native reply verbatim on success; ActionFailed on a null reply
    common::Result<std::string> type_text(const std::string& element_id, const std::string& text);

    // ActionFailed on a null reply; ActionRejected(reply) when the reply
    // does not report success
    common::EmptyResult invoke_named_action(const std::string& element_id,
                                            const std::string& action_name);

    // Success iff the native reply contains "success"
    static common::EmptyResult interpret_action_reply(const std::string& reply);

private:
    std::shared_ptr<interfaces::IAccessibilityProvider> provider_;
    std::shared_ptr<common::ILogger> logger_;
};

} // namespace core
