#pragma once
#include <string>
#include <functional>
#include <memory>
#include "common/Result.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandContext - Shared context for all commands
// ============================================================================
// Carries the response channel. Responses are single text lines:
//   STATUS:<category>:<status>
//   DATA:<type>:<payload>
//   ERROR:<operation>:<message>
// ============================================================================

struct CommandContext {
    using ResponseFn = std::function<void(const std::string& line)>;
    ResponseFn respond;

    void send_text(const std::string& text, const std::string& prefix = "") const {
        if (respond) respond(prefix + text);
    }

    void send_status(const std::string& category, const std::string& status) const {
        send_text(category + ":" + status, "STATUS:");
    }

    void send_error(const std::string& operation, const std::string& message) const {
        send_text(operation + ":" + message, "ERROR:");
    }

    void send_data(const std::string& type, const std::string& data) const {
        send_text(type + ":" + data, "DATA:");
    }
};

// ============================================================================
// ICommand - Base interface for all commands (Command Pattern)
// ============================================================================
// Commands are created per request and carry their parsed arguments.
// ============================================================================

class ICommand {
public:
    virtual ~ICommand() = default;

    // Ok: executed (response sent through the context)
    // Error: execution failed (an ERROR line has been sent)
    virtual common::EmptyResult execute() = 0;

    // Command type identifier (for logging/debugging)
    virtual const char* type() const noexcept = 0;
};

// ============================================================================
// ICommandHandler - Factory for creating commands (Strategy Pattern)
// ============================================================================
// Registered with CommandDispatcher; one handler per command category.
// ============================================================================

class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    virtual bool can_handle(const std::string& command_name) const = 0;

    // Returns nullptr if parsing failed (handler sends the error via ctx)
    virtual std::unique_ptr<ICommand> parse_command(
        const std::string& command_name,
        const std::string& args,
        const CommandContext& ctx
    ) = 0;

    virtual const char* category() const noexcept = 0;
};

} // namespace command
} // namespace core
