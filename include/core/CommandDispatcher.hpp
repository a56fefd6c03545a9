#pragma once
#include <cstdint>
#include <vector>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "common/Logger.hpp"
#include "core/ICommand.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandDispatcher - Central command routing
// ============================================================================
// Routes "command_name [args...]" lines to the first handler that accepts
// the name. Handlers are registered at startup only.
// ============================================================================

class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<common::ILogger> logger);
    ~CommandDispatcher();

    void register_handler(std::shared_ptr<ICommandHandler> handler);

    // Returns:
    //   - Ok: Command was parsed and executed, or the line was empty/unknown
    //   - Error: parsing or execution failed
    common::EmptyResult dispatch(
        const std::string& message,
        const CommandContext& ctx
    );

    struct Stats {
        uint64_t total_dispatched = 0;
        uint64_t unknown_commands = 0;
        uint64_t execution_errors = 0;
    };

    Stats get_stats() const;

    // Split into (command_name, remaining_args)
    static std::pair<std::string, std::string> parse_message(const std::string& message);

private:
    std::shared_ptr<common::ILogger> logger_;
    std::vector<std::shared_ptr<ICommandHandler>> handlers_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace command
} // namespace core
