#include "core/CommandDispatcher.hpp"

namespace core {
namespace command {

// ============================================================================
// Construction
// ============================================================================

CommandDispatcher::CommandDispatcher(std::shared_ptr<common::ILogger> logger)
    : logger_(std::move(logger)) {}

CommandDispatcher::~CommandDispatcher() = default;

// ============================================================================
// Handler Registration
// ============================================================================

void CommandDispatcher::register_handler(std::shared_ptr<ICommandHandler> handler) {
    logger_->debug(std::string("[CMD] Registered handler: ") + handler->category());
    handlers_.push_back(std::move(handler));
}

// ============================================================================
// Command Dispatching
// ============================================================================

std::pair<std::string, std::string> CommandDispatcher::parse_message(const std::string& message) {
    // Tolerate CRLF input
    std::string line = message;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    size_t name_start = line.find_first_not_of(' ');
    if (name_start == std::string::npos) {
        return {"", ""};
    }

    size_t space_pos = line.find(' ', name_start);
    if (space_pos == std::string::npos) {
        return {line.substr(name_start), ""};
    }

    std::string cmd_name = line.substr(name_start, space_pos - name_start);
    std::string args = line.substr(space_pos + 1);

    size_t args_start = args.find_first_not_of(' ');
    args = (args_start == std::string::npos) ? "" : args.substr(args_start);

    return {cmd_name, args};
}

common::EmptyResult CommandDispatcher::dispatch(
    const std::string& message,
    const CommandContext& ctx
) {
    auto [cmd_name, args] = parse_message(message);

    if (cmd_name.empty()) {
        return common::EmptyResult::success();
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_dispatched++;
    }

    for (auto& handler : handlers_) {
        if (!handler->can_handle(cmd_name)) continue;

        auto command = handler->parse_command(cmd_name, args, ctx);
        if (!command) {
            // Handler already sent the error
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.execution_errors++;
            return common::EmptyResult::err(
                common::ErrorCode::InvalidArgument,
                "Command parsing failed: " + cmd_name
            );
        }

        logger_->debug(std::string("[CMD] ") + command->type());

        auto result = command->execute();

        if (result.is_err()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.execution_errors++;
        }

        return result;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.unknown_commands++;
    }

    logger_->warn("[CMD] Unknown: " + cmd_name);
    return common::EmptyResult::success();
}

// ============================================================================
// Statistics
// ============================================================================

CommandDispatcher::Stats CommandDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace command
} // namespace core
