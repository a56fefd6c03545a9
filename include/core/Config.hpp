#pragma once
#include <string>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/AccessibilityService.hpp"

namespace core {

struct Config {
    ServiceOptions service;
    common::LogLevel log_level = common::LogLevel::Info;
    bool use_mock_provider = false;   // Development mode, no native provider
    bool show_help = false;
};

// Parses --interval-ms=, --self-app=, --workers=, --log-level=, --mock, --help.
// Unknown options and bad values are InvalidArgument.
common::Result<Config> parse_config(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace core
