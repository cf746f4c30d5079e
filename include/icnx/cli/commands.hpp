// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace icnx::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;                  // download, history, session, scrape, migrate, purge
    std::vector<std::string> positional;
    std::string directory;
    std::string config_file;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint32_t> retries;
    std::optional<std::int64_t> older_than;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                    // set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Settings from --config (or defaults) with -c / -r applied
[[nodiscard]] core::EngineConfig effective_config(const CliArgs& args);

// Run a session from a JSON array file until it finishes or Ctrl-C cancels it.
// Returns 0 when every item completed.
[[nodiscard]] CliResult download(const CliArgs& args);

// Print history session summaries
[[nodiscard]] CliResult history(const CliArgs& args);

// Print the progress rows of one session
[[nodiscard]] CliResult session(const CliArgs& args);

// Print the scrape rows of one key
[[nodiscard]] CliResult scrape(const CliArgs& args);

// Import a legacy JSON history file
[[nodiscard]] CliResult migrate(const CliArgs& args);

// Delete history rows, all or those older than --older-than
[[nodiscard]] CliResult purge(const CliArgs& args);

// Dispatch args.command
[[nodiscard]] CliResult run(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace icnx::cli
