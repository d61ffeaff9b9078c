#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "portwarden/core/config.hpp"

namespace portwarden::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// subcommands (serve, scan, preferred, check, common-ports, config).
/// Configuration is loaded lazily, the first time a subcommand asks for
/// it, so that global options are already parsed.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Loads (once) and returns the effective configuration: file, then
    /// environment, then command-line overrides.
    [[nodiscard]] auto config() -> Config&;

    /// Reads the configuration sources again and replaces the cached value.
    auto reload_config() -> Config;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// File, then environment, then command-line overrides.
    [[nodiscard]] auto read_config() const -> Config;

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    bool config_loaded_ = false;
    int exit_code_ = 0;
};

} // namespace portwarden::cli
