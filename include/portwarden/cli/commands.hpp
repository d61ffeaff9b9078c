#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "portwarden/core/config.hpp"

namespace portwarden::cli {

/// Returns the effective configuration, loading it on first use.
using ConfigLoader = std::function<Config&()>;

/// Re-reads the configuration from its sources and returns the new value.
using ConfigReloader = std::function<Config()>;

/// Receives a subcommand's process exit code.
using ExitCodeSink = std::function<void(int)>;

/// Register the `serve` subcommand.
/// Runs the lifecycle manager on the configured port range until
/// SIGINT/SIGTERM. SIGHUP reloads the configuration and restarts the
/// server when the port range changed.
void register_serve_command(CLI::App& app, ConfigLoader load, ConfigReloader reload,
                            ExitCodeSink set_exit);

/// Register the `scan` subcommand.
/// Prints one or more available ports in a range.
void register_scan_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit);

/// Register the `preferred` subcommand.
/// Checks preferred ports first, then a random high window.
void register_preferred_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit);

/// Register the `check` subcommand.
/// Reports whether a single port is in use.
void register_check_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit);

/// Register the `common-ports` subcommand.
/// Prints the availability of well-known service ports.
void register_common_ports_command(CLI::App& app, ConfigLoader load);

/// Register the `config` subcommand.
/// Prints the effective configuration as JSON and validates it.
void register_config_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit);

} // namespace portwarden::cli
