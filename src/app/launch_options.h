#pragma once

#include "core/log.h"
#include "sim/sim_config.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Launch options
// Responsible for: command-line and environment settings read once at startup (seed, log level).
// Should NOT do: open windows, run the simulation, or keep state past startup.
namespace layerfall::app {

struct LaunchOptions {
    std::optional<std::uint64_t> seed;
    std::optional<core::LogLevel> logLevel;
    bool showHelp = false;
};

// Decimal, or hex with a 0x prefix.
[[nodiscard]] std::optional<std::uint64_t> parseSeed(std::string_view text);

// Accepts --seed=<n>, --seed <n>, --log-level=<name>, --log-level <name> and --help.
bool parseLaunchOptions(int argc, const char* const* argv, LaunchOptions& outOptions, std::string* outError = nullptr);

// LAYERFALL_SEED, or nullopt when unset or malformed.
[[nodiscard]] std::optional<std::uint64_t> seedFromEnvironment();

// A seed given on the command line wins over LAYERFALL_SEED.
[[nodiscard]] sim::SimConfig makeSimConfig(const LaunchOptions& options);

[[nodiscard]] const char* launchUsage();

} // namespace layerfall::app
