#include "app/launch_options.h"

#include <cstdlib>
#include <utility>

namespace layerfall::app {
namespace {

constexpr std::string_view kSeedFlag = "--seed";
constexpr std::string_view kLogLevelFlag = "--log-level";

// Splits "--flag=value" or takes the next argument for "--flag value".
bool takeFlagValue(
    std::string_view flag,
    int argc,
    const char* const* argv,
    int& index,
    std::optional<std::string_view>& outValue
) {
    const std::string_view argument = argv[index];
    if (argument == flag) {
        if (index + 1 >= argc) {
            outValue = std::nullopt;
            return true;
        }
        ++index;
        outValue = std::string_view(argv[index]);
        return true;
    }
    if (argument.size() > flag.size() && argument.substr(0, flag.size()) == flag && argument[flag.size()] == '=') {
        outValue = argument.substr(flag.size() + 1);
        return true;
    }
    return false;
}

void setError(std::string* outError, std::string message) {
    if (outError != nullptr) {
        *outError = std::move(message);
    }
}

} // namespace

std::optional<std::uint64_t> parseSeed(std::string_view text) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        return std::nullopt;
    }
    const std::string owned(text);
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(owned.c_str(), &end, 0);
    if (end == owned.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(parsed);
}

bool parseLaunchOptions(int argc, const char* const* argv, LaunchOptions& outOptions, std::string* outError) {
    LaunchOptions options;
    for (int index = 1; index < argc; ++index) {
        const std::string_view argument = argv[index];
        std::optional<std::string_view> value;
        if (argument == "--help" || argument == "-h") {
            options.showHelp = true;
        } else if (takeFlagValue(kSeedFlag, argc, argv, index, value)) {
            const std::optional<std::uint64_t> seed = value.has_value() ? parseSeed(*value) : std::nullopt;
            if (!seed.has_value()) {
                setError(outError, "invalid value for --seed: '" + std::string(value.value_or("")) + "'");
                return false;
            }
            options.seed = seed;
        } else if (takeFlagValue(kLogLevelFlag, argc, argv, index, value)) {
            const std::optional<core::LogLevel> level =
                value.has_value() ? core::tryParseLogLevel(*value) : std::nullopt;
            if (!level.has_value()) {
                setError(outError, "invalid value for --log-level: '" + std::string(value.value_or("")) + "'");
                return false;
            }
            options.logLevel = level;
        } else {
            setError(outError, "unknown argument '" + std::string(argument) + "'");
            return false;
        }
    }
    outOptions = options;
    return true;
}

std::optional<std::uint64_t> seedFromEnvironment() {
    const char* rawSeed = std::getenv("LAYERFALL_SEED");
    if (rawSeed == nullptr || *rawSeed == '\0') {
        return std::nullopt;
    }
    const std::optional<std::uint64_t> seed = parseSeed(rawSeed);
    if (!seed.has_value()) {
        LF_LOGW("app") << "ignoring invalid LAYERFALL_SEED='" << rawSeed << "'";
    }
    return seed;
}

sim::SimConfig makeSimConfig(const LaunchOptions& options) {
    sim::SimConfig config{};
    if (options.seed.has_value()) {
        config.seed = *options.seed;
    } else if (const std::optional<std::uint64_t> environmentSeed = seedFromEnvironment()) {
        config.seed = *environmentSeed;
    }
    return config;
}

const char* launchUsage() {
    return "usage: layerfall [--seed=<n>] [--log-level=<error|warn|info|debug|trace>] [--help]\n"
           "  LAYERFALL_SEED and LAYERFALL_LOG_LEVEL are read when the flags are absent.\n";
}

} // namespace layerfall::app
