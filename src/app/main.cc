#include "app/app.h"
#include "app/launch_options.h"

#include "core/log.h"

#include <iostream>
#include <string>

// Program entry point
// Responsible for: reading launch options, creating the app, and handing control to the app runtime loop.
// Should NOT do: implement gameplay systems or low-level window/input handling.
int main(int argc, char** argv) {
    using namespace layerfall;

    app::LaunchOptions options;
    std::string error;
    if (!app::parseLaunchOptions(argc, argv, options, &error)) {
        LF_LOGE("main") << error;
        std::cerr << app::launchUsage();
        return 2;
    }
    if (options.showHelp) {
        std::cout << app::launchUsage();
        return 0;
    }
    if (options.logLevel.has_value()) {
        core::setLogLevel(*options.logLevel);
    }

    const sim::SimConfig config = app::makeSimConfig(options);
    LF_LOGI("main") << "startup seed=" << config.seed << " log level=" << core::logLevelName(core::logLevel());
    app::App app;

    if (!app.init(config)) {
        LF_LOGE("main") << "app init failed, exiting";
        return 1;
    }

    app.run();
    app.shutdown();
    LF_LOGI("main") << "exit success";
    return 0;
}
