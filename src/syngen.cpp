#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include "CancellationToken.hpp"
#include "GeneratorSource.hpp"
#include "JsonLinesWriter.hpp"
#include "SourceRunner.hpp"
#include <csignal>
#include <iostream>

static CancellationToken shutdown_token;

static void install_signal_handlers() {
    auto on_interrupt = [](int) { shutdown_token.request_cancel(); };
    SignalManager::register_signal(SIGINT, on_interrupt);
    SignalManager::register_signal(SIGTERM, on_interrupt);
    SignalManager::setup();
}

static void apply_log_config(const GlobalConfig& global) {
    LogUtils::Level level = global.verbose ? LogUtils::Level::Debug : LogUtils::parse_level(global.log_level);

    if (global.log_file != "log/syngen.log") {
        LogUtils::shutdown();
        LogUtils::init(level, global.log_file);
    }
    LogUtils::set_level(level);
}

static int run(int argc, char* argv[]) {
    // 1. Create parameter context and initialize
    ParameterContext context;
    if (!context.init(argc, argv)) {
        return 0;
    }

    // 2. Get parsed configuration data
    const ConfigData& config = context.get_config_data();
    apply_log_config(config.global);

    // 3. Open the source and stream records until cancelled or exhausted
    try {
        auto source = GeneratorSource::open(config.source);
        auto writer = JsonLinesWriter::open(config.global.output);

        SourceRunner runner(*source, *writer);
        runner.run(shutdown_token);
    } catch (const std::invalid_argument& e) {
        LogUtils::error("Invalid configuration:\n{}", e.what());
        return 1;
    } catch (const std::logic_error& e) {
        LogUtils::fatal("Fatal error during record generation: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        LogUtils::error("Error during record generation: {}", e.what());
        return 1;
    }

    if (int signum = SignalManager::last_signal()) {
        LogUtils::info("Interrupt signal ({}) received, stopped gracefully", signum);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    int result = 0;

    LogUtils::init(LogUtils::Level::Info);
    install_signal_handlers();

    try {
        result = run(argc, argv);
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
