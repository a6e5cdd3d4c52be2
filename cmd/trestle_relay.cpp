// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <trestle/dev/dev_bridge.hpp>
#include <trestle/infra/cli/common.hpp>
#include <trestle/infra/cli/shutdown_signal.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/awaitable_wait_for_one.hpp>
#include <trestle/relay/common/bridge_config.hpp>
#include <trestle/relay/common/metrics.hpp>

using namespace trestle;
using namespace trestle::cmd::common;
using namespace trestle::relay;

namespace {

struct RelaySettings {
    log::Settings log_settings;
    dev::DevBridgeSettings dev_bridge;
    std::optional<std::filesystem::path> metrics_file;
};

RelaySettings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Trestle - bridge relayer between dev chains"};

    RelaySettings settings;
    std::optional<std::filesystem::path> config_file;
    LoopTiming timing;
    std::chrono::milliseconds block_time{settings.dev_bridge.bridge.block_time};
    bool dry_run{false};
    bool mandatory_headers{false};

    add_logging_options(cli, settings.log_settings);
    add_option_config_file(cli, config_file);
    add_option_millis(cli, "--tick", timing.tick, "Interval between two iterations of a relay loop");
    add_option_millis(cli, "--stall-timeout", timing.stall_timeout, "Time a transaction may take to finalize");
    add_option_millis(cli, "--retry-interval", timing.retry_interval, "Delay before retrying a failed iteration");
    add_option_millis(cli, "--block-time", block_time, "Block production interval of the dev chains");
    cli.add_flag("--dry-run", dry_run, "Build transactions without submitting them");
    cli.add_flag("--only-mandatory-headers", mandatory_headers, "Relay only headers enacting authority set changes");
    cli.add_option("--messages-per-block", settings.dev_bridge.messages_per_block,
                   "Messages sent through every lane in both directions at each block")
        ->capture_default_str();
    cli.add_option("--metrics.file", settings.metrics_file, "File receiving the metrics at shutdown");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }

    // command line flags override the configuration file
    BridgeConfig& bridge{settings.dev_bridge.bridge};
    if (config_file) {
        bridge = load_bridge_config(*config_file);
    }
    if (cli.count("--tick")) bridge.timing.tick = timing.tick;
    if (cli.count("--stall-timeout")) bridge.timing.stall_timeout = timing.stall_timeout;
    if (cli.count("--retry-interval")) bridge.timing.retry_interval = timing.retry_interval;
    if (cli.count("--block-time")) bridge.block_time = block_time;
    if (dry_run) bridge.dry_run = true;
    if (mandatory_headers) bridge.headers_to_relay = HeadersToRelay::kMandatory;

    return settings;
}

void export_metrics(const RelaySettings& settings, const Metrics& metrics) {
    const std::string rendered{metrics.render()};
    if (!settings.metrics_file) {
        std::cout << rendered;
        return;
    }
    std::ofstream out{*settings.metrics_file};
    if (!out) {
        TRESTLE_ERROR_M("Cannot write metrics", {"file", settings.metrics_file->string()});
        return;
    }
    out << rendered;
}

void trestle_relay_main(const RelaySettings& settings) {
    using namespace concurrency::awaitable_wait_for_one;

    log::init(settings.log_settings);
    log::set_thread_name("main");

    boost::asio::io_context ioc;
    dev::DevBridge bridge{ioc.get_executor(), settings.dev_bridge};

    auto run_future = boost::asio::co_spawn(ioc, ShutdownSignal::wait() || bridge.run(), boost::asio::use_future);

    TRESTLE_INFO_M("Trestle relay is now running",
                   {"relay_chain", bridge.relay_chain().name(), "parachain", bridge.parachain().name(),
                    "bridged_chain", bridge.bridged_chain().name(), "lanes",
                    std::to_string(settings.dev_bridge.bridge.lanes.size())});

    // runs until either:
    // - a shutdown signal, then the pipelines are cancelled gracefully
    // - a pipeline exception, then it is rethrown here
    ioc.run();
    run_future.get();

    export_metrics(settings, bridge.metrics());
    TRESTLE_INFO_M("Trestle relay exiting");
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        trestle_relay_main(parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code();
    } catch (const std::exception& e) {
        TRESTLE_CRIT_M("Trestle relay exiting due to exception", {"what", e.what()});
        return -2;
    } catch (...) {
        TRESTLE_CRIT_M("Trestle relay exiting due to unexpected exception");
        return -3;
    }
}
