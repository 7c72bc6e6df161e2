/**
 * @file main.cpp
 * @brief placement_engine command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one pipeline:
 *   Config → Logger → Inventory → InventoryCache → PlacementController → stdout
 *
 * One-shot mode evaluates every placement at a single instant and prints
 * the outcome. Watch mode keeps the controller running, reloading the
 * inventory file when it changes, until SIGINT/SIGTERM.
 */

#include "controller/inventory_cache.hpp"
#include "controller/placement_controller.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "model/inventory.hpp"
#include "telemetry/decision_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>

using namespace placement_engine;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path inventory_path;
    std::optional<int64_t> at_unix_seconds;
    std::string log_dir;
    bool watch = false;
};

void print_usage() {
    std::cout << "Usage: placement_engine --inventory <path> [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --inventory <path>   Clusters and placements (TOML)\n"
              << "  --at <unix_seconds>  Evaluate at this instant instead of now\n"
              << "  --watch              Keep running and re-evaluate on expiry or file change\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --help, -h           Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--inventory" && i + 1 < argc) {
            args.inventory_path = argv[++i];
        } else if (arg == "--at" && i + 1 < argc) {
            try {
                args.at_unix_seconds = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidArgument,
                             std::string{"--at expects Unix seconds, got "} + argv[i]};
            }
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--watch") {
            args.watch = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::InvalidArgument, "Unknown argument: " + arg};
        }
    }
    if (args.inventory_path.empty()) {
        return Error{ErrorCode::InvalidArgument, "--inventory is required"};
    }
    if (args.watch && args.at_unix_seconds) {
        return Error{ErrorCode::InvalidArgument, "--at cannot be combined with --watch"};
    }
    return args;
}

std::string join(const std::vector<ClusterId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ",";
        out += ids[i];
    }
    return out;
}

void print_status(const PlacementId& id, const PlacementStatus& status) {
    const auto& outcome = status.outcome;
    std::cout << id << ": admitted=[" << join(outcome.admitted) << "]"
              << " rejected=[" << join(outcome.rejected) << "]";
    if (outcome.requeue) {
        std::cout << " requeue_after=" << outcome.requeue_after.count() << "ms";
    }
    std::cout << '\n';

    if (status.last_error) {
        std::cout << "  error: " << status.last_error->message << '\n';
    }
    for (const auto& verdict : outcome.verdicts) {
        if (verdict.reason == ClusterVerdict::Reason::Tolerated) continue;
        std::cout << "  " << verdict.cluster << ": " << to_string(verdict.reason);
        if (!verdict.taint.empty()) std::cout << " (" << verdict.taint << ")";
        if (verdict.remaining && verdict.admitted) {
            std::cout << " remaining=" << verdict.remaining->count() << "ms";
        }
        std::cout << '\n';
    }
}

/**
 * @brief Replace the cache contents with `inventory`, queueing what changed.
 */
void sync_inventory(const Inventory& inventory,
                    InventoryCache& cache,
                    PlacementController& controller,
                    Timestamp observed_at) {
    std::set<ClusterId> cluster_names;
    bool clusters_changed = false;
    for (const auto& cluster : inventory.clusters) {
        cluster_names.insert(cluster.name);
        auto known = cache.cluster(cluster.name);
        cache.upsert_cluster(cluster, observed_at);
        if (!known || known != cache.cluster(cluster.name)) clusters_changed = true;
    }
    auto snapshot = cache.clusters();
    for (const auto& cluster : *snapshot) {
        if (!cluster_names.contains(cluster.name)) {
            cache.remove_cluster(cluster.name);
            clusters_changed = true;
        }
    }

    std::set<PlacementId> placement_ids;
    for (const auto& placement : inventory.placements) {
        auto id = placement.id();
        placement_ids.insert(id);
        if (cache.placement(id) != placement) {
            cache.upsert_placement(placement);
            controller.enqueue(id);
        }
    }
    for (const auto& id : cache.placement_ids()) {
        if (!placement_ids.contains(id)) {
            cache.remove_placement(id);
            controller.forget(id);
        }
    }

    if (clusters_changed) controller.enqueue_all();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage();
        return 2;
    }
    auto args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result && config_result.error().code != ErrorCode::NotFound) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = config_result ? *config_result : default_config();
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::shared_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_shared<JsonFileSink>(config.telemetry.log_dir, "placement_engine",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_shared<StdoutSink>();
    }
    Logger logger(log_sink, config.telemetry.log_level, "main");
    if (!config_result) {
        logger.info("No configuration at " + args.config_path.string() + ", using defaults");
    }

    std::shared_ptr<DecisionRecorder> recorder;
    if (!config.telemetry.decisions_file.empty() && !config.telemetry.log_dir.empty()) {
        recorder = std::make_shared<DecisionRecorder>(std::make_shared<JsonFileSink>(
            config.telemetry.log_dir, config.telemetry.decisions_file,
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count));
    }

    // ── Load Inventory ───────────────────────
    auto inventory = load_inventory(args.inventory_path);
    if (!inventory) {
        logger.error(inventory.error().message);
        std::cerr << inventory.error().message << std::endl;
        return 1;
    }
    logger.info("Loaded " + std::to_string(inventory->clusters.size()) + " cluster(s) and "
                + std::to_string(inventory->placements.size()) + " placement(s) from "
                + args.inventory_path.string());

    SystemClock system_clock;
    ManualClock fixed_clock(args.at_unix_seconds
        ? from_unix_seconds(*args.at_unix_seconds)
        : std::chrono::system_clock::now());
    const IClock& clock = args.watch ? static_cast<const IClock&>(system_clock)
                                     : static_cast<const IClock&>(fixed_clock);

    InventoryCache cache;
    PlacementController controller(
        cache, clock, logger.with_component("controller"),
        PlacementController::Options{.controller = config.controller,
                                     .eviction = config.eviction},
        recorder);

    sync_inventory(*inventory, cache, controller, clock.now());

    // ── One-shot ─────────────────────────────
    if (!args.watch) {
        controller.sync_once();
        for (const auto& id : controller.known_placements()) {
            if (auto status = controller.status(id)) print_status(id, *status);
        }
        if (recorder) recorder->flush();
        logger.flush();
        return 0;
    }

    // ── Watch ────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::error_code ec;
    auto last_write = std::filesystem::last_write_time(args.inventory_path, ec);
    controller.start();
    logger.info("Watching " + args.inventory_path.string() + ". Press Ctrl+C to stop.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto write_time = std::filesystem::last_write_time(args.inventory_path, ec);
        if (ec || write_time == last_write) continue;
        last_write = write_time;

        auto reloaded = load_inventory(args.inventory_path);
        if (!reloaded) {
            logger.warn("Inventory reload failed, keeping previous state: "
                        + reloaded.error().message);
            continue;
        }
        logger.info("Inventory changed, resynchronizing");
        sync_inventory(*reloaded, cache, controller, clock.now());
    }

    logger.info("Shutdown requested");
    controller.stop();
    for (const auto& id : controller.known_placements()) {
        if (auto status = controller.status(id)) print_status(id, *status);
    }
    if (recorder) recorder->flush();
    logger.flush();
    return 0;
}
