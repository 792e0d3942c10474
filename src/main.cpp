#include "core/config.hpp"
#include "engine/alert_service.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>

namespace {

std::unique_ptr<vigil::AlertService> g_service;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutdown requested..." << std::endl;
        if (g_service) {
            g_service->request_shutdown();
        }
    }
}

void print_banner() {
    std::cout << "\nvigil\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -r, --rules <path>   Alert rule file (JSON)\n"
              << "  -f, --feed <path>    Replay feed of market/news ticks (JSON)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  VIGIL_WORKER_THREADS            Evaluation worker threads\n"
              << "  VIGIL_TICK_INTERVAL_MS          Delay between ticks\n"
              << "  VIGIL_MIN_HISTORY_POINTS        History needed for the z-score signal\n"
              << "  VIGIL_NEWS_TRIGGER_THRESHOLD    Sentiment below which news alerts fire\n"
              << "  VIGIL_ANOMALY_PRICE_CHANGE      Default anomaly price-change threshold (%)\n"
              << "  VIGIL_ANOMALY_VOLUME_MULTIPLIER Default anomaly volume multiplier\n"
              << "  VIGIL_ANOMALY_SIGMA             Default anomaly sigma\n"
              << "  VIGIL_BATCH_WINDOW_MINUTES      Default batching window\n"
              << "  VIGIL_RULES_PATH                Alert rule file\n"
              << "  VIGIL_FEED_PATH                 Replay feed file\n"
              << "  VIGIL_LOG_LEVEL                 trace|debug|info|warn|error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "vigil v1.0.0\n"
              << "Alert evaluation and debouncing engine\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> rules_path;
    std::optional<std::string> feed_path;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-r" || arg == "--rules") && i + 1 < argc) {
            args.rules_path = argv[++i];
        } else if ((arg == "-f" || arg == "--feed") && i + 1 < argc) {
            args.feed_path = argv[++i];
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    print_banner();

    // Load configuration with priority: CLI > env > file > defaults
    auto config = vigil::Config::load(args.config_path);

    // CLI argument overrides (highest priority)
    if (args.rules_path) {
        config.input.rules_path = *args.rules_path;
    }
    if (args.feed_path) {
        config.input.feed_path = *args.feed_path;
    }

    // Print active configuration
    std::cout << "Configuration:\n"
              << "  Rules: " << config.input.rules_path << "\n"
              << "  Feed: " << config.input.feed_path << "\n"
              << "  Workers: " << config.engine.worker_threads << "\n"
              << "  Tick interval: " << config.engine.tick_interval.count() << " ms\n"
              << "  Default batch window: " << config.batching.default_window.count() << " min\n"
              << std::endl;

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Create and run service
        g_service = std::make_unique<vigil::AlertService>(config);
        bool ok = g_service->run();
        if (!ok) {
            g_service.reset();
            return 1;
        }

        std::cout << "\nTicks: " << g_service->ticks_run()
                  << " | Batches: " << g_service->batches_delivered()
                  << " | Events: " << g_service->events_delivered() << std::endl;
        g_service.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
