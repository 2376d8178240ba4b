#include "core/config.hpp"
#include "engine/tracker_engine.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace {

std::unique_ptr<surge::TrackerEngine> g_engine;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_engine) {
            g_engine->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -s, --symbol <sym>   Trading symbol (e.g., btcusdt, ethusdt)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nRequired Environment:\n"
              << "  TELEGRAM_BOT_TOKEN   Bot API token\n"
              << "  TELEGRAM_CHAT_ID     Chat that receives alerts and replies\n"
              << "\nOptional Environment:\n"
              << "  SURGE_SYMBOL             Override trading symbol\n"
              << "  SURGE_WS_HOST            WebSocket host\n"
              << "  SURGE_WS_PORT            WebSocket port\n"
              << "  SURGE_SETTINGS_PATH      Where tuned settings are saved\n"
              << "  SURGE_Z_THRESHOLD        Default z-score threshold\n"
              << "  SURGE_VOLUME_THRESHOLD   Default volume multiplier\n"
              << "  SURGE_ALERT_COOLDOWN     Default cooldown in seconds\n"
              << "  SURGE_WHALE_THRESHOLD    Default whale threshold in USD\n"
              << "  SURGE_POLL_INTERVAL_MS   Telegram command poll interval\n"
              << "  SURGE_LOG_LEVEL          trace, debug, info, warn, error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << "Saved settings (from bot commands) override the defaults above.\n"
              << std::endl;
}

void print_version() {
    std::cout << "surge v1.0.0\n"
              << "Volume surge and whale alerts for Binance Futures via Telegram\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> symbol;
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
        } else if ((arg == "-s" || arg == "--symbol") && i + 1 < argc) {
            args.symbol = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = surge::Config::load(args.config_path);

    if (args.symbol) {
        config.network.symbol = *args.symbol;
    }

    if (auto problem = config.validate()) {
        std::cerr << "Error: " << *problem << std::endl;
        return 1;
    }

    std::cout << "Configuration:\n"
              << "  Symbol: " << config.network.symbol << "\n"
              << "  WebSocket: " << config.network.ws_host << ":" << config.network.ws_port
              << config.ws_stream_path() << "\n"
              << "  Telegram API: " << config.telegram.api_host << "\n"
              << "  Settings file: " << config.alerts.settings_path << "\n"
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int status = 0;
    try {
        g_engine = std::make_unique<surge::TrackerEngine>(config);
        g_engine->run();
        g_engine.reset();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        g_engine.reset();
        status = 1;
    }

    spdlog::shutdown();
    return status;
}
