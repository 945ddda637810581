#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "broadcast_hub.h"
#include "conflict_engine.h"
#include "game_clock.h"
#include "game_config.h"
#include "log.h"
#include "observer_server.h"
#include "snapshot.h"
#include "tick_scheduler.h"

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void onSignal(int) {
    g_stopRequested = 1;
}

struct ServerOptions {
    std::string configPath;
    int port = -1; // -1 means "use config value"
    std::string snapshotIn;
    std::string snapshotOut;
    std::string logLevel;
};

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "frontline_server")
              << " [--config path] [--port N]\n"
              << "       [--snapshot-in path] [--snapshot-out path]\n"
              << "       [--log-level debug|info|warn|error|off]\n"
              << "Notes: FRONTLINE_CONFIG is used when --config is not given.\n";
}

bool parseArgs(int argc, char** argv, ServerOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--port") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.port)) return false;
        } else if (arg.rfind("--port=", 0) == 0) {
            if (!parseInt(arg.substr(7), opt.port)) return false;
        } else if (arg == "--snapshot-in") {
            if (!requireValue(opt.snapshotIn)) return false;
        } else if (arg == "--snapshot-out") {
            if (!requireValue(opt.snapshotOut)) return false;
        } else if (arg == "--log-level") {
            if (!requireValue(opt.logLevel)) return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    if (opt.port != -1 && (opt.port < 0 || opt.port > 65535)) {
        std::cerr << "Invalid port: " << opt.port << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    ServerOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    if (opt.configPath.empty()) {
        const char* env = std::getenv("FRONTLINE_CONFIG");
        opt.configPath = (env && *env) ? std::string(env) : std::string("data/frontline.toml");
    }

    GameContext ctx(opt.configPath);

    const std::string levelName = opt.logLevel.empty() ? ctx.config.log.level : opt.logLevel;
    logging::Level level = logging::Level::Info;
    if (logging::parseLevel(levelName, level)) {
        logging::setLevel(level);
    } else if (!opt.logLevel.empty()) {
        std::cerr << "Invalid log level: " << opt.logLevel << "\n";
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    } else {
        logging::warn("Config", "Unknown log level '" + levelName + "'; keeping info.");
    }
    logging::info("Config", "Loaded " + ctx.configPath + " (hash " + ctx.configHash + ").");

    if (opt.port != -1) {
        ctx.config.server.port = opt.port;
    }

    SystemGameClock clock;
    BroadcastHub hub;
    ConflictEngine engine(ctx.config, clock, hub);

    if (!opt.snapshotIn.empty()) {
        std::string err;
        if (!loadSnapshot(engine, opt.snapshotIn, &err)) {
            logging::error("Snapshot", err);
            return 1;
        }
    } else {
        engine.seedCountries();
    }

    TickScheduler scheduler(engine, ctx.config);
    ObserverServer server(engine, hub, ctx.config);

    std::string err;
    if (!server.start(static_cast<unsigned short>(ctx.config.server.port), &err)) {
        logging::error("Server", err);
        return 1;
    }
    scheduler.start();

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    logging::info("Server", "Running. Press Ctrl+C to stop.");

    while (!g_stopRequested) {
        sf::sleep(sf::milliseconds(100));
    }

    logging::info("Server", "Shutting down.");
    scheduler.stop();
    server.stop();
    hub.shutdown();

    if (!opt.snapshotOut.empty()) {
        if (!saveSnapshot(engine, opt.snapshotOut, &err)) {
            logging::error("Snapshot", err);
            return 1;
        }
    }
    return 0;
}
