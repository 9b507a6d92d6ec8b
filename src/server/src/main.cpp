// Midgard World Server - Main Entry Point
// [ZONE_AGENT] Command line parsing and server bootstrap

#include "zones/WorldServer.hpp"
#include "Constants.hpp"
#include <iostream>
#include <cstdlib>
#include <string>

using namespace Midgard;

void printUsage(const char* programName) {
    std::cout << "Midgard World Server v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --redis-host <host>   Redis host (default: localhost)\n"
              << "  --redis-port <num>    Redis port (default: 6379)\n"
              << "  --seed <num>          RNG seed (default: 0 = from clock)\n"
              << "  --maps <file.json>    Map catalog file (default: built-in)\n"
              << "  --harden-damage       Compute monster damage server-side\n"
              << "  --no-persist          Do not write profiles to Redis\n"
              << "  --help, -h            Show this help\n"
              << "\nEvents are read from stdin and written to stdout as JSON lines:\n"
              << "  {\"conn\": 1, \"event\": \"player:join\", \"payload\": {...}}\n";
}

int main(int argc, char* argv[]) {
    try {
        WorldConfig config;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--redis-host" && i + 1 < argc) {
                config.redisHost = argv[++i];
            } else if (arg == "--redis-port" && i + 1 < argc) {
                config.redisPort = static_cast<uint16_t>(std::atoi(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                config.rngSeed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            } else if (arg == "--maps" && i + 1 < argc) {
                config.mapsFile = argv[++i];
            } else if (arg == "--harden-damage") {
                config.trustClientDamage = false;
            } else if (arg == "--no-persist") {
                config.persistProfiles = false;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        std::cerr << R"(
  __  __ _     _                     _
 |  \/  (_) __| | __ _  __ _ _ __ __| |
 | |\/| | |/ _` |/ _` |/ _` | '__/ _` |
 | |  | | | (_| | (_| | (_| | | | (_| |
 |_|  |_|_|\__,_|\__, |\__,_|_|  \__,_|
                 |___/
)" << "\n";

        std::cerr << "Version: " << Constants::VERSION << "\n";
        std::cerr << "Redis: " << config.redisHost << ":" << config.redisPort
                  << (config.persistProfiles ? "" : " (disabled)") << "\n";
        std::cerr << "Maps: " << (config.mapsFile.empty() ? "built-in" : config.mapsFile) << "\n";
        std::cerr << "Client damage: " << (config.trustClientDamage ? "trusted" : "server-side") << "\n";
        std::cerr << "\nInitializing server...\n\n";

        // Protocol lines own stdout; console logging moves to stderr
        std::ostream protocolOut(std::cout.rdbuf());
        std::cout.rdbuf(std::cerr.rdbuf());

        WorldServer server(std::cin, protocolOut);

        if (!server.initialize(config)) {
            std::cerr << "\nFailed to initialize server. Check logs for details.\n";
            return 1;
        }

        std::cerr << "\n========================================\n";
        std::cerr << "Server is running!\n";
        std::cerr << "Press Ctrl+C to stop\n";
        std::cerr << "========================================\n\n";

        // Run main loop (blocks until shutdown)
        server.run();

        std::cerr << "\nServer shutdown complete.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
