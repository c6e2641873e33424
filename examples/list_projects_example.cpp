#include "numscull/client.hpp"
#include "numscull/config.hpp"
#include "numscull/control.hpp"
#include "numscull/errors.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

// Connects to a Numscull server and prints its projects.
//
// Connection settings come from the environment:
//   NUMSCULL_HOST, NUMSCULL_PORT, NUMSCULL_IDENTITY, NUMSCULL_CONFIG_DIR,
//   NUMSCULL_SYNC_TIMEOUT (ms), NUMSCULL_VERBOSE

int main() {
    try {
        // 1. Configuration
        Numscull::ClientConfig base;
        if (const char* home = std::getenv("HOME")) {
            base.config_dir = std::string(home) + "/.numscull";
        }
        const auto config = Numscull::ClientConfig::from_env(base);

        // 2. Handshake
        auto client = Numscull::Client::connect_and_handshake(config);
        std::cout << "Connected to " << config.host << ":" << config.port << " as " << config.identity << std::endl;

        // 3. Request
        auto result = Numscull::control::list_projects(*client);
        const auto& projects = result["projects"];
        if (projects.empty()) {
            std::cout << "No projects." << std::endl;
        }
        for (const auto& project : projects) {
            std::cout << "  " << project.value("name", "?") << "  " << project.value("repository", "")
                      << "  (owner " << project.value("ownerIdentity", "?") << ")" << std::endl;
        }

        // 4. Leave
        Numscull::control::exit(*client);
    } catch (const Numscull::RemoteError& e) {
        std::cerr << "Server error: " << e.reason() << std::endl;
        return 1;
    } catch (const Numscull::Exception& e) {
        std::cerr << "[" << Numscull::to_string(e.kind()) << "] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
