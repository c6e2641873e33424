#ifndef NUMSCULL_CONFIG_HPP
#define NUMSCULL_CONFIG_HPP

#include "version.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace Numscull {

    /**
     * @brief Everything the engine needs to open a session.
     */
    struct ClientConfig {
        std::string host = "127.0.0.1";
        uint16_t port = 5000;
        std::string identity;
        // Directory holding identities/<identity>.
        std::string config_dir;
        std::string version = DEFAULT_PROTOCOL_VERSION;
        // Deadline for each blocking read/write. Zero waits forever.
        std::chrono::milliseconds io_timeout{8000};
        // Trace handshake steps and requests to stderr.
        bool verbose = false;

        /**
         * @brief Overlays NUMSCULL_HOST, NUMSCULL_PORT, NUMSCULL_IDENTITY,
         * NUMSCULL_CONFIG_DIR, NUMSCULL_VERSION, NUMSCULL_SYNC_TIMEOUT (ms) and
         * NUMSCULL_VERBOSE on top of base. An empty identity falls back to $USER,
         * then "unknown".
         * @throws InvalidArgument if a numeric variable does not parse.
         */
        static ClientConfig from_env(ClientConfig base);
        static ClientConfig from_env();
    };

    inline ClientConfig ClientConfig::from_env() {
        return from_env(ClientConfig());
    }

} // namespace Numscull

#endif // NUMSCULL_CONFIG_HPP
