#include "numscull/config.hpp"

#include <cstdlib>
#include <limits>

#include "numscull/errors.hpp"

namespace Numscull {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

unsigned long long parse_unsigned(const char* name, const std::string& text, unsigned long long max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw InvalidArgument(std::string(name) + " must be a non-negative integer, got \"" + text + "\"");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw InvalidArgument(std::string(name) + " is out of range: " + text);
    }
    if (value > max) {
        throw InvalidArgument(std::string(name) + " is out of range: " + text);
    }
    return value;
}

} // namespace

ClientConfig ClientConfig::from_env(ClientConfig base) {
    if (const char* host = env("NUMSCULL_HOST")) {
        base.host = host;
    }
    if (const char* port = env("NUMSCULL_PORT")) {
        base.port = static_cast<uint16_t>(parse_unsigned("NUMSCULL_PORT", port, std::numeric_limits<uint16_t>::max()));
    }
    if (const char* identity = env("NUMSCULL_IDENTITY")) {
        base.identity = identity;
    }
    if (const char* config_dir = env("NUMSCULL_CONFIG_DIR")) {
        base.config_dir = config_dir;
    }
    if (const char* version = env("NUMSCULL_VERSION")) {
        base.version = version;
    }
    if (const char* timeout = env("NUMSCULL_SYNC_TIMEOUT")) {
        base.io_timeout = std::chrono::milliseconds(
            parse_unsigned("NUMSCULL_SYNC_TIMEOUT", timeout, std::numeric_limits<int32_t>::max()));
    }
    if (const char* verbose = env("NUMSCULL_VERBOSE")) {
        const std::string value = verbose;
        base.verbose = !(value == "0" || value == "false" || value == "no");
    }

    if (base.identity.empty()) {
        const char* user = env("USER");
        base.identity = user ? user : "unknown";
    }
    return base;
}

} // namespace Numscull
