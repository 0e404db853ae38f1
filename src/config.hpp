#ifndef CONSENT_CONFIG_HPP
#define CONSENT_CONFIG_HPP

#include "errors.hpp"
#include "helpers.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <string>

namespace consent {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

constexpr std::size_t MIN_SIGNING_KEY_SIZE = 32;

// -----------------------------------------------------------------------------
// CoreConfig - built once at process start, passed by reference
// -----------------------------------------------------------------------------
struct CoreConfig {
    // HMAC-SHA256 key for PIN signatures. Never persisted with PIN rows.
    Bytes pin_signing_key;

    // Default PIN lifetime when the issuer does not ask for one
    int pin_ttl_seconds = 60;

    // Audit query paging
    int audit_query_default_limit = 100;
    int audit_query_max_limit = 1000;

    log::Level log_level = log::Level::Info;

    // Rejects short signing keys and non-positive durations/limits.
    Status validate() const;

    // Serialize to environment variable format (KEY=value lines, key bytes hex-encoded)
    std::string to_env_string() const;

    // Deserialize from environment variable format. Unknown keys are ignored,
    // malformed values throw ConfigError.
    static CoreConfig from_env_string(const std::string& env_content);

    // Same keys, read from the process environment.
    static CoreConfig from_environment();
};

} // namespace consent

#endif // CONSENT_CONFIG_HPP
