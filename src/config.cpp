#include "config.hpp"

#include <cstdlib>
#include <map>
#include <sstream>

namespace consent {

namespace {

constexpr const char* KEY_SIGNING_KEY   = "CONSENT_PIN_SIGNING_KEY";
constexpr const char* KEY_PIN_TTL       = "CONSENT_PIN_TTL_SECONDS";
constexpr const char* KEY_QUERY_DEFAULT = "CONSENT_AUDIT_QUERY_DEFAULT_LIMIT";
constexpr const char* KEY_QUERY_MAX     = "CONSENT_AUDIT_QUERY_MAX_LIMIT";
constexpr const char* KEY_LOG_LEVEL     = "CONSENT_LOG_LEVEL";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        std::size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw ConfigError(key + ": trailing characters");
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(key + ": not an integer: " + value);
    }
}

CoreConfig from_map(const std::map<std::string, std::string>& values) {
    CoreConfig config;

    auto it = values.find(KEY_SIGNING_KEY);
    if (it != values.end()) {
        try {
            config.pin_signing_key = utils::hex_to_bytes(it->second);
        } catch (const utils::DecodeError& e) {
            throw ConfigError(std::string(KEY_SIGNING_KEY) + ": " + e.what());
        }
    }
    if ((it = values.find(KEY_PIN_TTL)) != values.end()) {
        config.pin_ttl_seconds = parse_int(it->first, it->second);
    }
    if ((it = values.find(KEY_QUERY_DEFAULT)) != values.end()) {
        config.audit_query_default_limit = parse_int(it->first, it->second);
    }
    if ((it = values.find(KEY_QUERY_MAX)) != values.end()) {
        config.audit_query_max_limit = parse_int(it->first, it->second);
    }
    if ((it = values.find(KEY_LOG_LEVEL)) != values.end()) {
        try {
            config.log_level = log::parse_level(it->second);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string(KEY_LOG_LEVEL) + ": " + e.what());
        }
    }
    return config;
}

} // namespace

Status CoreConfig::validate() const {
    if (pin_signing_key.size() < MIN_SIGNING_KEY_SIZE) {
        return make_error(ErrorKind::InvalidArgument,
                          "PIN signing key must be at least " +
                          std::to_string(MIN_SIGNING_KEY_SIZE) + " bytes");
    }
    if (pin_ttl_seconds <= 0) {
        return make_error(ErrorKind::InvalidArgument, "PIN TTL must be positive");
    }
    if (audit_query_max_limit <= 0 || audit_query_default_limit <= 0 ||
        audit_query_default_limit > audit_query_max_limit) {
        return make_error(ErrorKind::InvalidArgument, "Audit query limits are inconsistent");
    }
    return Status::Ok();
}

std::string CoreConfig::to_env_string() const {
    std::ostringstream oss;
    oss << KEY_SIGNING_KEY << "=" << utils::bytes_to_hex(pin_signing_key) << "\n";
    oss << KEY_PIN_TTL << "=" << pin_ttl_seconds << "\n";
    oss << KEY_QUERY_DEFAULT << "=" << audit_query_default_limit << "\n";
    oss << KEY_QUERY_MAX << "=" << audit_query_max_limit << "\n";
    oss << KEY_LOG_LEVEL << "=" << log::level_name(log_level) << "\n";
    return oss.str();
}

CoreConfig CoreConfig::from_env_string(const std::string& env_content) {
    std::map<std::string, std::string> values;
    std::istringstream in(env_content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Malformed config line: " + line);
        }
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return from_map(values);
}

CoreConfig CoreConfig::from_environment() {
    std::map<std::string, std::string> values;
    for (const char* key : {KEY_SIGNING_KEY, KEY_PIN_TTL, KEY_QUERY_DEFAULT, KEY_QUERY_MAX, KEY_LOG_LEVEL}) {
        const char* env = std::getenv(key);
        if (env && env[0]) values[key] = trim(env);
    }
    return from_map(values);
}

} // namespace consent
