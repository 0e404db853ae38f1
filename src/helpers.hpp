#ifndef CONSENT_HELPERS_HPP
#define CONSENT_HELPERS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace consent {

using Bytes = std::vector<uint8_t>;

// Server timestamps carry microsecond precision so that a stored value
// formats back to exactly the text that was hashed.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Injectable wall clock. Components never read the system clock directly.
using Clock = std::function<Timestamp()>;

Clock system_clock();

namespace utils {

    class DecodeError : public std::runtime_error {
    public:
        explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Safe to call from any thread, any number of times.
    void ensure_sodium_init();

    // Hex helpers
    std::string bytes_to_hex(const Bytes& bytes);
    Bytes hex_to_bytes(const std::string& hex);

    Bytes to_bytes(const std::string& s);

    // Base64 (libsodium codecs). Decoding throws DecodeError on malformed input.
    std::string base64_encode(const Bytes& data);
    std::string base64url_encode(const Bytes& data, bool padded);
    Bytes base64_decode(const std::string& text);

    // Hash utilities (SHA-256)
    Bytes sha256(const Bytes& data);
    std::string sha256_hex(const std::string& text);

    // Cryptographically secure randomness
    Bytes random_bytes(std::size_t len);

    // Random (version 4) UUID in canonical lowercase form
    std::string generate_uuid();
    bool is_uuid(const std::string& s);

    Timestamp now_utc();

    // ISO-8601 in UTC with an explicit "+00:00" offset. Microseconds are
    // printed only when non-zero.
    std::string format_timestamp(Timestamp ts);

    // Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff]" followed by "Z" or "+HH:MM"/"-HH:MM".
    Timestamp parse_timestamp(const std::string& text);

} // namespace utils
} // namespace consent

#endif // CONSENT_HELPERS_HPP
