#include "helpers.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sodium.h>

namespace consent {

Clock system_clock() {
    return [] { return utils::now_utc(); };
}

namespace utils {

void ensure_sodium_init() {
    static const int rc = sodium_init();
    if (rc < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

namespace {

int parse_digits(const std::string& s, std::size_t off, std::size_t n) {
    if (off + n > s.size()) throw DecodeError("timestamp: truncated");
    int v = 0;
    for (std::size_t i = off; i < off + n; ++i) {
        char c = s[i];
        if (c < '0' || c > '9') throw DecodeError("timestamp: expected digit");
        v = v * 10 + (c - '0');
    }
    return v;
}

void expect_char(const std::string& s, std::size_t off, char c) {
    if (off >= s.size() || s[off] != c) {
        throw DecodeError(std::string("timestamp: expected '") + c + "'");
    }
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) throw DecodeError("Hex string length must be even.");
    Bytes bytes(hex.length() / 2);
    size_t bin_len = 0;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != bytes.size()) {
        throw DecodeError("Invalid hex string.");
    }
    return bytes;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

static std::string encode_variant(const Bytes& data, int variant) {
    ensure_sodium_init();
    std::string out(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), variant);
    out.resize(out.size() - 1); // drop the terminating NUL
    return out;
}

std::string base64_encode(const Bytes& data) {
    return encode_variant(data, sodium_base64_VARIANT_ORIGINAL);
}

std::string base64url_encode(const Bytes& data, bool padded) {
    return encode_variant(data, padded ? sodium_base64_VARIANT_URLSAFE
                                       : sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

Bytes base64_decode(const std::string& text) {
    ensure_sodium_init();
    Bytes out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        throw DecodeError("Invalid base64 input");
    }
    out.resize(bin_len);
    return out;
}

Bytes sha256(const Bytes& data) {
    ensure_sodium_init();
    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

std::string sha256_hex(const std::string& text) {
    return bytes_to_hex(sha256(to_bytes(text)));
}

Bytes random_bytes(std::size_t len) {
    ensure_sodium_init();
    Bytes data(len);
    randombytes_buf(data.data(), data.size());
    return data;
}

std::string generate_uuid() {
    Bytes b = random_bytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80); // RFC 4122 variant
    std::string hex = bytes_to_hex(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool is_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;
    auto secs = floor<seconds>(ts);
    auto micros = (ts - secs).count();

    std::time_t t = system_clock::to_time_t(time_point_cast<system_clock::duration>(secs));
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm_utc.tm_year + 1900) << "-"
        << std::setw(2) << (tm_utc.tm_mon + 1) << "-"
        << std::setw(2) << tm_utc.tm_mday << "T"
        << std::setw(2) << tm_utc.tm_hour << ":"
        << std::setw(2) << tm_utc.tm_min << ":"
        << std::setw(2) << tm_utc.tm_sec;
    if (micros != 0) {
        oss << "." << std::setw(6) << micros;
    }
    oss << "+00:00";
    return oss.str();
}

Timestamp parse_timestamp(const std::string& s) {
    int year  = parse_digits(s, 0, 4);
    expect_char(s, 4, '-');
    int month = parse_digits(s, 5, 2);
    expect_char(s, 7, '-');
    int day   = parse_digits(s, 8, 2);
    if (s.size() <= 10 || (s[10] != 'T' && s[10] != ' ')) {
        throw DecodeError("timestamp: expected 'T'");
    }
    int hour = parse_digits(s, 11, 2);
    expect_char(s, 13, ':');
    int min  = parse_digits(s, 14, 2);
    expect_char(s, 16, ':');
    int sec  = parse_digits(s, 17, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 59) {
        throw DecodeError("timestamp: field out of range");
    }

    std::size_t off = 19;
    int64_t micros = 0;
    if (off < s.size() && s[off] == '.') {
        ++off;
        int digits = 0;
        while (off < s.size() && s[off] >= '0' && s[off] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (s[off] - '0');
                ++digits;
            }
            ++off;
        }
        if (digits == 0) throw DecodeError("timestamp: empty fraction");
        for (; digits < 6; ++digits) micros *= 10;
    }

    int64_t offset_secs = 0;
    if (off < s.size() && s[off] == 'Z') {
        ++off;
    } else if (off < s.size() && (s[off] == '+' || s[off] == '-')) {
        int sign = s[off] == '-' ? -1 : 1;
        int oh = parse_digits(s, off + 1, 2);
        expect_char(s, off + 3, ':');
        int om = parse_digits(s, off + 4, 2);
        offset_secs = sign * (oh * 3600 + om * 60);
        off += 6;
    } else {
        throw DecodeError("timestamp: missing UTC offset");
    }
    if (off != s.size()) throw DecodeError("timestamp: trailing characters");

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t epoch_secs = days * 86400 + hour * 3600 + min * 60 + sec - offset_secs;
    return Timestamp(std::chrono::microseconds(epoch_secs * 1000000 + micros));
}

} // namespace utils
} // namespace consent
