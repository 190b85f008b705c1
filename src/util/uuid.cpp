#include <vernum/uuid.hpp>
#include <fstream>
#include <random>

namespace vernum {

// /dev/urandom, falling back to mt19937_64 seeded from random_device
static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), u.bytes.size());
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;  // version 4
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;  // variant 1
    return u;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (is_dash_position(out.size())) out += '-';
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return VernumError{VernumError::Parse,
            "UUID string must be 36 characters", s,
            "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"};
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size();) {
        if (is_dash_position(i)) {
            if (s[i] != '-') {
                return VernumError{VernumError::Parse,
                    "UUID string has invalid dash positions", s,
                    "expected dashes at positions 8, 13, 18, 23"};
            }
            ++i;
            continue;
        }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return VernumError{VernumError::Parse,
                "UUID string contains invalid hex character", s,
                "invalid character at position " + std::to_string(i)};
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

} // namespace vernum
