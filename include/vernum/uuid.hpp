#pragma once

#include <vernum/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace vernum {

// RFC 4122 version-4 UUID identifying a toolbox record
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
};

} // namespace vernum
