#pragma once

#include <shortuuid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace shortuuid {

// 128-bit UUID, bytes in big-endian (network) order
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();
    static Uuid nil();

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    bool is_nil() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace shortuuid

namespace std {

template<>
struct hash<shortuuid::Uuid> {
    std::size_t operator()(const shortuuid::Uuid& u) const noexcept;
};

} // namespace std
