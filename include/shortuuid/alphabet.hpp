#pragma once

#include <shortuuid/result.hpp>
#include <array>
#include <cstddef>
#include <string>

namespace shortuuid {

// Digits 1-9, uppercase without I and O, lowercase without l.
// The order defines digit values; changing it breaks existing codes.
inline constexpr const char DEFAULT_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Ordered set of distinct characters. Character at position i is digit i.
class Alphabet {
public:
    // The default 58-character alphabet
    Alphabet();

    // Fails with InvalidAlphabet for fewer than 2 characters or a repeat
    static Result<Alphabet> create(const std::string& chars);

    std::size_t size() const { return chars_.size(); }
    char at(std::size_t digit) const { return chars_[digit]; }
    const std::string& chars() const { return chars_; }

    // Digit value of c, or -1 if c is not part of the alphabet
    int index_of(char c) const {
        return index_[static_cast<unsigned char>(c)];
    }
    bool contains(char c) const { return index_of(c) >= 0; }

    bool operator==(const Alphabet& other) const { return chars_ == other.chars_; }
    bool operator!=(const Alphabet& other) const { return chars_ != other.chars_; }

private:
    explicit Alphabet(std::string chars);

    std::string chars_;
    std::array<int, 256> index_;
};

} // namespace shortuuid
