#pragma once

#include <shortuuid/alphabet.hpp>
#include <shortuuid/result.hpp>
#include <shortuuid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace shortuuid {

// Immutable short code together with the alphabet it was written in.
// Equality and hashing only look at the code string.
class ShortUuid {
public:
    explicit ShortUuid(std::string code);
    ShortUuid(std::string code, Alphabet alphabet);

    static ShortUuid random();
    static ShortUuid random(const Alphabet& alphabet);

    static ShortUuid encode(const Uuid& uuid);
    static ShortUuid encode(const Uuid& uuid, const Alphabet& alphabet);
    static ShortUuid encode(const Uuid& uuid, const Alphabet& alphabet, std::size_t length);

    // Validates the raw alphabet first
    static Result<ShortUuid> encode(const Uuid& uuid, const std::string& alphabet,
                                    std::size_t length);

    Result<Uuid> decode() const;
    static Result<Uuid> decode(const std::string& code);
    static Result<Uuid> decode(const std::string& code, const Alphabet& alphabet);

    const std::string& str() const { return code_; }
    std::string to_string() const { return code_; }
    const Alphabet& alphabet() const { return alphabet_; }

    bool operator==(const ShortUuid& other) const { return code_ == other.code_; }
    bool operator!=(const ShortUuid& other) const { return code_ != other.code_; }

private:
    std::string code_;
    Alphabet alphabet_;
};

std::ostream& operator<<(std::ostream& os, const ShortUuid& s);

} // namespace shortuuid

namespace std {

template<>
struct hash<shortuuid::ShortUuid> {
    std::size_t operator()(const shortuuid::ShortUuid& s) const noexcept {
        return std::hash<std::string>{}(s.str());
    }
};

} // namespace std
