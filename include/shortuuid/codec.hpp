#pragma once

#include <shortuuid/alphabet.hpp>
#include <shortuuid/result.hpp>
#include <shortuuid/uuid.hpp>
#include <cstddef>
#include <string>

namespace shortuuid {

struct Config;

// Shortest code length that holds all 128 bits in the given base:
// ceil(16 * log(256) / log(alphabet_size)). Sizes below 2 are InvalidArg.
Result<std::size_t> calculate_length(std::size_t alphabet_size);

// calculate_length() for an alphabet that is already known to be valid
std::size_t default_length(const Alphabet& alphabet);

// Base-N encoding, least-significant digit first.
//
// Short results are padded at the tail with alphabet[0]; long results keep
// their first `length` characters, which drops the high-order digits. A
// length below default_length() can therefore lose information.
std::string encode(const Uuid& uuid, const Alphabet& alphabet, std::size_t length);
std::string encode(const Uuid& uuid, const Alphabet& alphabet);
std::string encode(const Uuid& uuid);

// Inverse of encode(). Character i contributes index_of(code[i]) * b^i.
// Fails with InvalidCharacter for a character outside the alphabet and
// with OutOfRange when the value does not fit in 128 bits. The empty
// code decodes to the nil UUID.
Result<Uuid> decode(const std::string& code, const Alphabet& alphabet);
Result<Uuid> decode(const std::string& code);

// An alphabet and an output length bound together
class Codec {
public:
    Codec();
    explicit Codec(Alphabet alphabet);

    static Result<Codec> create(Alphabet alphabet, std::size_t length);
    static Result<Codec> from_config(const Config& cfg);

    std::string encode(const Uuid& uuid) const;
    std::string random() const;
    Result<Uuid> decode(const std::string& code) const;

    const Alphabet& alphabet() const { return alphabet_; }
    std::size_t length() const { return length_; }

private:
    Codec(Alphabet alphabet, std::size_t length);

    Alphabet alphabet_;
    std::size_t length_;
};

} // namespace shortuuid
