#include <shortuuid/codec.hpp>
#include <shortuuid/config.hpp>
#include <shortuuid/log.hpp>
#include <algorithm>
#include <cmath>

namespace shortuuid {

// ---- Big-endian 128-bit arithmetic on the UUID bytes ----
//
// Bases go up to 256 (one digit per possible char value), so every
// intermediate below fits comfortably in uint32_t.

static bool is_zero(const uint8_t* num, size_t len) {
    return std::all_of(num, num + len, [](uint8_t b) { return b == 0; });
}

// Divide num (in place) by base, return the remainder.
static uint32_t div_by(uint8_t* num, size_t len, uint32_t base) {
    uint32_t carry = 0;
    for (size_t i = 0; i < len; ++i) {
        uint32_t cur = carry * 256 + num[i];
        num[i] = static_cast<uint8_t>(cur / base);
        carry = cur % base;
    }
    return carry;
}

// num = num * base + digit. Returns false if the result needs more than len bytes.
static bool mul_add(uint8_t* num, size_t len, uint32_t base, uint32_t digit) {
    uint32_t carry = digit;
    for (size_t i = len; i-- > 0; ) {
        uint32_t cur = static_cast<uint32_t>(num[i]) * base + carry;
        num[i] = static_cast<uint8_t>(cur & 0xFF);
        carry = cur >> 8;
    }
    return carry == 0;
}

// ---- Length ----

Result<std::size_t> calculate_length(std::size_t alphabet_size) {
    if (alphabet_size < 2) {
        return ShortUuidError(ShortUuidError::InvalidArg,
            "cannot compute a code length for alphabet size " + std::to_string(alphabet_size),
            "an alphabet needs at least 2 characters");
    }
    double factor = std::log(256.0) / std::log(static_cast<double>(alphabet_size));
    return Result<std::size_t>::ok(static_cast<std::size_t>(std::ceil(factor * 16)));
}

std::size_t default_length(const Alphabet& alphabet) {
    return calculate_length(alphabet.size()).value();
}

// ---- Encode ----

std::string encode(const Uuid& uuid, const Alphabet& alphabet, std::size_t length) {
    auto base = static_cast<uint32_t>(alphabet.size());
    std::array<uint8_t, 16> work = uuid.bytes;

    std::string out;
    out.reserve(std::max(length, default_length(alphabet)));
    while (!is_zero(work.data(), work.size())) {
        out += alphabet.at(div_by(work.data(), work.size(), base));
    }

    if (out.size() < length) {
        out.append(length - out.size(), alphabet.at(0));
    } else if (out.size() > length) {
        log::debug("encode: keeping %zu of %zu digits for %s, high-order digits dropped",
                   length, out.size(), uuid.to_string().c_str());
        out.resize(length);
    }
    return out;
}

std::string encode(const Uuid& uuid, const Alphabet& alphabet) {
    return encode(uuid, alphabet, default_length(alphabet));
}

std::string encode(const Uuid& uuid) {
    return encode(uuid, Alphabet());
}

// ---- Decode ----

Result<Uuid> decode(const std::string& code, const Alphabet& alphabet) {
    auto base = static_cast<uint32_t>(alphabet.size());
    Uuid u;

    // Horner's rule from the most significant (last) character down.
    // The accumulator never shrinks, so an overflow at any step means
    // the whole code is out of range.
    for (size_t i = code.size(); i-- > 0; ) {
        int digit = alphabet.index_of(code[i]);
        if (digit < 0) {
            log::debug("decode: '%c' at position %zu is not in the alphabet", code[i], i);
            return ShortUuidError(ShortUuidError::InvalidCharacter,
                std::string("invalid character '") + code[i] + "' at position " + std::to_string(i),
                "every character must come from the alphabet used to encode");
        }
        if (!mul_add(u.bytes.data(), u.bytes.size(), base, static_cast<uint32_t>(digit))) {
            log::debug("decode: '%s' exceeds 128 bits in base %u", code.c_str(), base);
            return ShortUuidError(ShortUuidError::OutOfRange,
                "value out of range: '" + code + "' does not fit in 128 bits",
                "was it encoded with a different alphabet?");
        }
    }

    log::trace("decode: '%s' -> %s", code.c_str(), u.to_string().c_str());
    return Result<Uuid>::ok(u);
}

Result<Uuid> decode(const std::string& code) {
    return decode(code, Alphabet());
}

// ---- Codec ----

Codec::Codec() : Codec(Alphabet()) {}

Codec::Codec(Alphabet alphabet)
    : alphabet_(std::move(alphabet)), length_(default_length(alphabet_)) {}

Codec::Codec(Alphabet alphabet, std::size_t length)
    : alphabet_(std::move(alphabet)), length_(length) {}

Result<Codec> Codec::create(Alphabet alphabet, std::size_t length) {
    std::size_t lossless = default_length(alphabet);
    if (length < lossless) {
        log::warn("code length %zu is below %zu for a %zu-character alphabet, decoding may not restore the UUID",
                  length, lossless, alphabet.size());
    }
    return Result<Codec>::ok(Codec(std::move(alphabet), length));
}

Result<Codec> Codec::from_config(const Config& cfg) {
    auto alphabet = Alphabet::create(cfg.codec.alphabet);
    SHORTUUID_TRY(alphabet);

    if (!cfg.codec.length) {
        return Result<Codec>::ok(Codec(std::move(alphabet).value()));
    }
    return create(std::move(alphabet).value(), *cfg.codec.length);
}

std::string Codec::encode(const Uuid& uuid) const {
    return shortuuid::encode(uuid, alphabet_, length_);
}

std::string Codec::random() const {
    return encode(Uuid::v4());
}

Result<Uuid> Codec::decode(const std::string& code) const {
    return shortuuid::decode(code, alphabet_);
}

} // namespace shortuuid
