#include <shortuuid/alphabet.hpp>

namespace shortuuid {

Alphabet::Alphabet() : Alphabet(std::string(DEFAULT_ALPHABET)) {}

Alphabet::Alphabet(std::string chars) : chars_(std::move(chars)) {
    index_.fill(-1);
    for (size_t i = 0; i < chars_.size(); ++i) {
        index_[static_cast<unsigned char>(chars_[i])] = static_cast<int>(i);
    }
}

Result<Alphabet> Alphabet::create(const std::string& chars) {
    if (chars.size() < 2) {
        return ShortUuidError(ShortUuidError::InvalidAlphabet,
            "alphabet must have at least 2 characters, got " + std::to_string(chars.size()));
    }

    // A char type holds at most 256 distinct values, so a longer
    // alphabet always trips the duplicate check below.
    std::array<int, 256> first_seen;
    first_seen.fill(-1);
    for (size_t i = 0; i < chars.size(); ++i) {
        auto slot = static_cast<unsigned char>(chars[i]);
        if (first_seen[slot] >= 0) {
            return ShortUuidError(ShortUuidError::InvalidAlphabet,
                std::string("alphabet contains duplicate character '") + chars[i] + "'",
                "positions " + std::to_string(first_seen[slot]) + " and " + std::to_string(i));
        }
        first_seen[slot] = static_cast<int>(i);
    }

    return Result<Alphabet>::ok(Alphabet(chars));
}

} // namespace shortuuid
