#include <shortuuid/short_uuid.hpp>
#include <shortuuid/codec.hpp>

namespace shortuuid {

ShortUuid::ShortUuid(std::string code)
    : code_(std::move(code)) {}

ShortUuid::ShortUuid(std::string code, Alphabet alphabet)
    : code_(std::move(code)), alphabet_(std::move(alphabet)) {}

ShortUuid ShortUuid::random() {
    return random(Alphabet());
}

ShortUuid ShortUuid::random(const Alphabet& alphabet) {
    return encode(Uuid::v4(), alphabet);
}

ShortUuid ShortUuid::encode(const Uuid& uuid) {
    return encode(uuid, Alphabet());
}

ShortUuid ShortUuid::encode(const Uuid& uuid, const Alphabet& alphabet) {
    return encode(uuid, alphabet, default_length(alphabet));
}

ShortUuid ShortUuid::encode(const Uuid& uuid, const Alphabet& alphabet, std::size_t length) {
    return ShortUuid(shortuuid::encode(uuid, alphabet, length), alphabet);
}

Result<ShortUuid> ShortUuid::encode(const Uuid& uuid, const std::string& alphabet,
                                    std::size_t length) {
    return Alphabet::create(alphabet).map([&](const Alphabet& a) {
        return encode(uuid, a, length);
    });
}

Result<Uuid> ShortUuid::decode() const {
    return shortuuid::decode(code_, alphabet_);
}

Result<Uuid> ShortUuid::decode(const std::string& code) {
    return shortuuid::decode(code, Alphabet());
}

Result<Uuid> ShortUuid::decode(const std::string& code, const Alphabet& alphabet) {
    return shortuuid::decode(code, alphabet);
}

std::ostream& operator<<(std::ostream& os, const ShortUuid& s) {
    return os << s.str();
}

} // namespace shortuuid
