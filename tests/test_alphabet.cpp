#include <catch2/catch.hpp>
#include <shortuuid/alphabet.hpp>
#include <string>

using namespace shortuuid;

TEST_CASE("default alphabet has 58 unambiguous characters", "[alphabet]") {
    Alphabet a;
    REQUIRE(a.size() == 58);
    REQUIRE(a.chars() == "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz");
    for (char c : std::string("0OIl")) {
        REQUIRE_FALSE(a.contains(c));
    }
}

TEST_CASE("index_of returns the digit value", "[alphabet]") {
    Alphabet a;
    REQUIRE(a.index_of('1') == 0);
    REQUIRE(a.index_of('9') == 8);
    REQUIRE(a.index_of('A') == 9);
    REQUIRE(a.index_of('z') == 57);
    REQUIRE(a.at(0) == '1');
    REQUIRE(a.at(57) == 'z');
}

TEST_CASE("index_of returns -1 for unknown characters", "[alphabet]") {
    auto a = Alphabet::create("xyz").value();
    REQUIRE(a.index_of('a') == -1);
    REQUIRE(a.index_of('\0') == -1);
    REQUIRE(a.index_of(static_cast<char>(0xC3)) == -1);
}

TEST_CASE("create keeps caller order", "[alphabet]") {
    auto r = Alphabet::create("abcdef1234567890");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 16);
    REQUIRE(r.value().index_of('a') == 0);
    REQUIRE(r.value().index_of('1') == 6);
    REQUIRE(r.value().index_of('0') == 15);
}

TEST_CASE("create accepts non-ASCII bytes", "[alphabet]") {
    std::string chars = "ab";
    chars += static_cast<char>(0xFF);
    auto r = Alphabet::create(chars);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().index_of(static_cast<char>(0xFF)) == 2);
}

TEST_CASE("create rejects alphabets shorter than 2", "[alphabet]") {
    auto empty = Alphabet::create("");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == ShortUuidError::InvalidAlphabet);

    auto single = Alphabet::create("a");
    REQUIRE(single.is_err());
    REQUIRE(single.error().code == ShortUuidError::InvalidAlphabet);
}

TEST_CASE("create rejects duplicate characters", "[alphabet]") {
    auto r = Alphabet::create("abcdefa");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortUuidError::InvalidAlphabet);
    REQUIRE(r.error().message.find("'a'") != std::string::npos);
    REQUIRE(r.error().hint == "positions 0 and 6");
}

TEST_CASE("alphabet is a private copy", "[alphabet]") {
    std::string chars = "0123456789";
    auto a = Alphabet::create(chars).value();
    chars[0] = 'x';
    REQUIRE(a.at(0) == '0');
    REQUIRE_FALSE(a.contains('x'));
}

TEST_CASE("alphabet equality compares characters in order", "[alphabet]") {
    auto a = Alphabet::create("abc").value();
    auto b = Alphabet::create("abc").value();
    auto c = Alphabet::create("cba").value();
    REQUIRE(a == b);
    REQUIRE(a != c);
}
