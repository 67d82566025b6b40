#include <catch2/catch_test_macros.hpp>
#include "codebox/core/base64.hpp"

using namespace codebox::core;

TEST_CASE("Base64 encodes known vectors", "[base64]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("print(1+1)") == "cHJpbnQoMSsxKQ==");
}

TEST_CASE("Base64 round-trips shell metacharacters", "[base64]") {
    const std::string code = "echo 'quoted' `date` $(whoami) \"$HOME\"\nprint('a;b|c&d')\n\t\\n";

    auto encoded = base64_encode(code);
    REQUIRE(encoded.find('\'') == std::string::npos);
    REQUIRE(encoded.find('$') == std::string::npos);
    REQUIRE(encoded.find('\n') == std::string::npos);

    auto decoded = base64_decode(encoded);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value() == code);
}

TEST_CASE("Base64 round-trips binary bytes", "[base64]") {
    std::string bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<char>(i));
    }

    auto decoded = base64_decode(base64_encode(bytes));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value() == bytes);
}

TEST_CASE("Base64 decode rejects malformed input", "[base64]") {
    REQUIRE(base64_decode("abc").is_err());
    REQUIRE(base64_decode("ab$=").is_err());
    REQUIRE(base64_decode("a===").is_err());
    REQUIRE(base64_decode("Zg==Zm9v").is_err());
    REQUIRE(base64_decode("Z=g=").is_err());
    REQUIRE(base64_decode("Zg==").value() == "f");
}
