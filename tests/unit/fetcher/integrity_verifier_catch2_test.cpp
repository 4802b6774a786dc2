// IntegrityVerifier: OpenSSL digests, algorithm names and mismatch reporting.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <parafetch/fetcher/fetcher.hpp>

#include "../../support/fetch_fixtures.hpp"

#include <cctype>
#include <cstddef>
#include <span>
#include <sstream>
#include <string>

using namespace parafetch;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr const char* kAbcMd5 = "900150983cd24fb0d6963f7d28e17f72";
constexpr const char* kAbcSha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kAbcSha512 =
    "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
    "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f";

} // namespace

TEST_CASE("IntegrityVerifier known digests", "[fetcher][integrity]") {
    struct Case {
        const char* name;
        const char* hex;
    };
    const Case cases[] = {{"md5", kAbcMd5}, {"sha1", kAbcSha1}, {"sha256", kAbcSha256},
                          {"sha512", kAbcSha512}};

    for (const auto& c : cases) {
        std::istringstream in("abc");
        auto r = verifyStream(in, c.name, c.hex);
        INFO(c.name);
        REQUIRE(r.ok());
        CHECK(r.value().hex == c.hex);
        CHECK(std::string(hashAlgoName(r.value().algo)) == c.name);
    }
}

TEST_CASE("IntegrityVerifier is case-insensitive", "[fetcher][integrity]") {
    std::string upper = kAbcSha256;
    for (auto& ch : upper)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    std::istringstream in("abc");
    auto r = verifyStream(in, "SHA256", upper);
    REQUIRE(r.ok());
    CHECK(r.value().hex == kAbcSha256);
}

TEST_CASE("IntegrityVerifier rewinds before hashing", "[fetcher][integrity]") {
    std::istringstream in("abc");
    std::string sink;
    in >> sink; // leaves the stream at EOF
    auto r = verifyStream(in, "md5", kAbcMd5);
    CHECK(r.ok());
}

TEST_CASE("IntegrityVerifier mismatch carries both digests", "[fetcher][integrity]") {
    std::istringstream in("abd");
    auto r = verifyStream(in, "sha256", kAbcSha256);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::IntegrityMismatch);
    CHECK_THAT(r.error().message, ContainsSubstring(kAbcSha256));
    CHECK_THAT(r.error().message, ContainsSubstring("found "));
}

TEST_CASE("IntegrityVerifier unsupported algorithm", "[fetcher][integrity]") {
    std::istringstream in("abc");
    auto r = verifyStream(in, "crc32", "352441c2");
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::UnsupportedAlgorithm);

    CHECK_FALSE(parseHashAlgo("").ok());
    CHECK_FALSE(parseHashAlgo("sha-256").ok());
    REQUIRE(parseHashAlgo("Sha512").ok());
    CHECK(parseHashAlgo("Sha512").value() == HashAlgo::Sha512);
}

TEST_CASE("IntegrityVerifier streams across buffer boundaries", "[fetcher][integrity]") {
    const auto body = test_support::make_payload(300000);

    auto verifier = makeIntegrityVerifier(HashAlgo::Sha256);
    const std::span<const std::byte> all(body);
    // Uneven update sizes must hash the same as one pass over the stream.
    verifier->update(all.subspan(0, 1));
    verifier->update(all.subspan(1, 70000));
    verifier->update(all.subspan(70001));
    const auto incremental = verifier->finalize();
    CHECK(incremental.hex ==
          "28d7101af685c2cead6215a2ad05421bef3afa37364a21ba48e31a11ba118d08");

    std::string raw(reinterpret_cast<const char*>(body.data()), body.size());
    std::istringstream in(raw);
    auto r = verifyStream(in, "sha256", incremental.hex);
    CHECK(r.ok());

    // finalize() leaves the verifier ready for another digest.
    verifier->update(std::as_bytes(std::span<const char>("abc", 3)));
    CHECK(verifier->finalize().hex == kAbcSha256);
}
