/*
 * parafetch/src/fetcher/integrity_verifier.cpp
 *
 * IntegrityVerifier (OpenSSL EVP)
 *
 * - IIntegrityVerifier: streaming digest for MD5, SHA-1, SHA-256 and SHA-512.
 * - verifyStream(): hashes a stream from offset 0 to EOF in fixed-size reads and compares
 *   the result with an expected hex digest.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace parafetch {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

const EVP_MD* digestFor(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
    }
    return nullptr;
}

std::string hexLower(std::span<const unsigned char> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::string asciiLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Streaming EVP digest. A failed OpenSSL call drops the context; finalize() then returns an
// empty hex string.
class EvpIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit EvpIntegrityVerifier(HashAlgo algo) { reset(algo); }

    void reset(HashAlgo algo) override {
        algo_ = algo;
        ctx_.reset(EVP_MD_CTX_new());
        const EVP_MD* md = digestFor(algo);
        if (ctx_ && (md == nullptr || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1)) {
            spdlog::debug("EVP_DigestInit_ex failed for {}", hashAlgoName(algo));
            ctx_.reset();
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!ctx_ || data.empty())
            return;
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            spdlog::debug("EVP_DigestUpdate failed; digest invalidated");
            ctx_.reset();
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = algo_;
        if (ctx_) {
            std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
            unsigned int len = 0;
            if (EVP_DigestFinal_ex(ctx_.get(), md.data(), &len) == 1)
                out.hex = hexLower(std::span<const unsigned char>(md.data(), len));
        }
        reset(algo_);
        return out;
    }

private:
    HashAlgo algo_{HashAlgo::Sha256};
    MdCtxPtr ctx_;
};

constexpr std::size_t kReadBufferBytes = 64 * 1024;

} // namespace

Expected<HashAlgo> parseHashAlgo(std::string_view name) {
    const auto n = asciiLower(name);
    if (n == "md5")
        return HashAlgo::Md5;
    if (n == "sha1")
        return HashAlgo::Sha1;
    if (n == "sha256")
        return HashAlgo::Sha256;
    if (n == "sha512")
        return HashAlgo::Sha512;
    return Error{ErrorCode::UnsupportedAlgorithm,
                 "unsupported hashing algorithm: " + std::string(name)};
}

const char* hashAlgoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha1:
            return "sha1";
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
    }
    return "unknown";
}

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<EvpIntegrityVerifier>(algo);
}

Expected<Checksum> verifyStream(std::istream& in, std::string_view algorithm,
                                std::string_view expectedHex) {
    auto algo = parseHashAlgo(algorithm);
    if (!algo.ok())
        return algo.error();

    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot rewind stream for verification"};
    }

    auto verifier = makeIntegrityVerifier(algo.value());
    std::vector<char> buf(kReadBufferBytes);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0)
            break;
        verifier->update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buf.data()),
                                                    static_cast<std::size_t>(got)));
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "read failed during verification"};
    }

    auto digest = verifier->finalize();
    if (digest.hex.empty()) {
        return Error{ErrorCode::IoError, "failed to finalize checksum"};
    }

    const auto expected = asciiLower(expectedHex);
    if (digest.hex != expected) {
        return Error{ErrorCode::IntegrityMismatch, "checksum does not match: found " + digest.hex +
                                                       ", expected " + expected};
    }
    spdlog::debug("{} digest verified: {}", hashAlgoName(digest.algo), digest.hex);
    return digest;
}

} // namespace parafetch
