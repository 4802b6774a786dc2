#pragma once

/*
 * parafetch - Public Types and Fetcher Interfaces (C++20)
 *
 * This header defines the public data types, the component entry points and
 * the abstract interfaces of the chunked-download engine.
 *
 * Design principles:
 * - One remote resource per fetch, optionally split into concurrent byte ranges
 * - Chunk files are resumable across process restarts
 * - Progress is streamed to a sink without blocking the transfer
 * - Clear separation of concerns (HTTP adapter, range planning, chunk fetch, assembly,
 *   change-token cache, integrity verification)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parafetch {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Md5,
    Sha1,
    Sha256,
    Sha512
};

/**
 * Whether a cached change token must be confirmed against the server on every fetch.
 */
enum class TokenRevalidation { Always, TrustCached };

/**
 * Canonical error codes for fetch operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidConfiguration,
    UpstreamError,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    IoError,
    PartialTransferError,
    AssemblyError,
    UnsupportedAlgorithm,
    IntegrityMismatch,
    Unknown
};

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::UpstreamError: return "UpstreamError";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::TlsVerificationFailed: return "TlsVerificationFailed";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::PartialTransferError: return "PartialTransferError";
        case ErrorCode::AssemblyError: return "AssemblyError";
        case ErrorCode::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case ErrorCode::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

// Bytes below which a transfer is never split.
inline constexpr std::int64_t kDefaultMinParallelBytes = 64 * 1024;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Expected digest for end-to-end verification. The algorithm is kept by name
 * ("md5", "sha1", "sha256", "sha512") and resolved when the fetcher is built.
 */
struct IntegritySpec {
    std::string algorithm;
    std::string expectedHex;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Options applied to every HTTP call of one fetch.
 */
struct RequestOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{0}; // 0 = no limit
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Fetcher configuration. Validated once by makeFetcher() and immutable afterwards.
 */
struct FetcherConfig {
    std::filesystem::path destDir{"."};
    int concurrency{1};
    bool trackChangeTokens{false};
    TokenRevalidation tokenRevalidation{TokenRevalidation::Always};
    std::chrono::milliseconds timeout{0};
    std::optional<IntegritySpec> integrity;
    std::filesystem::path cacheRoot; // empty = config::default_cache_root()
    std::int64_t minParallelBytes{kDefaultMinParallelBytes};
    std::vector<Header> headers;
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Server metadata captured by the preflight request.
 */
struct ContentMetadata {
    std::int64_t totalLength{-1}; // -1 = unknown (no Content-Length)
    bool acceptsRanges{false};
    std::string changeToken;      // ETag without quotes; empty when absent
    std::optional<std::string> lastModified;
    int httpStatus{0};
};

/**
 * One contiguous part of the resource: [start, end). end == -1 when the length is unknown.
 */
struct ByteRange {
    std::size_t index{0};
    std::int64_t start{0};
    std::int64_t end{-1};

    [[nodiscard]] bool bounded() const noexcept { return end >= 0; }
    [[nodiscard]] std::int64_t width() const noexcept { return bounded() ? end - start : -1; }
};

/**
 * Progress report. writtenBytes is the size of one write, not a running total.
 */
struct ProgressReport {
    std::int64_t total{-1};
    std::int64_t writtenBytes{0};
};

/**
 * Per-range failure carried by a PartialTransferError.
 */
struct RangeError {
    std::size_t index{0};
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
    std::vector<RangeError> ranges{};
};

/**
 * Downloaded file handed back to the caller, open for reading at offset 0.
 */
struct FetchedFile {
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
    std::unique_ptr<std::fstream> stream;
    bool fromCache{false};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Destination of progress reports. send() may be called from several worker threads at
 * once; implementations must be safe for that. close() is called exactly once per fetch,
 * after every worker has finished.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void send(const ProgressReport& report) = 0;
    virtual void close() = 0;
};

/**
 * HTTP adapter abstraction (libcurl-based implementation in http_adapter_curl.cpp).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * HEAD request. Fails with UpstreamError on a non-2xx status.
     */
    virtual Expected<ContentMetadata> probe(std::string_view url,
                                            const RequestOptions& options) = 0;

    /**
     * GET of [offset, offset+size) streamed to sink; size == 0 requests an open-ended
     * range (bytes=offset-). The sink may be called many times on the calling thread.
     * Fails with UpstreamError on a non-2xx status, and when offset > 0 but the server
     * answered 200 instead of 206. No byte reaches the sink in either case.
     */
    virtual Expected<void> fetchRange(std::string_view url, std::uint64_t offset,
                                      std::uint64_t size, const RequestOptions& options,
                                      const ByteSink& sink) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Change-token markers under an explicitly injected cache root.
 * Layout: <root>/<resourceKey>/<token>, one empty file per completed token.
 */
class ChangeTokenCache {
public:
    ChangeTokenCache(std::filesystem::path root, bool enabled);

    /**
     * True only when tracking is enabled, the token is non-empty, its marker exists and
     * localFile has exactly expectedLength bytes.
     */
    [[nodiscard]] bool shouldSkip(std::string_view resourceKey, std::string_view token,
                                  const std::filesystem::path& localFile,
                                  std::int64_t expectedLength) const;

    // No-op when disabled or when token is empty.
    Expected<void> record(std::string_view resourceKey, std::string_view token);

    [[nodiscard]] bool hasAnyEntry(std::string_view resourceKey) const;

    [[nodiscard]] std::filesystem::path markerPath(std::string_view resourceKey,
                                                   std::string_view token) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    bool enabled_{false};
};

/**
 * Orchestrator: preflight, cache check, planning, concurrent chunk download, assembly and
 * verification for one URL per call.
 */
class IFetcher {
public:
    virtual ~IFetcher() = default;

    /**
     * Downloads url into the configured destination directory. progress may be null; when
     * set it is closed exactly once before fetch() returns, on success and on failure.
     */
    virtual Expected<FetchedFile> fetch(std::string_view url, IProgressSink* progress) = 0;

    [[nodiscard]] virtual const FetcherConfig& config() const = 0;
};

// ======================
// Component entry points
// ======================

struct ChunkRequest {
    std::string url;
    std::filesystem::path tempPath;
    ByteRange range;
    std::int64_t total{-1}; // reported in every ProgressReport
    bool resumable{true};   // server honors Range
    RequestOptions options;
};

struct ChunkOutcome {
    std::int64_t resumedBytes{0};
    std::int64_t fetchedBytes{0};
    bool networkUsed{false};
};

/**
 * Splits [0, totalLength) into ordered, contiguous ranges. totalLength < 0 yields one
 * open-ended range. Fails with InvalidConfiguration when concurrency < 1.
 */
Expected<std::vector<ByteRange>> planRanges(std::int64_t totalLength, int concurrency);

/**
 * Downloads one range into request.tempPath, resuming whatever is already on disk.
 */
Expected<ChunkOutcome> fetchChunk(IHttpAdapter& http, const ChunkRequest& request,
                                  IProgressSink* progress);

/**
 * Concatenates chunkDir/0 .. chunkDir/(rangeCount-1) into destination, removes chunkDir
 * and returns the destination open at offset 0.
 */
Expected<FetchedFile> assembleChunks(const std::filesystem::path& destination,
                                     const std::filesystem::path& chunkDir,
                                     std::size_t rangeCount);

/**
 * Maps "md5", "sha1", "sha256", "sha512" (any case) to HashAlgo.
 */
Expected<HashAlgo> parseHashAlgo(std::string_view name);

[[nodiscard]] const char* hashAlgoName(HashAlgo algo) noexcept;

/**
 * Hashes in from offset 0 to EOF and compares with expectedHex. Leaves the stream at EOF.
 */
Expected<Checksum> verifyStream(std::istream& in, std::string_view algorithm,
                                std::string_view expectedHex);

/**
 * Last path segment of url without query or fragment; "index" when empty.
 */
[[nodiscard]] std::string resourceNameForUrl(std::string_view url);

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo);

/**
 * Validates config and builds the default fetcher. A null http selects libcurl.
 */
Expected<std::unique_ptr<IFetcher>> makeFetcher(const FetcherConfig& config,
                                                std::unique_ptr<IHttpAdapter> http = nullptr);

} // namespace parafetch
