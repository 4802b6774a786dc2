/*
 * parafetch/src/fetcher/http_adapter_curl.cpp
 *
 * libcurl easy-handle adapter.
 * - probe(): HEAD; Content-Length, Accept-Ranges, ETag and Last-Modified of the final hop.
 * - fetchRange(): GET with "Range: bytes=a-b" (or "bytes=a-"), body streamed to the sink.
 * - The status is vetted before the first body byte is handed out, so an error page or a
 *   full 200 body for a mid-file range never lands in a chunk file.
 *
 * Dependencies:
 * - CURL::libcurl
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace parafetch {

namespace {

std::string_view strip(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool is2xx(long status) {
    return status >= 200 && status < 300;
}

Error statusError(const char* op, long status) {
    Error err{ErrorCode::UpstreamError,
              std::string(op) + ": server answered HTTP " + std::to_string(status)};
    err.httpStatus = static_cast<int>(status);
    return err;
}

ErrorCode classify(CURLcode rc) {
    switch (rc) {
        case CURLE_OK:
            return ErrorCode::None;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            return ErrorCode::TlsVerificationFailed;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return ErrorCode::NetworkError;
        case CURLE_WRITE_ERROR:
            return ErrorCode::IoError;
        default:
            return ErrorCode::Unknown;
    }
}

Error transportError(const char* op, CURLcode rc) {
    return Error{classify(rc), std::string(op) + ": " + curl_easy_strerror(rc)};
}

// Response headers of the last hop seen so far.
struct ResponseHeaders {
    std::optional<std::int64_t> contentLength;
    bool byteRanges{false};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    void accept(std::string_view line) {
        line = strip(line);
        if (line.size() >= 5 && iequals(line.substr(0, 5), "HTTP/")) {
            // Status line of a new hop (redirect or 100-continue).
            *this = ResponseHeaders{};
            return;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
            return;
        const auto name = strip(line.substr(0, colon));
        const auto value = strip(line.substr(colon + 1));

        if (iequals(name, "content-length")) {
            std::int64_t n = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec == std::errc() && end == value.data() + value.size() && n >= 0)
                contentLength = n;
        } else if (iequals(name, "accept-ranges")) {
            byteRanges = iequals(value, "bytes");
        } else if (iequals(name, "etag")) {
            auto v = value;
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
                v = v.substr(1, v.size() - 2);
            etag = std::string(v);
        } else if (iequals(name, "last-modified")) {
            lastModified = std::string(value);
        }
    }
};

size_t onHeader(char* data, size_t size, size_t count, void* user) {
    const size_t n = size * count;
    static_cast<ResponseHeaders*>(user)->accept(std::string_view(data, n));
    return n;
}

struct BodyState {
    CURL* handle{nullptr};
    const ByteSink* sink{nullptr};
    bool expectPartial{false};
    bool vetted{false};
    long status{0};
    bool rejected{false};
    bool rangeIgnored{false};
    std::optional<Error> sinkError;
};

size_t onBody(char* data, size_t size, size_t count, void* user) {
    const size_t n = size * count;
    auto* st = static_cast<BodyState*>(user);
    if (n == 0)
        return 0;

    if (!st->vetted) {
        st->vetted = true;
        curl_easy_getinfo(st->handle, CURLINFO_RESPONSE_CODE, &st->status);
        if (!is2xx(st->status)) {
            st->rejected = true;
            return 0;
        }
        if (st->expectPartial && st->status != 206) {
            st->rangeIgnored = true;
            return 0;
        }
    }

    auto r = (*st->sink)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(data), n));
    if (!r.ok()) {
        st->sinkError = r.error();
        return 0;
    }
    return n;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;

SlistPtr headerList(const std::vector<Header>& headers, const std::string& extra) {
    curl_slist* list = nullptr;
    for (const auto& h : headers)
        list = curl_slist_append(list, (h.name + ": " + h.value).c_str());
    if (!extra.empty())
        list = curl_slist_append(list, extra.c_str());
    return SlistPtr(list);
}

void applyOptions(CURL* h, const RequestOptions& o) {
    if (o.timeout.count() > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(o.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long long>(o.timeout.count(), 30000)));
    }
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, o.followRedirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, o.tls.insecure ? 0L : 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, o.tls.insecure ? 0L : 2L);
    if (!o.tls.caPath.empty())
        curl_easy_setopt(h, CURLOPT_CAINFO, o.tls.caPath.c_str());
    if (o.proxy && !o.proxy->empty())
        curl_easy_setopt(h, CURLOPT_PROXY, o.proxy->c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    Expected<ContentMetadata> probe(std::string_view url, const RequestOptions& options) override {
        EasyPtr h(curl_easy_init());
        if (!h)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        const std::string target(url);
        auto headers = headerList(options.headers, {});
        ResponseHeaders resp;

        curl_easy_setopt(h.get(), CURLOPT_URL, target.c_str());
        curl_easy_setopt(h.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h.get(), CURLOPT_HEADERFUNCTION, onHeader);
        curl_easy_setopt(h.get(), CURLOPT_HEADERDATA, &resp);
        applyOptions(h.get(), options);

        if (CURLcode rc = curl_easy_perform(h.get()); rc != CURLE_OK)
            return transportError("HEAD", rc);

        long status = 0;
        curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
        if (!is2xx(status))
            return statusError("HEAD", status);

        ContentMetadata meta;
        meta.httpStatus = static_cast<int>(status);
        meta.totalLength = resp.contentLength.value_or(-1);
        meta.acceptsRanges = resp.byteRanges;
        meta.changeToken = resp.etag.value_or("");
        meta.lastModified = resp.lastModified;

        spdlog::debug("HEAD {} -> {} length={} ranges={} etag='{}'", target, status,
                      meta.totalLength, meta.acceptsRanges, meta.changeToken);
        return meta;
    }

    Expected<void> fetchRange(std::string_view url, std::uint64_t offset, std::uint64_t size,
                              const RequestOptions& options, const ByteSink& sink) override {
        EasyPtr h(curl_easy_init());
        if (!h)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        std::string range = "Range: bytes=" + std::to_string(offset) + "-";
        if (size > 0)
            range += std::to_string(offset + size - 1);

        const std::string target(url);
        auto headers = headerList(options.headers, range);

        BodyState st;
        st.handle = h.get();
        st.sink = &sink;
        st.expectPartial = offset > 0;

        curl_easy_setopt(h.get(), CURLOPT_URL, target.c_str());
        curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, onBody);
        curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &st);
        applyOptions(h.get(), options);

        spdlog::debug("GET {} [{}]", target, range);
        const CURLcode rc = curl_easy_perform(h.get());

        long status = st.status;
        if (!st.vetted)
            curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);

        if (st.sinkError)
            return *st.sinkError;
        if (st.rejected)
            return statusError("GET", status);
        if (st.rangeIgnored) {
            Error err{ErrorCode::UpstreamError, "GET: server ignored '" + range + "' (HTTP " +
                                                    std::to_string(status) + ")"};
            err.httpStatus = static_cast<int>(status);
            return err;
        }
        if (rc != CURLE_OK)
            return transportError("GET", rc);
        if (!is2xx(status))
            return statusError("GET", status);
        return {};
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace parafetch
