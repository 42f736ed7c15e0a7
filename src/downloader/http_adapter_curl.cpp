/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One libcurl easy handle per call: no redirect following, no connection reuse.
 * - HTTP/1.1 with the default TLS trust store.
 * - Timeout is per connection: connect timeout plus a stall detector (< 1 B/s for `timeout`).
 * - Cooperative cancellation from the write and progress callbacks.
 * - An optional head check runs once the final response head is complete; the sink can
 *   end the body early (SinkControl::Stop) without turning the call into an error.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <parafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace parafetch::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace (including CR/LF)
static std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool parseStatusLine(std::string_view line, long& status, std::string& reason) {
    line = trim(line);
    if (line.size() < 5 || line.substr(0, 5) != "HTTP/")
        return false;

    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return false;
    auto rest = trim(line.substr(sp + 1));

    long code = 0;
    auto res = std::from_chars(rest.data(), rest.data() + rest.size(), code);
    if (res.ec != std::errc() || code < 100 || code > 999)
        return false;

    status = code;
    reason = std::string(trim(std::string_view(res.ptr, rest.data() + rest.size() - res.ptr)));
    return true;
}

std::optional<Header> parseHeaderLine(std::string_view line) {
    line = trim(line);
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::nullopt;
    return Header{to_lower(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1)))};
}

std::vector<Header> defaultRequestHeaders(const TransferOptions& opts) {
    return {{"User-Agent", opts.userAgent}, {"Accept", "*/*"}};
}

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept {
        if (c)
            curl_easy_cleanup(c);
    }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l)
            curl_slist_free_all(l);
    }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Per-call response context shared by the callbacks
struct ResponseContext {
    HttpResponse response;
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    const ResponseHeadCheck* onHead{nullptr};
    std::optional<Error> sinkError;
    std::optional<Error> headError;
    bool cancelRequested{false};
    bool headChecked{false};
    bool stoppedAfterHead{false};
    bool stoppedBySink{false};
};

bool cancelRequested(ResponseContext& ctx) {
    if (ctx.shouldCancel && *ctx.shouldCancel && (*ctx.shouldCancel)()) {
        ctx.cancelRequested = true;
        return true;
    }
    return false;
}

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ResponseContext*>(userdata);
    std::string_view line(buffer, total);

    long status = 0;
    std::string reason;
    if (parseStatusLine(line, status, reason)) {
        // A new response head (e.g. after 100 Continue) replaces the previous one
        ctx->response.status = status;
        ctx->response.reason = std::move(reason);
        ctx->response.headers.clear();
        return total;
    }

    // Blank line: the head is complete
    if (trim(line).empty()) {
        if (ctx->response.status >= 200 && !ctx->headChecked && ctx->onHead && *ctx->onHead) {
            ctx->headChecked = true;
            auto r = (*ctx->onHead)(ctx->response);
            if (!r.ok()) {
                ctx->headError = r.error();
                return 0; // aborts the transfer before any body byte
            }
        }
        return total;
    }

    if (auto h = parseHeaderLine(line)) {
        if (!ctx->response.header(h->name))
            ctx->response.headers.push_back(std::move(*h));
    }
    return total;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ResponseContext*>(userdata);
    if (total == 0)
        return 0;

    if (cancelRequested(*ctx))
        return 0; // signal error to curl => CURLE_WRITE_ERROR

    const long status = ctx->response.status;
    if (status < 200 || status >= 300)
        return total; // drain error bodies

    if (ctx->sink == nullptr || !*ctx->sink) {
        ctx->stoppedAfterHead = true;
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }
    if (r.value() == SinkControl::Stop) {
        ctx->stoppedBySink = true;
        return 0;
    }
    return total;
}

// CURL progress callback: only used to notice cancellation while the transfer is idle
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ResponseContext*>(userdata);
    if (ctx && cancelRequested(*ctx))
        return 1;
    return 0;
}

// Helper to build curl_slist from headers
CurlSlistPtr build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return CurlSlistPtr{list};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const TransferOptions& opts) {
    const long timeoutMs = static_cast<long>(opts.timeout.count());
    const long timeoutSec = std::max<long>(1, timeoutMs / 1000);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeoutSec);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Connections are private to one request
    curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    if (opts.bufferBytes > 0) {
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(opts.bufferBytes));
    }
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

} // namespace

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() { ensureCurlGlobalInit(); }
    ~CurlHttpTransport() override = default;

    Expected<HttpResponse> head(std::string_view url, const std::vector<Header>& headers,
                                const TransferOptions& opts) override {
        return perform("HEAD", url, headers, opts, nullptr, nullptr, nullptr);
    }

    Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                               const TransferOptions& opts, const BodySink& sink,
                               const ShouldCancel& shouldCancel,
                               const ResponseHeadCheck& onHead) override {
        return perform("GET", url, headers, opts, &sink, &shouldCancel, &onHead);
    }

private:
    static Expected<HttpResponse> perform(std::string_view method, std::string_view url,
                                          const std::vector<Header>& headers,
                                          const TransferOptions& opts, const BodySink* sink,
                                          const ShouldCancel* shouldCancel,
                                          const ResponseHeadCheck* onHead) {
        CurlEasyPtr curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        auto list = build_header_list(headers);
        ResponseContext ctx;
        ctx.sink = sink;
        ctx.shouldCancel = shouldCancel;
        ctx.onHead = onHead;

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        if (method == "HEAD") {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        }
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

        configure_common(curl.get(), opts);

        CURLcode rc = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (ctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled: " + urlStr};
        }
        if (ctx.headError) {
            return *ctx.headError;
        }
        if (ctx.sinkError) {
            return *ctx.sinkError;
        }
        if (rc == CURLE_WRITE_ERROR && (ctx.stoppedAfterHead || ctx.stoppedBySink)) {
            rc = CURLE_OK;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, std::string(method) + " " + urlStr);
        }

        if (http_status != 0)
            ctx.response.status = http_status;
        spdlog::debug("{} {} -> {} {}", method, urlStr, ctx.response.status,
                      ctx.response.reason);
        return std::move(ctx.response);
    }
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport() {
    return std::make_unique<CurlHttpTransport>();
}

} // namespace parafetch::downloader
