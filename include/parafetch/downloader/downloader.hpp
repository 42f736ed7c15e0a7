#pragma once

/*
 * parafetch Downloader - Public Types and Component Interfaces (C++20)
 *
 * This header defines the data types, free functions and abstract interfaces for the
 * segmented downloader. Implementations live under src/downloader/.
 *
 * Pipeline:
 * - Probe the resource (HEAD, then GET bytes=0-0 when HEAD says too little)
 * - Plan byte-range segments and an effective worker count
 * - Bootstrap a resume manifest (<output>.resume.json) keyed on URL, size and validators
 * - Fetch segments into part files (<output>.p<index>) over a fixed-size worker pool
 * - Assemble part files in index order, verify size and optional digest, clean up
 *
 * Copyright (c) parafetch Contributors
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parafetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Md5 // accepted for legacy mirrors; discouraged
};

/**
 * Progress stages during a single download lifecycle.
 */
enum class ProgressStage { Resolving, Planning, Downloading, Assembling, Verifying, Finalizing };

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    ProbeFailed,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    SegmentFetchFailed,
    IncompletePart,
    SizeMismatch,
    ChecksumMismatch,
    Interrupted,
    Cancelled,
    IoError,
    Unknown
};

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ProbeFailed: return "ProbeFailed";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::TlsVerificationFailed: return "TlsVerificationFailed";
        case ErrorCode::ServerError: return "ServerError";
        case ErrorCode::SegmentFetchFailed: return "SegmentFetchFailed";
        case ErrorCode::IncompletePart: return "IncompletePart";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

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
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Retry policy: attempt N waits N * delay before attempt N+1.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds delay{1000};
    std::chrono::milliseconds singleStreamDelay{1500};
};

/**
 * I/O buffer sizes used by the streaming stages.
 */
struct BufferSizes {
    std::size_t streamBytes{64 * 1024};    // network -> part file
    std::size_t assembleBytes{128 * 1024}; // part files -> final file
    std::size_t digestBytes{1024 * 1024};  // final file -> digest
};

/**
 * Per-request transfer options shared by the prober and the fetchers.
 */
struct TransferOptions {
    std::string userAgent{"parafetch/1.1 (+libcurl)"};
    std::chrono::milliseconds timeout{60000};
    std::size_t bufferBytes{64 * 1024};
};

/**
 * Downloader default configuration (engine-wide values and request defaults).
 */
struct DownloaderConfig {
    int defaultWorkers{8};
    int defaultChunkSizeMb{0}; // 0 = split evenly across workers
    std::chrono::milliseconds defaultTimeout{60000};
    RetryPolicy retry{};
    bool resume{true};
    bool keepParts{false};
    int maxRedirects{3};
    std::string userAgent{"parafetch/1.1 (+libcurl)"};
    BufferSizes buffers{};
};

/**
 * A single download request.
 */
struct DownloadRequest {
    std::string url;
    std::optional<std::filesystem::path> outputPath; // default: basename of the final URL

    int workers{8};
    int chunkSizeMb{0};
    std::chrono::milliseconds timeout{60000};
    RetryPolicy retry{};

    bool resume{true};
    bool keepParts{false};
    std::optional<Checksum> checksum;
};

/**
 * Build a request for url using the defaults of cfg.
 */
DownloadRequest makeRequest(const DownloaderConfig& cfg, std::string url);

/**
 * Streaming progress event for a single URL.
 */
struct ProgressEvent {
    std::string url;
    ProgressStage stage{ProgressStage::Downloading};
    std::size_t segmentsDone{0};
    std::size_t segmentsTotal{0};
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
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

struct HttpResponse;

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
// Continue asks for more of the body; Stop ends the transfer cleanly (the response is
// still returned as a success).
enum class SinkControl { Continue, Stop };

using BodySink = std::function<Expected<SinkControl>(std::span<const std::byte>)>;
// Runs once on the final response head, before any body byte; an error aborts the transfer.
using ResponseHeadCheck = std::function<Expected<void>(const HttpResponse&)>;

// ==============
// HTTP transport
// ==============

/**
 * One HTTP response head. Header names are lower-cased; the first occurrence wins.
 */
struct HttpResponse {
    long status{0};
    std::string reason;
    std::vector<Header> headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view lowerName) const {
        for (const auto& h : headers) {
            if (h.name == lowerName)
                return h.value;
        }
        return std::nullopt;
    }
};

/**
 * Single-request HTTP abstraction (libcurl implementation in http_adapter_curl.cpp).
 *
 * - Never follows redirects; 3xx responses are returned to the caller.
 * - Every call uses a private connection that is closed when the call returns.
 * - Implementations must be safe to call from several threads at once.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * Metadata-only request (HEAD).
     */
    virtual Expected<HttpResponse> head(std::string_view url, const std::vector<Header>& headers,
                                        const TransferOptions& opts) = 0;

    /**
     * GET. The body of a 2xx response is streamed to sink; bodies of other statuses are
     * discarded. An empty sink means the body is not wanted: the transfer stops after the
     * response head. SinkControl::Stop ends the transfer early without an error.
     * onHead (optional) sees the final response head before the body; its error, like a
     * sink error, aborts the transfer and is returned as-is.
     */
    virtual Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                                       const TransferOptions& opts, const BodySink& sink,
                                       const ShouldCancel& shouldCancel,
                                       const ResponseHeadCheck& onHead) = 0;
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport();

// Status line "HTTP/1.1 206 Partial Content" -> (206, "Partial Content").
bool parseStatusLine(std::string_view line, long& status, std::string& reason);

// "Key: Value\r\n" -> {"key", "Value"}; nullopt for lines without a colon.
std::optional<Header> parseHeaderLine(std::string_view line);

// User-Agent and Accept headers for every request.
std::vector<Header> defaultRequestHeaders(const TransferOptions& opts);

// ================
// Resource prober
// ================

/**
 * Remote resource metadata, discovered once per run.
 */
struct RemoteResource {
    std::string finalUrl;
    std::optional<std::uint64_t> sizeBytes;
    bool acceptsRanges{false};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
};

[[nodiscard]] inline bool isRedirectStatus(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * Resolve a Location header against the URL that produced it.
 */
std::string resolveRedirect(std::string_view currentUrl, std::string_view location);

/**
 * HEAD with bounded redirect resolution, then GET bytes=0-0 if HEAD did not report
 * Content-Length or Accept-Ranges. Transport failures are fatal (ErrorCode::ProbeFailed).
 */
Expected<RemoteResource> probeResource(IHttpTransport& http, std::string_view url,
                                       const TransferOptions& opts, int maxRedirects);

// =============
// Range planner
// =============

/**
 * Inclusive byte interval [start, end] of segment `index` (1-based).
 */
struct RangeSegment {
    int index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    bool operator==(const RangeSegment&) const = default;
};

struct RangePlan {
    std::vector<RangeSegment> segments;
    int effectiveWorkers{1};
    std::uint64_t chunkSize{0};

    [[nodiscard]] std::size_t numParts() const noexcept { return segments.size(); }
    bool operator==(const RangePlan&) const = default;
};

/**
 * Partition [0, totalSize) into segments. chunkSizeMb > 0 fixes the segment size in MiB;
 * otherwise the size is split evenly across max(1, workers) segments.
 */
RangePlan planRanges(std::uint64_t totalSize, int workers, int chunkSizeMb);

// ===============
// Resume manifest
// ===============

/**
 * Persisted identity record for cross-run resumption.
 */
struct ResumeManifest {
    std::string url;
    std::string output;
    std::uint64_t size{0};
    std::string acceptRanges;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::size_t numParts{0};
    std::uint64_t chunkSize{0};
};

enum class ManifestDecision { Reuse, Recreate, Error };

/**
 * Compare a loaded manifest with one synthesized from the current probe and plan.
 * - Reuse: identity (url, size, validators when both sides have them) and layout
 *   (num_parts, chunk_size) match
 * - Recreate: absent, unparseable or mismatching
 * - Error: the manifest could not be read
 */
ManifestDecision evaluateManifest(const Expected<std::optional<ResumeManifest>>& loaded,
                                  const ResumeManifest& current);

ResumeManifest manifestFromProbe(const RemoteResource& resource,
                                 const std::filesystem::path& outputPath, const RangePlan& plan);

std::filesystem::path manifestPathFor(const std::filesystem::path& outputPath);

/**
 * Manifest persistence.
 */
class IResumeStore {
public:
    virtual ~IResumeStore() = default;

    // nullopt when no manifest exists or it cannot be parsed; Error on I/O failure.
    virtual Expected<std::optional<ResumeManifest>> load() = 0;
    // Durable write (temp file + fsync + atomic rename).
    virtual Expected<void> save(const ResumeManifest& manifest) = 0;
    virtual void remove() noexcept = 0;
};

std::unique_ptr<IResumeStore> makeJsonResumeStore(std::filesystem::path manifestPath);

struct ManifestBootstrap {
    ResumeManifest manifest;
    ManifestDecision decision{ManifestDecision::Recreate};
};

/**
 * Load (when allowResume), decide, and persist a fresh manifest unless it is reused.
 */
Expected<ManifestBootstrap> bootstrapManifest(IResumeStore& store, const ResumeManifest& current,
                                              bool allowResume);

// ============
// Part fetcher
// ============

enum class SegmentState { Completed, AlreadyComplete, Failed, Cancelled };

/**
 * Result of one segment's retry loop.
 */
struct SegmentOutcome {
    int index{0};
    SegmentState state{SegmentState::Failed};
    int attempts{0};
    std::optional<long> lastHttpStatus{};
    std::uint64_t bytesFetched{0};
    std::string message;

    [[nodiscard]] bool succeeded() const noexcept {
        return state == SegmentState::Completed || state == SegmentState::AlreadyComplete;
    }
};

std::filesystem::path partPathFor(const std::filesystem::path& outputPath, int index);

/**
 * Download one segment into partPath, appending to an existing partial file when resume
 * is set. Retries locally; only the final outcome is reported.
 */
SegmentOutcome fetchSegment(IHttpTransport& http, std::string_view url,
                            const RangeSegment& segment, const std::filesystem::path& partPath,
                            const RetryPolicy& retry, const TransferOptions& opts, bool resume,
                            const ShouldCancel& shouldCancel);

/**
 * Whole-resource GET without a Range header (servers without range support).
 * Returns the number of bytes written.
 */
Expected<std::uint64_t> fetchWhole(IHttpTransport& http, std::string_view url,
                                   const std::filesystem::path& outputPath,
                                   const RetryPolicy& retry, const TransferOptions& opts,
                                   const ShouldCancel& shouldCancel);

// =======================
// Concurrency coordinator
// =======================

/**
 * Runs fetchSegment for every segment of a plan over plan.effectiveWorkers threads.
 * First failure (or an external interrupt) stops the remaining work; part files are
 * never deleted here.
 */
class FetchCoordinator {
public:
    FetchCoordinator(IHttpTransport& http, RetryPolicy retry, TransferOptions opts);

    Expected<std::vector<SegmentOutcome>> run(std::string_view url, const RangePlan& plan,
                                              const std::filesystem::path& outputPath,
                                              bool resume, const ShouldCancel& interrupt,
                                              const ProgressCallback& onProgress = {});

    void setPollInterval(std::chrono::milliseconds interval) { pollInterval_ = interval; }

private:
    IHttpTransport& http_;
    RetryPolicy retry_;
    TransferOptions opts_;
    std::chrono::milliseconds pollInterval_{20};
};

// ==========================
// Assembler and verification
// ==========================

/**
 * Every part file must exist with exactly its segment's length.
 */
Expected<void> checkPartsComplete(const std::filesystem::path& outputPath, const RangePlan& plan);

/**
 * Concatenate <output>.p1 .. <output>.pN into outputPath. Returns the bytes written.
 */
Expected<std::uint64_t> assembleParts(const std::filesystem::path& outputPath,
                                      std::size_t numParts, std::size_t bufferBytes);

void removePartFiles(const std::filesystem::path& outputPath, std::size_t numParts) noexcept;

// fsync of a file, and of a directory so that a rename into it is durable.
Expected<void> syncFile(const std::filesystem::path& path);
Expected<void> syncDirectory(const std::filesystem::path& dir);

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

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Sha256);

/**
 * "<algo>:<hex>" or bare hex (SHA-256).
 */
Expected<Checksum> parseChecksum(std::string_view text);

Expected<std::string> computeFileDigest(const std::filesystem::path& path, HashAlgo algo,
                                        std::size_t bufferBytes);

Expected<void> verifyFileSize(const std::filesystem::path& path, std::uint64_t expected);

Expected<void> verifyFileDigest(const std::filesystem::path& path, const Checksum& expected,
                                std::size_t bufferBytes);

// ================
// Download manager
// ================

/**
 * Final result for a single URL.
 */
struct FinalResult {
    std::string url;
    std::string finalUrl;
    std::filesystem::path outputPath;
    std::uint64_t sizeBytes{0};

    bool segmented{false};
    std::size_t numParts{0};
    int effectiveWorkers{0};
    bool resumed{false};

    std::optional<std::string> etag{};
    std::optional<std::string> lastModified{};
    std::optional<std::string> digest{};
    std::optional<bool> checksumOk{};

    std::chrono::milliseconds elapsed{0};
};

/**
 * Output file: explicit path, else the final URL's basename, else "download.bin".
 */
std::filesystem::path deriveOutputPath(std::string_view finalUrl,
                                       const std::optional<std::filesystem::path>& explicitPath);

class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    virtual Expected<FinalResult> download(const DownloadRequest& request,
                                           const ProgressCallback& onProgress = {},
                                           const ShouldCancel& shouldCancel = {}) = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg);

std::unique_ptr<IDownloadManager>
makeDownloadManagerWithTransport(const DownloaderConfig& cfg, std::unique_ptr<IHttpTransport> http);

} // namespace parafetch::downloader
