/*
 * parafetch/src/downloader/download_manager.cpp
 *
 * DownloadManager: one resource per call.
 * - Probe (redirects, size, range support, validators)
 * - Single-stream fallback when ranges are not served or the size is unknown/zero
 * - Plan segments, bootstrap the resume manifest, fetch segments over the worker pool
 * - Check parts, assemble, verify size and optional digest
 * - On success remove the manifest and (unless kept) the part files
 *
 * Failures after the fetch stage leave the manifest, the part files and the assembled
 * output on disk so that the next run can resume or the user can inspect them.
 */

#include <parafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace parafetch::downloader {

namespace fs = std::filesystem;

DownloadRequest makeRequest(const DownloaderConfig& cfg, std::string url) {
    DownloadRequest r;
    r.url = std::move(url);
    r.workers = cfg.defaultWorkers;
    r.chunkSizeMb = cfg.defaultChunkSizeMb;
    r.timeout = cfg.defaultTimeout;
    r.retry = cfg.retry;
    r.resume = cfg.resume;
    r.keepParts = cfg.keepParts;
    return r;
}

fs::path deriveOutputPath(std::string_view finalUrl, const std::optional<fs::path>& explicitPath) {
    if (explicitPath && !explicitPath->empty())
        return *explicitPath;

    std::string_view path = finalUrl;
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    path = path.substr(0, path.find_first_of("?#"));
    auto slash = path.rfind('/');
    auto base = slash == std::string_view::npos ? path : path.substr(slash + 1);
    if (base.empty() || base == "." || base == "..")
        return fs::path("download.bin");
    return fs::path(std::string(base));
}

class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(DownloaderConfig cfg, std::unique_ptr<IHttpTransport> http = nullptr)
        : config_(std::move(cfg)), http_(std::move(http)) {
        if (!http_)
            http_ = makeCurlHttpTransport();
    }

    Expected<FinalResult> download(const DownloadRequest& request,
                                   const ProgressCallback& onProgress,
                                   const ShouldCancel& shouldCancel) override {
        try {
            return run(request, onProgress, shouldCancel);
        } catch (const std::exception& ex) {
            return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }
    }

    [[nodiscard]] DownloaderConfig config() const override { return config_; }

private:
    Expected<FinalResult> run(const DownloadRequest& request, const ProgressCallback& onProgress,
                              const ShouldCancel& shouldCancel) {
        // Pre-checks
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }
        if (request.workers < 1) {
            return Error{ErrorCode::InvalidArgument, "workers must be at least 1"};
        }
        if (request.retry.maxAttempts < 1) {
            return Error{ErrorCode::InvalidArgument, "max attempts must be at least 1"};
        }
        if (request.chunkSizeMb < 0) {
            return Error{ErrorCode::InvalidArgument, "chunk size must not be negative"};
        }

        const auto started = std::chrono::steady_clock::now();
        TransferOptions opts;
        opts.userAgent = config_.userAgent;
        opts.timeout = request.timeout;
        opts.bufferBytes = config_.buffers.streamBytes;

        auto emit = [&](ProgressStage stage, std::size_t done, std::size_t total,
                        std::uint64_t bytes, std::optional<std::uint64_t> totalBytes) {
            if (!onProgress)
                return;
            ProgressEvent ev;
            ev.url = request.url;
            ev.stage = stage;
            ev.segmentsDone = done;
            ev.segmentsTotal = total;
            ev.downloadedBytes = bytes;
            ev.totalBytes = totalBytes;
            onProgress(ev);
        };

        emit(ProgressStage::Resolving, 0, 0, 0, std::nullopt);
        auto pr = probeResource(*http_, request.url, opts, config_.maxRedirects);
        if (!pr.ok()) {
            return pr.error();
        }
        const RemoteResource resource = std::move(pr).value();

        FinalResult out;
        out.url = request.url;
        out.finalUrl = resource.finalUrl;
        out.outputPath = deriveOutputPath(resource.finalUrl, request.outputPath);
        out.etag = resource.etag;
        out.lastModified = resource.lastModified;

        if (!resource.acceptsRanges || !resource.sizeBytes || *resource.sizeBytes == 0) {
            auto r = singleStream(request, resource, opts, out, shouldCancel, emit);
            if (!r.ok())
                return r.error();
            out.elapsed = elapsedSince(started);
            return out;
        }

        const std::uint64_t totalSize = *resource.sizeBytes;
        emit(ProgressStage::Planning, 0, 0, 0, totalSize);
        const RangePlan plan = planRanges(totalSize, request.workers, request.chunkSizeMb);
        spdlog::info("Planned {} segment(s) of up to {} bytes for {} ({} bytes, {} worker(s))",
                     plan.numParts(), plan.chunkSize, out.outputPath.string(), totalSize,
                     plan.effectiveWorkers);

        auto store = makeJsonResumeStore(manifestPathFor(out.outputPath));
        auto boot = bootstrapManifest(*store, manifestFromProbe(resource, out.outputPath, plan),
                                      request.resume);
        if (!boot.ok()) {
            return boot.error();
        }
        const bool resumeParts = request.resume && boot.value().decision == ManifestDecision::Reuse;

        out.segmented = true;
        out.numParts = plan.numParts();
        out.effectiveWorkers = plan.effectiveWorkers;
        out.resumed = resumeParts;

        emit(ProgressStage::Downloading, 0, plan.numParts(), 0, totalSize);
        FetchCoordinator coordinator(*http_, request.retry, opts);
        auto fr = coordinator.run(resource.finalUrl, plan, out.outputPath, resumeParts,
                                  shouldCancel, onProgress);
        if (!fr.ok()) {
            return fr.error();
        }

        emit(ProgressStage::Assembling, plan.numParts(), plan.numParts(), totalSize, totalSize);
        auto cr = checkPartsComplete(out.outputPath, plan);
        if (!cr.ok()) {
            spdlog::error("Not assembling {}: {}", out.outputPath.string(), cr.error().message);
            return cr.error();
        }
        auto ar = assembleParts(out.outputPath, plan.numParts(), config_.buffers.assembleBytes);
        if (!ar.ok()) {
            return ar.error();
        }
        out.sizeBytes = ar.value();

        emit(ProgressStage::Verifying, plan.numParts(), plan.numParts(), totalSize, totalSize);
        auto vr = verify(request, out, totalSize);
        if (!vr.ok()) {
            return vr.error();
        }

        store->remove();
        if (!request.keepParts) {
            removePartFiles(out.outputPath, plan.numParts());
        }

        emit(ProgressStage::Finalizing, plan.numParts(), plan.numParts(), totalSize, totalSize);
        out.elapsed = elapsedSince(started);
        return out;
    }

    template <typename Emit>
    Expected<void> singleStream(const DownloadRequest& request, const RemoteResource& resource,
                                const TransferOptions& opts, FinalResult& out,
                                const ShouldCancel& shouldCancel, Emit& emit) {
        spdlog::info("Ranges unavailable for {} (accept-ranges={}, size={}); single stream",
                     resource.finalUrl, resource.acceptsRanges,
                     resource.sizeBytes ? std::to_string(*resource.sizeBytes) : "unknown");

        emit(ProgressStage::Downloading, 0, 1, 0, resource.sizeBytes);
        auto fw = fetchWhole(*http_, resource.finalUrl, out.outputPath, request.retry, opts,
                             shouldCancel);
        if (!fw.ok()) {
            if (fw.error().code == ErrorCode::Cancelled && shouldCancel && shouldCancel()) {
                return Error{ErrorCode::Interrupted, "Interrupted during single-stream fetch of " +
                                                         resource.finalUrl};
            }
            return fw.error();
        }

        out.sizeBytes = fw.value();
        out.segmented = false;
        out.numParts = 0;
        out.effectiveWorkers = 1;

        emit(ProgressStage::Verifying, 1, 1, out.sizeBytes, resource.sizeBytes);
        if (resource.sizeBytes) {
            auto vs = verifyFileSize(out.outputPath, *resource.sizeBytes);
            if (!vs.ok())
                return vs;
        }
        if (request.checksum) {
            auto vd = verifyFileDigest(out.outputPath, *request.checksum,
                                       config_.buffers.digestBytes);
            if (!vd.ok()) {
                out.checksumOk = false;
                return vd;
            }
            out.digest = request.checksum->hex;
            out.checksumOk = true;
        }
        emit(ProgressStage::Finalizing, 1, 1, out.sizeBytes, resource.sizeBytes);
        return Expected<void>{};
    }

    Expected<void> verify(const DownloadRequest& request, FinalResult& out,
                          std::uint64_t totalSize) {
        auto vs = verifyFileSize(out.outputPath, totalSize);
        if (!vs.ok()) {
            spdlog::error("{}", vs.error().message);
            return vs;
        }
        if (request.checksum) {
            auto vd = verifyFileDigest(out.outputPath, *request.checksum,
                                       config_.buffers.digestBytes);
            if (!vd.ok()) {
                spdlog::error("{}", vd.error().message);
                out.checksumOk = false;
                return vd;
            }
            out.digest = request.checksum->hex;
            out.checksumOk = true;
        }
        return Expected<void>{};
    }

    static std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point t0) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
    }

    DownloaderConfig config_;
    std::unique_ptr<IHttpTransport> http_;
};

std::unique_ptr<IDownloadManager> makeDownloadManagerWithTransport(const DownloaderConfig& cfg,
                                                                   std::unique_ptr<IHttpTransport> http) {
    return std::make_unique<DownloadManager>(cfg, std::move(http));
}

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg) {
    return makeDownloadManagerWithTransport(cfg, nullptr);
}

} // namespace parafetch::downloader
