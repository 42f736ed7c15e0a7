/*
 * parafetch/src/cli/parafetch_main.cpp
 *
 * `parafetch <url> [options]`
 * - Defaults come from the [downloader] section of the TOML config; flags override them
 * - SIGINT/SIGTERM raise an atomic flag polled by the downloader; the run stops, keeps its
 *   resume state and exits with 130
 * - Exit codes: 0 success, 1 probe/fetch/incomplete/IO failure, 2 size or digest mismatch,
 *   130 interrupted
 */

#include <parafetch/config/config_helpers.h>
#include <parafetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using namespace parafetch;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitIntegrity = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

struct CliOpts {
    std::string url;
    std::optional<fs::path> output;
    std::optional<int> workers;
    std::optional<int> chunk_size_mb;
    std::optional<int> max_retries;
    std::optional<int> timeout_s;
    std::optional<std::string> sha256;
    std::optional<std::string> checksum; // "<algo>:<hex>"
    std::string config_path;
    bool keep_parts{false};
    bool no_resume{false};
    bool verbose{false};
    bool quiet{false};
    bool emit_json{false};
};

int exitCodeFor(downloader::ErrorCode code) {
    switch (code) {
        case downloader::ErrorCode::None:
            return kExitOk;
        case downloader::ErrorCode::SizeMismatch:
        case downloader::ErrorCode::ChecksumMismatch:
            return kExitIntegrity;
        case downloader::ErrorCode::Interrupted:
            return kExitInterrupted;
        default:
            return kExitFailure;
    }
}

// Validate checksum format "algo:hex"
bool valid_checksum_format(const std::string& s) {
    static const std::regex re(R"(^(sha256|sha512|md5):[0-9a-fA-F]+$)");
    return std::regex_match(s, re);
}

void printResult(const downloader::FinalResult& r, bool asJson) {
    if (asJson) {
        json out = {{"type", "result"},
                    {"url", r.url},
                    {"final_url", r.finalUrl},
                    {"output", r.outputPath.string()},
                    {"size_bytes", r.sizeBytes},
                    {"segmented", r.segmented},
                    {"num_parts", r.numParts},
                    {"workers", r.effectiveWorkers},
                    {"resumed", r.resumed},
                    {"etag", r.etag ? json(*r.etag) : json(nullptr)},
                    {"last_modified", r.lastModified ? json(*r.lastModified) : json(nullptr)},
                    {"digest", r.digest ? json(*r.digest) : json(nullptr)},
                    {"checksum_ok", r.checksumOk ? json(*r.checksumOk) : json(nullptr)},
                    {"elapsed_ms", r.elapsed.count()}};
        fmt::print("{}\n", out.dump());
        return;
    }
    spdlog::info("Saved {} ({} bytes, {} in {} ms)", r.outputPath.string(), r.sizeBytes,
                 r.segmented ? fmt::format("{} parts / {} workers", r.numParts, r.effectiveWorkers)
                             : std::string("single stream"),
                 r.elapsed.count());
}

void printError(const downloader::Error& e, bool asJson) {
    if (asJson) {
        json out = {{"type", "error"},
                    {"code", downloader::errorCodeName(e.code)},
                    {"message", e.message}};
        fmt::print("{}\n", out.dump());
        return;
    }
    spdlog::error("{}: {}", downloader::errorCodeName(e.code), e.message);
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"parafetch - segmented HTTP/HTTPS downloader"};
    CliOpts opts;

    app.add_option("url", opts.url, "URL to download (http/https).")
        ->required();
    app.add_option("-o,--output", opts.output,
                   "Output path (default: basename of the final URL, else download.bin).");
    app.add_option("-w,--workers", opts.workers, "Parallel segment workers (default 8).")
        ->check(CLI::Range(1, 256));
    app.add_option("--chunk-size-mb", opts.chunk_size_mb,
                   "Fixed segment size in MiB (default 0 = split evenly across workers).")
        ->check(CLI::Range(0, 1 << 20));
    app.add_flag("--keep-parts", opts.keep_parts, "Keep part files after a successful run.");
    app.add_option("--max-retries", opts.max_retries, "Attempts per segment (default 3).")
        ->check(CLI::Range(1, 100));
    app.add_option("--timeout", opts.timeout_s, "Per-connection timeout in seconds (default 60).")
        ->check(CLI::Range(1, 3600));
    app.add_option("--sha256", opts.sha256, "Expected SHA-256 of the downloaded file.");
    app.add_option("--checksum", opts.checksum,
                   "Expected checksum in the form <algo>:<hex> (sha256|sha512|md5).")
        ->check(CLI::Validator(
            [](std::string& s) -> std::string {
                return valid_checksum_format(s) ? std::string{}
                                                : std::string("expected <algo>:<hex>");
            },
            "ALGO:HEX"));
    app.add_flag("--no-resume", opts.no_resume, "Ignore any existing manifest and part files.");
    app.add_option("--config", opts.config_path,
                   "Config file (default: $PARAFETCH_CONFIG or ~/.config/parafetch/config.toml).");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging.");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only.");
    app.add_flag("--json", opts.emit_json, "Print the final result as JSON on stdout.");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    const auto configPath = config::get_config_path(opts.config_path);
    if (!opts.config_path.empty() && !fs::exists(configPath)) {
        spdlog::error("Config file not found: {}", configPath.string());
        return kExitFailure;
    }
    auto cfgResult = config::loadDownloaderConfig(configPath);
    if (!cfgResult.ok()) {
        printError(cfgResult.error(), opts.emit_json);
        return kExitFailure;
    }
    spdlog::debug("Using config {}", configPath.string());

    auto manager = downloader::makeDownloadManager(cfgResult.value());
    const auto effective = manager->config();
    spdlog::debug("Effective config: workers={} chunk_size_mb={} max_retries={} timeout={}ms "
                  "max_redirects={} resume={} keep_parts={}",
                  effective.defaultWorkers, effective.defaultChunkSizeMb,
                  effective.retry.maxAttempts, effective.defaultTimeout.count(),
                  effective.maxRedirects, effective.resume, effective.keepParts);

    auto request = downloader::makeRequest(effective, opts.url);
    request.outputPath = opts.output;
    if (opts.workers)
        request.workers = *opts.workers;
    if (opts.chunk_size_mb)
        request.chunkSizeMb = *opts.chunk_size_mb;
    if (opts.max_retries)
        request.retry.maxAttempts = *opts.max_retries;
    if (opts.timeout_s)
        request.timeout = std::chrono::seconds(*opts.timeout_s);
    if (opts.keep_parts)
        request.keepParts = true;
    if (opts.no_resume)
        request.resume = false;

    if (opts.sha256 && opts.checksum) {
        spdlog::error("Specify only one of --sha256 or --checksum");
        return kExitFailure;
    }
    if (opts.sha256 || opts.checksum) {
        auto parsed = downloader::parseChecksum(
            opts.sha256 ? "sha256:" + *opts.sha256 : *opts.checksum);
        if (!parsed.ok()) {
            printError(parsed.error(), opts.emit_json);
            return kExitFailure;
        }
        request.checksum = parsed.value();
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto onProgress = [](const downloader::ProgressEvent& ev) {
        if (ev.stage == downloader::ProgressStage::Downloading && ev.segmentsTotal > 0 &&
            ev.segmentsDone > 0) {
            spdlog::info("[{}/{}] segments, {}/{} bytes", ev.segmentsDone, ev.segmentsTotal,
                         ev.downloadedBytes, ev.totalBytes.value_or(0));
        }
    };
    auto result = manager->download(request, onProgress,
                                    [] { return g_interrupted.load(); });

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!result.ok()) {
        printError(result.error(), opts.emit_json);
        if (result.error().code == downloader::ErrorCode::Interrupted) {
            spdlog::warn("Run interrupted; rerun the same command to resume");
        }
        return exitCodeFor(result.error().code);
    }
    printResult(result.value(), opts.emit_json);
    return kExitOk;
}
