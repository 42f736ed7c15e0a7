/*
 * parafetch/src/downloader/part_fetcher.cpp
 *
 * Segment fetcher:
 * - Append-resume from the bytes already present in <output>.p<index>
 * - Ranged GET (bytes=<start+have>-<end>); 206, or 200 for a range starting at offset 0,
 *   is accepted. A 200 for a later offset is refused from the response head, and the
 *   transfer stops once the segment is full
 * - Local retry loop: attempt N waits N * delay; every attempt restarts from the bytes on disk
 *
 * Also hosts the single-stream (no Range) fetch used when the server cannot serve ranges.
 */

#include <parafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

namespace parafetch::downloader {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

bool cancelled(const ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

// Sleeps for `total`, returning false as soon as cancellation is requested
bool waitBeforeRetry(std::chrono::milliseconds total, const ShouldCancel& shouldCancel) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled(shouldCancel))
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds{0}, kWaitSlice));
    }
    return !cancelled(shouldCancel);
}

std::uint64_t existingLength(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec))
        return 0;
    auto sz = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

std::string statusText(const HttpResponse& r) {
    std::string s = "HTTP " + std::to_string(r.status);
    if (!r.reason.empty()) {
        s.push_back(' ');
        s += r.reason;
    }
    return s;
}

} // namespace

fs::path partPathFor(const fs::path& outputPath, int index) {
    auto p = outputPath;
    p += ".p" + std::to_string(index);
    return p;
}

SegmentOutcome fetchSegment(IHttpTransport& http, std::string_view url,
                            const RangeSegment& segment, const fs::path& partPath,
                            const RetryPolicy& retry, const TransferOptions& opts, bool resume,
                            const ShouldCancel& shouldCancel) {
    SegmentOutcome out;
    out.index = segment.index;

    const std::uint64_t needed = segment.length();
    const int maxAttempts = std::max(1, retry.maxAttempts);
    const auto baseHeaders = defaultRequestHeaders(opts);

    // The first attempt honours the caller's resume flag; later attempts always continue
    // from what earlier attempts of this run left on disk.
    bool append = resume;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (cancelled(shouldCancel)) {
            out.state = SegmentState::Cancelled;
            out.message = "cancelled before attempt " + std::to_string(attempt);
            return out;
        }

        std::uint64_t have = append ? existingLength(partPath) : 0;
        if (have > needed) {
            spdlog::warn("Part {} holds {} bytes but segment {} needs {}; refetching",
                         partPath.string(), have, segment.index, needed);
            have = 0;
        }
        if (have == needed) {
            out.state = attempt == 1 ? SegmentState::AlreadyComplete : SegmentState::Completed;
            spdlog::debug("Segment {} already complete ({} bytes)", segment.index, needed);
            return out;
        }
        out.attempts = attempt;

        std::ofstream part(partPath, std::ios::binary |
                                         (have > 0 ? std::ios::app : std::ios::trunc));
        if (!part) {
            out.message = "Failed to open part file: " + partPath.string();
        } else {
            const std::uint64_t effectiveStart = segment.start + have;
            std::uint64_t remaining = needed - have;
            std::uint64_t written = 0;

            // A whole-resource reply to a mid-file range is refused before its body
            ResponseHeadCheck onHead = [&](const HttpResponse& head) -> Expected<void> {
                out.lastHttpStatus = head.status;
                if (head.status == 200 && effectiveStart != 0) {
                    return Error{ErrorCode::ServerError,
                                 "server ignored Range (HTTP 200 for offset " +
                                     std::to_string(effectiveStart) + ")"};
                }
                return Expected<void>{};
            };

            // The transfer ends as soon as the segment is full
            BodySink sink = [&](std::span<const std::byte> data) -> Expected<SinkControl> {
                const auto take = static_cast<std::size_t>(
                    std::min<std::uint64_t>(data.size(), remaining));
                if (take > 0) {
                    part.write(reinterpret_cast<const char*>(data.data()),
                               static_cast<std::streamsize>(take));
                    if (!part) {
                        return Error{ErrorCode::IoError, "write failed on: " + partPath.string()};
                    }
                    remaining -= take;
                    written += take;
                }
                return remaining == 0 ? SinkControl::Stop : SinkControl::Continue;
            };

            auto headers = baseHeaders;
            headers.push_back({"Range", "bytes=" + std::to_string(effectiveStart) + "-" +
                                            std::to_string(segment.end)});

            auto r = http.get(url, headers, opts, sink, shouldCancel, onHead);
            part.close();
            out.bytesFetched += written;

            if (r.ok()) {
                const auto& resp = r.value();
                out.lastHttpStatus = resp.status;
                if (resp.status == 200 && effectiveStart != 0) {
                    // Body arrived without passing the head check: the bytes are not ours
                    out.bytesFetched -= written;
                    std::error_code ec;
                    fs::resize_file(partPath, have, ec);
                    if (ec) {
                        out.state = SegmentState::Failed;
                        out.message = "Failed to drop foreign bytes from " + partPath.string() +
                                      ": " + ec.message();
                        spdlog::error("Segment {}: {}", segment.index, out.message);
                        return out;
                    }
                    out.message = "server ignored Range (HTTP 200 for offset " +
                                  std::to_string(effectiveStart) + ")";
                } else if (resp.status != 200 && resp.status != 206) {
                    out.message = statusText(resp);
                } else if (remaining > 0) {
                    out.message = "short body: " + std::to_string(needed - remaining) + "/" +
                                  std::to_string(needed) + " bytes";
                } else {
                    out.state = SegmentState::Completed;
                    out.message.clear();
                    spdlog::debug("Segment {} complete ({} bytes, {} attempt(s))", segment.index,
                                  needed, attempt);
                    return out;
                }
            } else if (r.error().code == ErrorCode::Cancelled) {
                out.state = SegmentState::Cancelled;
                out.message = r.error().message;
                return out;
            } else {
                out.message = r.error().message;
            }
        }

        append = true;
        if (attempt < maxAttempts) {
            spdlog::warn("Segment {} attempt {}/{} failed: {}", segment.index, attempt,
                         maxAttempts, out.message);
            if (!waitBeforeRetry(retry.delay * attempt, shouldCancel)) {
                out.state = SegmentState::Cancelled;
                out.message = "cancelled while waiting to retry";
                return out;
            }
        }
    }

    out.state = SegmentState::Failed;
    spdlog::error("Segment {} failed after {} attempt(s): {}", segment.index, out.attempts,
                  out.message);
    return out;
}

Expected<std::uint64_t> fetchWhole(IHttpTransport& http, std::string_view url,
                                   const fs::path& outputPath, const RetryPolicy& retry,
                                   const TransferOptions& opts, const ShouldCancel& shouldCancel) {
    const int maxAttempts = std::max(1, retry.maxAttempts);
    const auto headers = defaultRequestHeaders(opts);
    Error last{ErrorCode::Unknown, "no attempt made"};

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (cancelled(shouldCancel)) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled: " + std::string(url)};
        }

        std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            return Error{ErrorCode::IoError, "Failed to open output: " + outputPath.string()};
        }

        std::uint64_t written = 0;
        BodySink sink = [&](std::span<const std::byte> data) -> Expected<SinkControl> {
            outFile.write(reinterpret_cast<const char*>(data.data()),
                          static_cast<std::streamsize>(data.size()));
            if (!outFile) {
                return Error{ErrorCode::IoError, "write failed on: " + outputPath.string()};
            }
            written += data.size();
            return SinkControl::Continue;
        };

        auto r = http.get(url, headers, opts, sink, shouldCancel, ResponseHeadCheck{});
        outFile.close();

        if (r.ok()) {
            const auto& resp = r.value();
            if (resp.status >= 200 && resp.status < 300) {
                spdlog::debug("Single-stream fetch complete ({} bytes, {} attempt(s))", written,
                              attempt);
                return written;
            }
            last = Error{ErrorCode::ServerError, statusText(resp)};
        } else if (r.error().code == ErrorCode::Cancelled) {
            return r.error();
        } else {
            last = r.error();
        }

        if (attempt < maxAttempts) {
            spdlog::warn("Single-stream attempt {}/{} failed: {}", attempt, maxAttempts,
                         last.message);
            if (!waitBeforeRetry(retry.singleStreamDelay * attempt, shouldCancel)) {
                return Error{ErrorCode::Cancelled, "Transfer cancelled: " + std::string(url)};
            }
        }
    }

    return Error{last.code, "Single-stream fetch of " + std::string(url) + " failed after " +
                                std::to_string(maxAttempts) + " attempt(s): " + last.message};
}

} // namespace parafetch::downloader
