/*
 * parafetch/src/downloader/fetch_coordinator.cpp
 *
 * Fan-out of segment fetchers over a fixed-size boost::asio::thread_pool.
 * - One packaged task per segment, at most plan.effectiveWorkers running at once
 * - The first failed segment (or the caller's interrupt) raises a shared stop flag:
 *   queued tasks are skipped, in-flight transfers abort at their next callback
 * - Part files are left untouched on every path
 */

#include <parafetch/downloader/downloader.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace parafetch::downloader {

namespace fs = std::filesystem;

namespace {

std::string describeFailure(const SegmentOutcome& o) {
    std::string msg = "Segment " + std::to_string(o.index) + " failed after " +
                      std::to_string(o.attempts) + " attempt(s)";
    if (o.lastHttpStatus) {
        msg += " (last status " + std::to_string(*o.lastHttpStatus) + ")";
    }
    if (!o.message.empty()) {
        msg += ": " + o.message;
    }
    return msg;
}

} // namespace

FetchCoordinator::FetchCoordinator(IHttpTransport& http, RetryPolicy retry, TransferOptions opts)
    : http_(http), retry_(retry), opts_(std::move(opts)) {}

Expected<std::vector<SegmentOutcome>>
FetchCoordinator::run(std::string_view url, const RangePlan& plan, const fs::path& outputPath,
                      bool resume, const ShouldCancel& interrupt,
                      const ProgressCallback& onProgress) {
    std::vector<SegmentOutcome> outcomes;
    if (plan.segments.empty())
        return outcomes;

    const auto threads = static_cast<std::size_t>(
        std::clamp<int>(plan.effectiveWorkers, 1, static_cast<int>(plan.segments.size())));
    std::uint64_t totalBytes = 0;
    for (const auto& s : plan.segments)
        totalBytes += s.length();

    spdlog::debug("Fetching {} segment(s) with {} worker(s)", plan.segments.size(), threads);

    std::atomic<bool> stop{false};
    const ShouldCancel stopRequested = [&stop] { return stop.load(std::memory_order_relaxed); };
    const std::string urlStr(url);

    boost::asio::thread_pool pool(threads);
    std::vector<std::future<SegmentOutcome>> futures;
    futures.reserve(plan.segments.size());

    for (const auto& segment : plan.segments) {
        auto task = std::make_shared<std::packaged_task<SegmentOutcome()>>(
            [this, &stop, &stopRequested, &urlStr, &outputPath, segment, resume]() {
                if (stop.load(std::memory_order_relaxed)) {
                    SegmentOutcome skipped;
                    skipped.index = segment.index;
                    skipped.state = SegmentState::Cancelled;
                    skipped.message = "skipped after stop";
                    return skipped;
                }
                auto o = fetchSegment(http_, urlStr, segment,
                                      partPathFor(outputPath, segment.index), retry_, opts_,
                                      resume, stopRequested);
                if (o.state == SegmentState::Failed)
                    stop.store(true, std::memory_order_relaxed);
                return o;
            });
        futures.push_back(task->get_future());
        boost::asio::post(pool, [task]() { (*task)(); });
    }

    std::vector<bool> collected(futures.size(), false);
    std::size_t pending = futures.size();
    std::size_t done = 0;
    std::uint64_t doneBytes = 0;
    std::optional<SegmentOutcome> firstFailure;
    bool interrupted = false;

    while (pending > 0) {
        for (std::size_t i = 0; i < futures.size(); ++i) {
            if (collected[i] ||
                futures[i].wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
                continue;
            }
            collected[i] = true;
            --pending;

            SegmentOutcome o;
            try {
                o = futures[i].get();
            } catch (const std::exception& ex) {
                o.index = plan.segments[i].index;
                o.state = SegmentState::Failed;
                o.message = std::string("Exception: ") + ex.what();
            }

            if (o.succeeded()) {
                ++done;
                doneBytes += plan.segments[i].length();
                if (onProgress) {
                    ProgressEvent ev;
                    ev.url = urlStr;
                    ev.stage = ProgressStage::Downloading;
                    ev.segmentsDone = done;
                    ev.segmentsTotal = plan.segments.size();
                    ev.downloadedBytes = doneBytes;
                    ev.totalBytes = totalBytes;
                    onProgress(ev);
                }
            } else if (o.state == SegmentState::Failed && !firstFailure) {
                firstFailure = o;
                stop.store(true, std::memory_order_relaxed);
            }
            outcomes.push_back(std::move(o));
        }

        if (pending == 0)
            break;
        if (!interrupted && interrupt && interrupt()) {
            spdlog::warn("Interrupt received; stopping {} outstanding segment(s)", pending);
            interrupted = true;
            stop.store(true, std::memory_order_relaxed);
        }
        std::this_thread::sleep_for(pollInterval_);
    }
    pool.join();

    if (interrupted) {
        return Error{ErrorCode::Interrupted,
                     "Interrupted with " + std::to_string(done) + "/" +
                         std::to_string(plan.segments.size()) +
                         " segment(s) complete; resume state kept for " + outputPath.string()};
    }
    if (firstFailure) {
        return Error{ErrorCode::SegmentFetchFailed, describeFailure(*firstFailure)};
    }

    std::sort(outcomes.begin(), outcomes.end(),
              [](const SegmentOutcome& a, const SegmentOutcome& b) { return a.index < b.index; });
    return outcomes;
}

} // namespace parafetch::downloader
