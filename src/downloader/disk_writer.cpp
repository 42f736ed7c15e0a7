/*
 * parafetch/src/downloader/disk_writer.cpp
 *
 * Part-file bookkeeping and final assembly:
 * - Completeness check: every <output>.p<i> exists with exactly its segment length
 * - Ordered concatenation p1..pN into the output path through a fixed-size buffer
 * - fsync of the assembled file and its directory
 * - Best-effort removal of part files after success
 */

#include <parafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace parafetch::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

Expected<void> syncFile(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    const bool ok = FlushFileBuffers(h) != 0;
    CloseHandle(h);
    if (!ok) {
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

Expected<void> syncDirectory(const fs::path& dir) {
#if defined(_WIN32)
    // Directory entries are durable once the rename returns on NTFS
    (void)dir;
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

Expected<void> checkPartsComplete(const fs::path& outputPath, const RangePlan& plan) {
    for (const auto& segment : plan.segments) {
        const auto part = partPathFor(outputPath, segment.index);
        std::error_code ec;
        if (!fs::exists(part, ec)) {
            return Error{ErrorCode::IncompletePart, "Missing part " + part.string()};
        }
        const auto actual = fs::file_size(part, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to stat part " + part.string() + ": " + ec.message()};
        }
        if (actual != segment.length()) {
            return Error{ErrorCode::IncompletePart,
                         "Incomplete part " + part.string() + " (" + std::to_string(actual) +
                             "/" + std::to_string(segment.length()) + " bytes)"};
        }
    }
    return Expected<void>{};
}

Expected<std::uint64_t> assembleParts(const fs::path& outputPath, std::size_t numParts,
                                      std::size_t bufferBytes) {
    std::vector<char> buffer(bufferBytes > 0 ? bufferBytes : 128 * 1024);
    std::uint64_t total = 0;
    {
        std::ofstream os(outputPath, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Failed to open output: " + outputPath.string()};
        }

        for (std::size_t i = 1; i <= numParts; ++i) {
            const auto part = partPathFor(outputPath, static_cast<int>(i));
            std::ifstream is(part, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::IncompletePart, "Missing part " + part.string()};
            }
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        return Error{ErrorCode::IoError,
                                     "write failed for output: " + outputPath.string()};
                    }
                    total += static_cast<std::uint64_t>(got);
                }
            }
            if (!is.eof()) {
                return Error{ErrorCode::IoError, "read failed for part: " + part.string()};
            }
        }
        os.flush();
        if (!os.good()) {
            return Error{ErrorCode::IoError, "flush failed for output: " + outputPath.string()};
        }
    }

    auto sr = syncFile(outputPath);
    if (!sr.ok())
        return sr.error();
    auto dir = outputPath.parent_path();
    auto dr = syncDirectory(dir.empty() ? fs::path(".") : dir);
    if (!dr.ok()) {
        spdlog::debug("fsync on output dir failed (continuing): {}", dr.error().message);
    }

    spdlog::info("Assembled {} part(s) into {} ({} bytes)", numParts, outputPath.string(), total);
    return total;
}

void removePartFiles(const fs::path& outputPath, std::size_t numParts) noexcept {
    for (std::size_t i = 1; i <= numParts; ++i) {
        std::error_code ec;
        const auto part = partPathFor(outputPath, static_cast<int>(i));
        fs::remove(part, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove part file {}: {}", part.string(),
                          ec.message());
        }
    }
}

} // namespace parafetch::downloader
