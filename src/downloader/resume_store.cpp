/*
 * parafetch/src/downloader/resume_store.cpp
 *
 * Persistent JSON resume manifest (sidecar next to the output file).
 *
 * File layout (<output>.resume.json):
 * {
 *   "url": "https://example.com/file.bin",
 *   "output": "file.bin",
 *   "size": 10485760,
 *   "accept_ranges": "bytes",
 *   "etag": "\"abc123\"",                            // null when unknown
 *   "last_modified": "Tue, 19 Aug 2025 09:00:00 GMT", // null when unknown
 *   "num_parts": 4,
 *   "chunk_size": 2621440
 * }
 *
 * Writes go to <path>.tmp, are fsynced, then renamed over the target.
 */

#include <parafetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace parafetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

json optionalString(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::optional<std::string> readOptionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

// Both sides must provide a validator for it to take part in the comparison
bool validatorConflicts(const std::optional<std::string>& stored,
                        const std::optional<std::string>& current) {
    return stored && !stored->empty() && current && !current->empty() && *stored != *current;
}

} // namespace

fs::path manifestPathFor(const fs::path& outputPath) {
    auto p = outputPath;
    p += ".resume.json";
    return p;
}

ResumeManifest manifestFromProbe(const RemoteResource& resource, const fs::path& outputPath,
                                 const RangePlan& plan) {
    ResumeManifest m;
    m.url = resource.finalUrl;
    m.output = outputPath.string();
    m.size = resource.sizeBytes.value_or(0);
    m.acceptRanges = resource.acceptsRanges ? "bytes" : "";
    m.etag = resource.etag;
    m.lastModified = resource.lastModified;
    m.numParts = plan.numParts();
    m.chunkSize = plan.chunkSize;
    return m;
}

ManifestDecision evaluateManifest(const Expected<std::optional<ResumeManifest>>& loaded,
                                  const ResumeManifest& current) {
    if (!loaded.ok())
        return ManifestDecision::Error;
    const auto& stored = loaded.value();
    if (!stored)
        return ManifestDecision::Recreate;
    if (stored->url != current.url || stored->size != current.size)
        return ManifestDecision::Recreate;
    if (validatorConflicts(stored->etag, current.etag) ||
        validatorConflicts(stored->lastModified, current.lastModified)) {
        return ManifestDecision::Recreate;
    }
    // Part files written under another layout describe other byte ranges
    if (stored->numParts != current.numParts || stored->chunkSize != current.chunkSize)
        return ManifestDecision::Recreate;
    return ManifestDecision::Reuse;
}

class JsonResumeStore final : public IResumeStore {
public:
    explicit JsonResumeStore(fs::path path) : path_(std::move(path)) {}

    Expected<std::optional<ResumeManifest>> load() override {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return std::optional<ResumeManifest>{std::nullopt};
        }
        std::ifstream in(path_);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open resume manifest: " + path_.string()};
        }
        try {
            json j;
            in >> j;
            if (!j.is_object() || !j.contains("url") || !j["url"].is_string() ||
                !j.contains("size") || !j["size"].is_number_unsigned()) {
                spdlog::warn("Resume manifest {} is missing required fields; ignoring",
                             path_.string());
                return std::optional<ResumeManifest>{std::nullopt};
            }
            ResumeManifest m;
            m.url = j["url"].get<std::string>();
            m.output = j.value("output", std::string{});
            m.size = j["size"].get<std::uint64_t>();
            m.acceptRanges = readOptionalString(j, "accept_ranges").value_or("");
            m.etag = readOptionalString(j, "etag");
            m.lastModified = readOptionalString(j, "last_modified");
            if (j.contains("num_parts") && j["num_parts"].is_number_unsigned())
                m.numParts = j["num_parts"].get<std::size_t>();
            if (j.contains("chunk_size") && j["chunk_size"].is_number_unsigned())
                m.chunkSize = j["chunk_size"].get<std::uint64_t>();
            return std::optional<ResumeManifest>{std::move(m)};
        } catch (const json::exception& ex) {
            // Corrupt/unreadable -> treated as absent, rebuilt by the caller
            spdlog::warn("Resume manifest {} is not valid JSON ({}); ignoring", path_.string(),
                         ex.what());
            return std::optional<ResumeManifest>{std::nullopt};
        }
    }

    Expected<void> save(const ResumeManifest& m) override {
        json j = json::object();
        j["url"] = m.url;
        j["output"] = m.output;
        j["size"] = m.size;
        j["accept_ranges"] = m.acceptRanges;
        j["etag"] = optionalString(m.etag);
        j["last_modified"] = optionalString(m.lastModified);
        j["num_parts"] = m.numParts;
        j["chunk_size"] = m.chunkSize;

        auto tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError,
                             "Failed to open resume manifest for write: " + tmp.string()};
            }
            out << j.dump(2);
            out.flush();
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to write resume manifest: " + tmp.string()};
            }
        }

        auto sr = syncFile(tmp);
        if (!sr.ok())
            return sr;

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            std::error_code rmEc;
            fs::remove(tmp, rmEc);
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 tmp.string() + " to " + path_.string()};
        }

        auto dir = path_.parent_path();
        auto dr = syncDirectory(dir.empty() ? fs::path(".") : dir);
        if (!dr.ok()) {
            spdlog::debug("fsync on manifest dir failed (continuing): {}", dr.error().message);
        }
        return {};
    }

    void remove() noexcept override {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            spdlog::debug("Failed to remove resume manifest {}: {}", path_.string(), ec.message());
        }
    }

private:
    fs::path path_;
};

std::unique_ptr<IResumeStore> makeJsonResumeStore(fs::path manifestPath) {
    return std::make_unique<JsonResumeStore>(std::move(manifestPath));
}

Expected<ManifestBootstrap> bootstrapManifest(IResumeStore& store, const ResumeManifest& current,
                                              bool allowResume) {
    Expected<std::optional<ResumeManifest>> loaded{std::optional<ResumeManifest>{}};
    if (allowResume) {
        loaded = store.load();
    }

    ManifestBootstrap out;
    out.decision = evaluateManifest(loaded, current);
    switch (out.decision) {
        case ManifestDecision::Reuse:
            spdlog::info("Resuming with existing manifest ({} parts)", loaded.value()->numParts);
            out.manifest = *loaded.value();
            return out;
        case ManifestDecision::Recreate:
            if (loaded.value()) {
                spdlog::warn("Resume manifest does not match the remote resource; starting over");
            }
            break;
        case ManifestDecision::Error:
            return Error{loaded.error().code, "Resume manifest cannot be used: " +
                                                  loaded.error().message};
    }

    auto sr = store.save(current);
    if (!sr.ok()) {
        return sr.error();
    }
    out.manifest = current;
    return out;
}

} // namespace parafetch::downloader
