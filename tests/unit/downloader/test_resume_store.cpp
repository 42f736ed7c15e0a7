#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <parafetch/downloader/downloader.hpp>

#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace parafetch::downloader;
using parafetch::test_support::TempDirScope;

namespace {

ResumeManifest sampleManifest() {
    ResumeManifest m;
    m.url = "https://example.com/file.bin";
    m.output = "file.bin";
    m.size = 10 * 1024 * 1024;
    m.acceptRanges = "bytes";
    m.etag = "\"abc123\"";
    m.lastModified = "Tue, 19 Aug 2025 09:00:00 GMT";
    m.numParts = 4;
    m.chunkSize = 2621440;
    return m;
}

Expected<std::optional<ResumeManifest>> loaded(const ResumeManifest& m) {
    return std::optional<ResumeManifest>{m};
}

Expected<std::optional<ResumeManifest>> nothingLoaded() {
    return std::optional<ResumeManifest>{};
}

} // namespace

TEST(ResumeManifestPaths, SidecarNames) {
    EXPECT_EQ(manifestPathFor("out/file.bin"), fs::path("out/file.bin.resume.json"));
    EXPECT_EQ(partPathFor("out/file.bin", 1), fs::path("out/file.bin.p1"));
    EXPECT_EQ(partPathFor("out/file.bin", 12), fs::path("out/file.bin.p12"));
}

TEST(JsonResumeStore, SaveThenLoadInNewInstance) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    const auto path = dir / "file.bin.resume.json";
    const auto m = sampleManifest();

    ASSERT_TRUE(makeJsonResumeStore(path)->save(m).ok());
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    auto r = makeJsonResumeStore(path)->load();
    ASSERT_TRUE(r.ok()) << r.error().message;
    ASSERT_TRUE(r.value().has_value());
    const auto& got = *r.value();
    EXPECT_EQ(got.url, m.url);
    EXPECT_EQ(got.output, m.output);
    EXPECT_EQ(got.size, m.size);
    EXPECT_EQ(got.acceptRanges, "bytes");
    EXPECT_EQ(got.etag, m.etag);
    EXPECT_EQ(got.lastModified, m.lastModified);
    EXPECT_EQ(got.numParts, 4u);
    EXPECT_EQ(got.chunkSize, m.chunkSize);
}

TEST(JsonResumeStore, UnknownValidatorsAreWrittenAsNull) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    const auto path = dir / "x.resume.json";
    auto m = sampleManifest();
    m.etag.reset();
    m.lastModified.reset();
    ASSERT_TRUE(makeJsonResumeStore(path)->save(m).ok());

    std::ifstream in(path);
    json j;
    in >> j;
    EXPECT_TRUE(j["etag"].is_null());
    EXPECT_TRUE(j["last_modified"].is_null());
    EXPECT_EQ(j["num_parts"].get<int>(), 4);

    auto r = makeJsonResumeStore(path)->load();
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.value().has_value());
    EXPECT_FALSE(r.value()->etag.has_value());
    EXPECT_FALSE(r.value()->lastModified.has_value());
}

TEST(JsonResumeStore, MissingFileLoadsAsAbsent) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    auto r = makeJsonResumeStore(dir / "none.resume.json")->load();
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().has_value());
}

TEST(JsonResumeStore, CorruptFileLoadsAsAbsent) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    const auto path = dir / "bad.resume.json";
    {
        std::ofstream out(path);
        out << "{ \"url\": \"https://example.com/f\", \"size\": ";
    }
    auto r = makeJsonResumeStore(path)->load();
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().has_value());

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"output": "f"})";
    }
    r = makeJsonResumeStore(path)->load();
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().has_value());
}

TEST(JsonResumeStore, RemoveDeletesManifest) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    const auto path = dir / "f.resume.json";
    auto store = makeJsonResumeStore(path);
    ASSERT_TRUE(store->save(sampleManifest()).ok());
    store->remove();
    EXPECT_FALSE(fs::exists(path));
    store->remove(); // absent file is fine
}

TEST(ManifestDecisionTest, MatchingIdentityAndLayoutIsReused) {
    const auto m = sampleManifest();
    EXPECT_EQ(evaluateManifest(loaded(m), m), ManifestDecision::Reuse);
}

TEST(ManifestDecisionTest, AbsentManifestIsRecreated) {
    EXPECT_EQ(evaluateManifest(nothingLoaded(), sampleManifest()), ManifestDecision::Recreate);
}

TEST(ManifestDecisionTest, ChangedEtagIsRecreated) {
    auto stored = sampleManifest();
    auto current = sampleManifest();
    current.etag = "\"def456\"";
    EXPECT_EQ(evaluateManifest(loaded(stored), current), ManifestDecision::Recreate);
}

TEST(ManifestDecisionTest, ChangedLastModifiedOrSizeOrUrlIsRecreated) {
    const auto stored = sampleManifest();

    auto lm = stored;
    lm.lastModified = "Wed, 20 Aug 2025 00:00:00 GMT";
    EXPECT_EQ(evaluateManifest(loaded(stored), lm), ManifestDecision::Recreate);

    auto size = stored;
    size.size += 1;
    EXPECT_EQ(evaluateManifest(loaded(stored), size), ManifestDecision::Recreate);

    auto url = stored;
    url.url = "https://mirror.example.com/file.bin";
    EXPECT_EQ(evaluateManifest(loaded(stored), url), ManifestDecision::Recreate);
}

TEST(ManifestDecisionTest, ValidatorMissingOnOneSideIsIgnored) {
    auto stored = sampleManifest();
    stored.etag.reset();
    EXPECT_EQ(evaluateManifest(loaded(stored), sampleManifest()), ManifestDecision::Reuse);

    auto current = sampleManifest();
    current.lastModified.reset();
    EXPECT_EQ(evaluateManifest(loaded(sampleManifest()), current), ManifestDecision::Reuse);
}

TEST(ManifestDecisionTest, DifferentLayoutIsRecreated) {
    auto current = sampleManifest();
    current.numParts = 8;
    current.chunkSize = 1310720;
    EXPECT_EQ(evaluateManifest(loaded(sampleManifest()), current), ManifestDecision::Recreate);
}

TEST(ManifestDecisionTest, UnreadableManifestIsAnError) {
    Expected<std::optional<ResumeManifest>> failed{Error{ErrorCode::IoError, "permission denied"}};
    EXPECT_EQ(evaluateManifest(failed, sampleManifest()), ManifestDecision::Error);
}

TEST(ManifestBootstrapTest, ReplacesStaleManifestInsteadOfMerging) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    const auto path = dir / "f.resume.json";
    auto store = makeJsonResumeStore(path);

    auto old = sampleManifest();
    old.etag = "\"old\"";
    ASSERT_TRUE(store->save(old).ok());

    auto current = sampleManifest();
    current.etag = "\"new\"";
    auto boot = bootstrapManifest(*store, current, true);
    ASSERT_TRUE(boot.ok()) << boot.error().message;
    EXPECT_EQ(boot.value().decision, ManifestDecision::Recreate);
    EXPECT_EQ(boot.value().manifest.etag.value_or(""), "\"new\"");

    auto reread = store->load();
    ASSERT_TRUE(reread.ok());
    ASSERT_TRUE(reread.value().has_value());
    EXPECT_EQ(reread.value()->etag.value_or(""), "\"new\"");
}

TEST(ManifestBootstrapTest, ReusesMatchingManifest) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    auto store = makeJsonResumeStore(dir / "f.resume.json");
    ASSERT_TRUE(store->save(sampleManifest()).ok());

    auto boot = bootstrapManifest(*store, sampleManifest(), true);
    ASSERT_TRUE(boot.ok()) << boot.error().message;
    EXPECT_EQ(boot.value().decision, ManifestDecision::Reuse);
}

TEST(ManifestBootstrapTest, ResumeDisabledAlwaysRecreates) {
    auto dir = TempDirScope::unique_under("parafetch-resume");
    auto store = makeJsonResumeStore(dir / "f.resume.json");
    ASSERT_TRUE(store->save(sampleManifest()).ok());

    auto boot = bootstrapManifest(*store, sampleManifest(), false);
    ASSERT_TRUE(boot.ok()) << boot.error().message;
    EXPECT_EQ(boot.value().decision, ManifestDecision::Recreate);
    EXPECT_TRUE(fs::exists(dir / "f.resume.json"));
}

TEST(ManifestFromProbeTest, CopiesIdentityAndLayout) {
    RemoteResource res;
    res.finalUrl = "https://cdn.example.com/f.iso";
    res.sizeBytes = 1000;
    res.acceptsRanges = true;
    res.etag = "\"e\"";
    auto plan = planRanges(1000, 4, 0);

    auto m = manifestFromProbe(res, "f.iso", plan);
    EXPECT_EQ(m.url, res.finalUrl);
    EXPECT_EQ(m.output, "f.iso");
    EXPECT_EQ(m.size, 1000u);
    EXPECT_EQ(m.acceptRanges, "bytes");
    EXPECT_EQ(m.etag, res.etag);
    EXPECT_FALSE(m.lastModified.has_value());
    EXPECT_EQ(m.numParts, 4u);
    EXPECT_EQ(m.chunkSize, 250u);
}
