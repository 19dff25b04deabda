#include "temp_tree.hpp"
#include "fake_backend.hpp"
#include <core/constants.hpp>
#include <exclusion/applier.hpp>
#include <exclusion/cachedir_tag_backend.hpp>
#include <exclusion/tmutil_backend.hpp>
#include <exclusion/disk_usage.hpp>
#include <platform/platform.hpp>

class ExclusionTest : public TempTreeTest {
protected:
    // Incompressible bytes, so allocated size tracks logical size
    static std::string noise(size_t n) {
        std::string out(n, '\0');
        uint32_t x = 2463534242u;
        for (auto& c : out) {
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            c = static_cast<char>(x & 0xff);
        }
        return out;
    }
};

// ── CACHEDIR.TAG ────────────────────────────────────────────

TEST_F(ExclusionTest, UntaggedDirectoryIsNotExcluded) {
    mkdir("node_modules");
    CacheDirTagBackend backend;
    auto state = backend.is_excluded(path_of("node_modules"));
    ASSERT_TRUE(state.is_ok()) << state.error;
    EXPECT_FALSE(state.value);
}

TEST_F(ExclusionTest, TaggingExcludesAndIsIdempotent) {
    mkdir("node_modules");
    CacheDirTagBackend backend;

    ASSERT_TRUE(backend.add_exclusion(path_of("node_modules")).is_ok());
    auto state = backend.is_excluded(path_of("node_modules"));
    ASSERT_TRUE(state.is_ok());
    EXPECT_TRUE(state.value);

    ASSERT_TRUE(backend.add_exclusion(path_of("node_modules")).is_ok());
    std::string tag = read_file("node_modules/CACHEDIR.TAG");
    EXPECT_EQ(tag.rfind(CACHEDIR_TAG_SIGNATURE, 0), 0u);
    EXPECT_EQ(tag, cachedir_tag_content());
}

TEST_F(ExclusionTest, TagWithoutSignatureDoesNotCount) {
    write_file("target/CACHEDIR.TAG", "Signature: nope\n");
    write_file("short/CACHEDIR.TAG", "Sig");
    CacheDirTagBackend backend;

    EXPECT_FALSE(backend.is_excluded(path_of("target")).value);
    EXPECT_FALSE(backend.is_excluded(path_of("short")).value);
}

TEST_F(ExclusionTest, TaggingRefusesSymlinks) {
    mkdir("real");
    fs::create_directory_symlink(path_of("real"), path_of("link"));
    CacheDirTagBackend backend;

    EXPECT_TRUE(backend.add_exclusion(path_of("link")).is_err());
    EXPECT_FALSE(fs::exists(path_of("real/CACHEDIR.TAG")));
}

TEST_F(ExclusionTest, TaggingMissingDirectoryFails) {
    CacheDirTagBackend backend;
    EXPECT_TRUE(backend.add_exclusion(path_of("gone")).is_err());
}

// ── tmutil ──────────────────────────────────────────────────

TEST(TimeMachine, ParsesIsExcludedOutput) {
    EXPECT_TRUE(tmutil_reports_excluded("[Excluded]    /Users/me/app/node_modules\n"));
    EXPECT_FALSE(tmutil_reports_excluded("[Included]    /Users/me/app/node_modules\n"));
    EXPECT_FALSE(tmutil_reports_excluded(""));
}

TEST(Backends, FactoryResolvesNames) {
    auto tag = make_backend("cachedir-tag");
    ASSERT_TRUE(tag.is_ok());
    EXPECT_EQ(tag.value->name(), "cachedir-tag");

    auto tm = make_backend("tmutil");
    ASSERT_TRUE(tm.is_ok());
    EXPECT_EQ(tm.value->name(), "tmutil");

    auto automatic = make_backend("auto");
    ASSERT_TRUE(automatic.is_ok());
    EXPECT_EQ(automatic.value->name(), platform::is_macos() ? "tmutil" : "cachedir-tag");

    EXPECT_TRUE(make_backend("rsync").is_err());
}

// ── Disk usage ──────────────────────────────────────────────

TEST_F(ExclusionTest, DiskUsageCountsFiles) {
    write_file("deps/a.bin", noise(64 * 1024));
    write_file("deps/sub/b.bin", noise(64 * 1024));

    auto usage = disk_usage(path_of("deps"));
    ASSERT_TRUE(usage.is_ok()) << usage.error;
    EXPECT_GE(usage.value, 128u * 1024);
}

TEST_F(ExclusionTest, DiskUsageDoesNotFollowSymlinks) {
    write_file("big/blob", std::string(1024 * 1024, 'z'));
    mkdir("deps");
    fs::create_symlink(path_of("big/blob"), path_of("deps/blob"));
    fs::create_directory_symlink(path_of("big"), path_of("deps/bigdir"));

    auto usage = disk_usage(path_of("deps"));
    ASSERT_TRUE(usage.is_ok()) << usage.error;
    EXPECT_LT(usage.value, 1024u * 1024);
}

TEST_F(ExclusionTest, DiskUsageCountsHardLinksOnce) {
    write_file("deps/a.bin", noise(256 * 1024));
    fs::create_hard_link(path_of("deps/a.bin"), path_of("deps/b.bin"));

    auto once = disk_usage(path_of("deps/a.bin"));
    auto both = disk_usage(path_of("deps"));
    ASSERT_TRUE(once.is_ok());
    ASSERT_TRUE(both.is_ok());
    EXPECT_LT(both.value, 2 * once.value);
}

TEST_F(ExclusionTest, DiskUsageOfMissingPathFails) {
    EXPECT_TRUE(disk_usage(path_of("missing")).is_err());
}

// ── Applier ─────────────────────────────────────────────────

TEST_F(ExclusionTest, AppliesExclusionAndReportsSize) {
    write_file("node_modules/pkg/index.js", noise(32 * 1024));
    FakeBackend backend;
    ExclusionApplier applier(backend);

    auto outcome = applier.apply(path_of("node_modules"));
    EXPECT_EQ(outcome.status, ExclusionOutcome::EXCLUDED);
    EXPECT_GE(outcome.size_bytes, 32u * 1024);
    EXPECT_EQ(backend.add_calls, std::vector<fs::path>{path_of("node_modules")});
}

TEST_F(ExclusionTest, AlreadyExcludedIsReportedWithoutAdding) {
    mkdir("target");
    FakeBackend backend;
    backend.excluded.insert(path_of("target"));
    ExclusionApplier applier(backend);

    auto outcome = applier.apply(path_of("target"));
    EXPECT_EQ(outcome.status, ExclusionOutcome::ALREADY_EXCLUDED);
    EXPECT_TRUE(backend.add_calls.empty());
}

TEST_F(ExclusionTest, SecondApplyIsAlreadyExcluded) {
    mkdir("target");
    FakeBackend backend;
    ExclusionApplier applier(backend);

    EXPECT_EQ(applier.apply(path_of("target")).status, ExclusionOutcome::EXCLUDED);
    EXPECT_EQ(applier.apply(path_of("target")).status, ExclusionOutcome::ALREADY_EXCLUDED);
    EXPECT_EQ(backend.add_calls.size(), 1u);
}

TEST_F(ExclusionTest, DryRunNeverAdds) {
    write_file(".venv/lib/site.py", noise(8 * 1024));
    FakeBackend backend;
    ExclusionApplier applier(backend, true);

    auto outcome = applier.apply(path_of(".venv"));
    EXPECT_EQ(outcome.status, ExclusionOutcome::WOULD_EXCLUDE);
    EXPECT_GT(outcome.size_bytes, 0u);
    EXPECT_TRUE(backend.add_calls.empty());
    EXPECT_TRUE(backend.excluded.empty());
}

TEST_F(ExclusionTest, BackendFailuresBecomeFailedOutcomes) {
    mkdir("a");
    mkdir("b");
    FakeBackend backend;
    backend.fail_query.insert(path_of("a"));
    backend.fail_add.insert(path_of("b"));
    ExclusionApplier applier(backend);

    auto a = applier.apply(path_of("a"));
    EXPECT_EQ(a.status, ExclusionOutcome::FAILED);
    EXPECT_EQ(a.reason, "query refused");

    auto b = applier.apply(path_of("b"));
    EXPECT_EQ(b.status, ExclusionOutcome::FAILED);
    EXPECT_EQ(b.reason, "permission denied");
}

TEST_F(ExclusionTest, ApplierWithCacheDirTags) {
    mkdir("proj/node_modules");
    CacheDirTagBackend backend;
    ExclusionApplier applier(backend);

    EXPECT_EQ(applier.apply(path_of("proj/node_modules")).status, ExclusionOutcome::EXCLUDED);
    EXPECT_EQ(applier.apply(path_of("proj/node_modules")).status,
              ExclusionOutcome::ALREADY_EXCLUDED);
}
