#include "temp_tree.hpp"
#include "fake_backend.hpp"
#include <cli/depsweep_cli.hpp>
#include <cli/theme.hpp>
#include <core/constants.hpp>
#include <sstream>

class CliTest : public TempTreeTest {
protected:
    std::ostringstream out;

    void SetUp() override {
        TempTreeTest::SetUp();
        theme::disable_colors();
        mkdir("home");
        write_file("config/sentinels", "node_modules package.json\ntarget Cargo.toml\n");
        write_file("config/skip_paths", "Library\n");
    }

    CliOptions options(CliOptions::Mode mode = CliOptions::RUN) {
        CliOptions opts;
        opts.mode = mode;
        opts.color = false;
        opts.root = path_of("home");
        opts.config_dir = path_of("config");
        return opts;
    }

    void sample_tree() {
        mkdir("home/web/node_modules/left-pad");
        write_file("home/web/package.json", "{}");
        mkdir("home/rs/target/debug");
        write_file("home/rs/Cargo.toml");
        mkdir("home/Library/app/node_modules");
        write_file("home/Library/app/package.json");
    }
};

// ── Argument parsing ────────────────────────────────────────

TEST(CliArgs, DefaultsToRun) {
    auto parsed = parse_args({});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value.mode, CliOptions::RUN);
    EXPECT_FALSE(parsed.value.dry_run);
    EXPECT_FALSE(parsed.value.root.has_value());
}

TEST(CliArgs, ParsesAllFlags) {
    auto parsed = parse_args({"--root", "/data", "--config-dir", "/etc/ds", "-j", "4",
                              "--backend", "cachedir-tag", "--dry-run", "--no-color", "--list"});
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    const auto& o = parsed.value;
    EXPECT_EQ(o.mode, CliOptions::LIST);
    EXPECT_TRUE(o.dry_run);
    EXPECT_FALSE(o.color);
    EXPECT_EQ(*o.root, fs::path("/data"));
    EXPECT_EQ(*o.config_dir, fs::path("/etc/ds"));
    EXPECT_EQ(*o.jobs, 4);
    EXPECT_EQ(*o.backend, "cachedir-tag");
}

TEST(CliArgs, RejectsBadInput) {
    EXPECT_TRUE(parse_args({"--frobnicate"}).is_err());
    EXPECT_TRUE(parse_args({"--root"}).is_err());
    EXPECT_TRUE(parse_args({"-j", "0"}).is_err());
    EXPECT_TRUE(parse_args({"-j", "four"}).is_err());
    EXPECT_TRUE(parse_args({"--backend", "rsync"}).is_err());
}

TEST(CliArgs, HelpAndVersion) {
    EXPECT_EQ(parse_args({"--help"}).value.mode, CliOptions::HELP);
    EXPECT_EQ(parse_args({"-h"}).value.mode, CliOptions::HELP);
    EXPECT_EQ(parse_args({"--version"}).value.mode, CliOptions::VERSION);
}

// ── Runs ────────────────────────────────────────────────────

TEST_F(CliTest, ListPrintsMatchedPathsOnly) {
    sample_tree();
    DepsweepCLI cli(options(CliOptions::LIST), out);

    EXPECT_EQ(cli.run(), EXIT_OK);
    std::string text = out.str();
    EXPECT_NE(text.find(path_of("home/web/node_modules").string() + "\n"), std::string::npos);
    EXPECT_NE(text.find(path_of("home/rs/target").string() + "\n"), std::string::npos);
    EXPECT_EQ(text.find("Library"), std::string::npos);
    EXPECT_EQ(cli.summary().matches, 2u);
}

TEST_F(CliTest, RunExcludesThroughBackend) {
    sample_tree();
    auto backend = std::make_unique<FakeBackend>();
    FakeBackend* fake = backend.get();
    fake->excluded.insert(path_of("home/rs/target"));

    DepsweepCLI cli(options(), out);
    cli.set_backend(std::move(backend));

    EXPECT_EQ(cli.run(), EXIT_OK);
    EXPECT_EQ(fake->add_calls, std::vector<fs::path>{path_of("home/web/node_modules")});
    EXPECT_EQ(cli.summary().excluded, 1u);
    EXPECT_EQ(cli.summary().already_excluded, 1u);

    std::string text = out.str();
    EXPECT_NE(text.find("Excluded " + path_of("home/web/node_modules").string()), std::string::npos);
    EXPECT_NE(text.find("Already excluded " + path_of("home/rs/target").string()), std::string::npos);
    EXPECT_NE(text.find("Summary"), std::string::npos);
}

TEST_F(CliTest, DryRunLeavesStateAlone) {
    sample_tree();
    auto backend = std::make_unique<FakeBackend>();
    FakeBackend* fake = backend.get();

    auto opts = options();
    opts.dry_run = true;
    DepsweepCLI cli(opts, out);
    cli.set_backend(std::move(backend));

    EXPECT_EQ(cli.run(), EXIT_OK);
    EXPECT_TRUE(fake->add_calls.empty());
    EXPECT_EQ(cli.summary().would_exclude, 2u);
    EXPECT_NE(out.str().find("Would exclude"), std::string::npos);
}

TEST_F(CliTest, PerPathFailuresDoNotFailTheRun) {
    sample_tree();
    auto backend = std::make_unique<FakeBackend>();
    backend->fail_add.insert(path_of("home/web/node_modules"));

    DepsweepCLI cli(options(), out);
    cli.set_backend(std::move(backend));

    EXPECT_EQ(cli.run(), EXIT_OK);
    EXPECT_EQ(cli.summary().failed, 1u);
    EXPECT_EQ(cli.summary().excluded, 1u);
    EXPECT_NE(out.str().find("permission denied"), std::string::npos);
}

TEST_F(CliTest, ParallelRunMatchesSequential) {
    sample_tree();
    auto opts = options(CliOptions::LIST);
    opts.jobs = 4;
    DepsweepCLI cli(opts, out);

    EXPECT_EQ(cli.run(), EXIT_OK);
    EXPECT_EQ(cli.summary().matches, 2u);
}

TEST_F(CliTest, CachedirTagBackendEndToEnd) {
    sample_tree();
    auto opts = options();
    opts.backend = "cachedir-tag";

    DepsweepCLI first(opts, out);
    EXPECT_EQ(first.run(), EXIT_OK);
    EXPECT_EQ(first.summary().excluded, 2u);
    EXPECT_TRUE(fs::exists(path_of("home/web/node_modules/CACHEDIR.TAG")));
    EXPECT_FALSE(fs::exists(path_of("home/Library/app/node_modules/CACHEDIR.TAG")));

    DepsweepCLI second(opts, out);
    EXPECT_EQ(second.run(), EXIT_OK);
    EXPECT_EQ(second.summary().excluded, 0u);
    EXPECT_EQ(second.summary().already_excluded, 2u);
}

TEST_F(CliTest, MissingRootIsFatal) {
    auto opts = options(CliOptions::LIST);
    opts.root = path_of("nowhere");
    DepsweepCLI cli(opts, out);

    EXPECT_EQ(cli.run(), EXIT_FATAL);
    EXPECT_NE(out.str().find("does not exist"), std::string::npos);
}

TEST_F(CliTest, BrokenConfigIsFatal) {
    write_file("config/config.yaml", "backend: [\n");
    DepsweepCLI cli(options(CliOptions::LIST), out);

    EXPECT_EQ(cli.run(), EXIT_FATAL);
    EXPECT_NE(out.str().find("config:"), std::string::npos);
}

TEST_F(CliTest, FirstRunCreatesConfigDirectory) {
    sample_tree();
    auto opts = options(CliOptions::LIST);
    opts.config_dir = path_of("fresh");
    DepsweepCLI cli(opts, out);

    EXPECT_EQ(cli.run(), EXIT_OK);
    EXPECT_TRUE(fs::exists(path_of("fresh/skip_paths")));
    EXPECT_TRUE(fs::exists(path_of("fresh/sentinels")));
    EXPECT_EQ(cli.summary().matches, 2u);   // default rules skip Library too
}

TEST_F(CliTest, PreRaisedCancelReportsInterrupted) {
    sample_tree();
    auto backend = std::make_unique<FakeBackend>();
    DepsweepCLI cli(options(), out);
    cli.set_backend(std::move(backend));
    cli.cancel_token().store(true);

    EXPECT_EQ(cli.run(), EXIT_CANCELLED);
    EXPECT_TRUE(cli.summary().cancelled);
    EXPECT_EQ(cli.summary().matches, 0u);
    EXPECT_NE(out.str().find("Interrupted"), std::string::npos);
}
