#include <gtest/gtest.h>

#include <memory>

#include "discovery.hpp"
#include "test_helpers.hpp"

namespace {

// Stands in for bazel/ssh: records every argv and answers with a canned result.
struct FakeRunner {
    std::shared_ptr<std::vector<std::vector<std::string>>> calls = std::make_shared<std::vector<std::vector<std::string>>>();
    std::shared_ptr<CommandResult> result = std::make_shared<CommandResult>();

    Discovery::Runner runner() const {
        return [calls = calls, result = result](const std::vector<std::string>& args) {
            calls->push_back(args);
            return *result;
        };
    }
};

struct DiscoveryFixture : ::testing::Test {
    bzl_test::TempDir dir{"bzl_discovery"};
    FakeRunner fake;
    Discovery discovery{DiscoveryCache(dir.path()), fake.runner()};

    static DiscoveryOptions local_options() {
        DiscoveryOptions opts;
        opts.ttl = std::chrono::minutes(60);
        return opts;
    }

    static DiscoveryOptions remote_options() {
        auto opts = local_options();
        opts.remote = RemoteEndpoint{"user@build-host", "/srv/repo"};
        return opts;
    }
};

} // namespace

TEST_F(DiscoveryFixture, QueryParsesAndStores) {
    fake.result->stdout_output = "//a/b:x\n//a/b:y\n//c:z\n";
    const auto opts = local_options();

    const auto targets = discovery.query(opts);
    const TargetIndex expected{{"//a/b", {"x", "y"}}, {"//c", {"z"}}};
    EXPECT_EQ(targets, expected);
    ASSERT_EQ(fake.calls->size(), 1u);
    EXPECT_EQ(fake.calls->front(), (std::vector<std::string>{"bazel", "query", "kind('genrule', //...)"}));

    const auto cached = discovery.cache().read(opts);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->targets, expected);
}

TEST_F(DiscoveryFixture, LoadPrefersCache) {
    fake.result->stdout_output = "//a:x\n";
    const auto opts = local_options();

    const auto first = discovery.load(opts);
    EXPECT_FALSE(first.cached_at.has_value());

    fake.result->stdout_output = "//changed:y\n";
    const auto second = discovery.load(opts);
    EXPECT_TRUE(second.cached_at.has_value());
    EXPECT_EQ(second.targets, first.targets);
    EXPECT_EQ(fake.calls->size(), 1u);
}

TEST_F(DiscoveryFixture, ZeroTtlAlwaysQueries) {
    fake.result->stdout_output = "//a:x\n";
    auto opts = local_options();
    opts.ttl = std::chrono::seconds(0);

    (void)discovery.load(opts);
    (void)discovery.load(opts);
    EXPECT_EQ(fake.calls->size(), 2u);
}

TEST_F(DiscoveryFixture, RefreshBypassesCache) {
    fake.result->stdout_output = "//a:x\n";
    const auto opts = local_options();
    (void)discovery.load(opts);

    fake.result->stdout_output = "//b:y\n";
    const auto refreshed = discovery.refresh(opts);
    EXPECT_EQ(refreshed, (TargetIndex{{"//b", {"y"}}}));
    EXPECT_EQ(fake.calls->size(), 2u);

    const auto loaded = discovery.load(opts);
    EXPECT_EQ(loaded.targets, refreshed);
}

TEST_F(DiscoveryFixture, FailureCarriesStderr) {
    fake.result->exit_code = 2;
    fake.result->stderr_output = "  ERROR: no such package 'x'\n";
    try {
        (void)discovery.query(local_options());
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_EQ(e.kind(), DiscoveryError::Kind::ProcessFailure);
        EXPECT_STREQ(e.what(), "ERROR: no such package 'x'");
        EXPECT_FALSE(e.hint(std::nullopt).has_value());
    }
    EXPECT_FALSE(discovery.cache().read(local_options()).has_value());
}

TEST_F(DiscoveryFixture, FailureWithoutStderrUsesGenericMessage) {
    fake.result->exit_code = 1;
    try {
        (void)discovery.query(local_options());
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_STREQ(e.what(), "bazel query failed");
    }
    try {
        (void)discovery.query(remote_options());
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_STREQ(e.what(), "remote bazel query failed");
    }
}

TEST_F(DiscoveryFixture, NothingParsedIsEmptyResult) {
    fake.result->stdout_output = "Loading: 0 packages loaded\n";
    try {
        (void)discovery.query(local_options());
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_EQ(e.kind(), DiscoveryError::Kind::EmptyResult);
        EXPECT_STREQ(e.what(), "No targets found.");
    }
    EXPECT_FALSE(discovery.cache().read(local_options()).has_value());
}

TEST_F(DiscoveryFixture, RemoteQueryGoesThroughSsh) {
    fake.result->stdout_output = "//a:x\n";
    (void)discovery.query(remote_options());
    ASSERT_EQ(fake.calls->size(), 1u);
    const auto& args = fake.calls->front();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "ssh");
    EXPECT_EQ(args[1], "user@build-host");
    EXPECT_TRUE(args[2].starts_with("cd /srv/repo && bazel query"));

    // cached under the host, not under "local"
    EXPECT_TRUE(discovery.cache().read(remote_options()).has_value());
    EXPECT_FALSE(discovery.cache().read(local_options()).has_value());
}

TEST_F(DiscoveryFixture, MissingRemoteDirectoryGetsHint) {
    fake.result->exit_code = 1;
    fake.result->stderr_output = "bash: line 1: cd: /srv/repo: No such file or directory\n";
    const auto opts = remote_options();
    try {
        (void)discovery.query(opts);
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        const auto hint = e.hint(opts.remote);
        ASSERT_TRUE(hint.has_value());
        EXPECT_NE(hint->find("/srv/repo"), std::string::npos);
        EXPECT_NE(hint->find("user@build-host"), std::string::npos);
        EXPECT_NE(hint->find("--ssh-dir"), std::string::npos);
        EXPECT_FALSE(e.hint(std::nullopt).has_value());
    }
}

TEST_F(DiscoveryFixture, EnumerateKinds) {
    fake.result->stdout_output = "genrule rule //a:gen\ncc_binary rule //a:bin\ngenrule rule //b:g\n";
    EXPECT_EQ(discovery.enumerate_kinds(local_options()), (std::vector<std::string>{"cc_binary", "genrule"}));
    EXPECT_EQ(fake.calls->back(), (std::vector<std::string>{"bazel", "query", "//...", "--output", "label_kind"}));

    fake.result->exit_code = 1;
    EXPECT_TRUE(discovery.enumerate_kinds(local_options()).empty());
}

TEST_F(DiscoveryFixture, NonUtf8OutputIsReturnedUncached) {
    fake.result->stdout_output = "//a:caf\xe9\n";
    TargetIndex targets;
    EXPECT_NO_THROW(targets = discovery.query(local_options()));
    EXPECT_EQ(targets, (TargetIndex{{"//a", {"caf\xe9"}}}));
    EXPECT_FALSE(discovery.cache().read(local_options()).has_value());

    const auto loaded = discovery.load(local_options());
    EXPECT_EQ(loaded.targets, targets);
    EXPECT_FALSE(loaded.cached_at.has_value());
}

TEST_F(DiscoveryFixture, CopiesShareTheCacheRoot) {
    fake.result->stdout_output = "//a:x\n";
    const Discovery copy = discovery;
    (void)copy.query(local_options());
    EXPECT_TRUE(discovery.cache().read(local_options()).has_value());
}
