/**
 * @file test_core.cpp
 * @brief core 레이어 단위 테스트
 *
 * 테스트 대상:
 *   - SessionId: 허용 목록 검증
 *   - ErrorCode: 이름, 사용자 안내 문구
 *   - Config: key=value 적용, 환경 변수, 검증
 *   - PosixCommandRunner: 종료 코드, 출력 수집, 환경 변수, 시간 초과
 *   - SessionRegistry: 경로/브랜치 해석, NotFound/InvalidArgument
 *   - ActivityTracker: 활동 시각 단조 증가
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/activity_tracker.h"
#include "core/config.h"
#include "core/process_runner.h"
#include "core/session_registry.h"
#include "core/session_types.h"
#include "data/data_store.h"
#include "data/session_repository.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace previewd::core;
using previewd::data::DataStore;
using previewd::data::SessionRepository;

// ============================================================
// SessionId 테스트
// ============================================================

TEST(SessionIdTest, AcceptsAllowListedIds) {
    EXPECT_TRUE(SessionId::isValid("main"));
    EXPECT_TRUE(SessionId::isValid("s1"));
    EXPECT_TRUE(SessionId::isValid("chat_2024-01-05"));
    EXPECT_TRUE(SessionId::isValid("A"));
    EXPECT_TRUE(SessionId::isValid(std::string(SessionId::kMaxLength, 'a')));
}

TEST(SessionIdTest, RejectsTraversalAndMetacharacters) {
    EXPECT_FALSE(SessionId::isValid(""));
    EXPECT_FALSE(SessionId::isValid("../etc"));
    EXPECT_FALSE(SessionId::isValid("a/b"));
    EXPECT_FALSE(SessionId::isValid("a b"));
    EXPECT_FALSE(SessionId::isValid("a;rm -rf"));
    EXPECT_FALSE(SessionId::isValid("$(whoami)"));
    EXPECT_FALSE(SessionId::isValid("a.b"));
    EXPECT_FALSE(SessionId::isValid(std::string(SessionId::kMaxLength + 1, 'a')));
}

TEST(SessionIdTest, RejectsOptionLikeIds) {
    EXPECT_FALSE(SessionId::isValid("-x"));
    EXPECT_FALSE(SessionId::isValid("--force"));
    EXPECT_FALSE(SessionId::isValid("_hidden"));
}

TEST(SessionIdTest, ParseKeepsValue) {
    auto id = SessionId::parse("feature-1");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), "feature-1");
    EXPECT_FALSE(SessionId::parse("bad/id").has_value());

    SessionKey key{42, *id};
    EXPECT_EQ(key.toString(), "42/feature-1");
}

// ============================================================
// ErrorCode 테스트
// ============================================================

TEST(ErrorCodeTest, NamesMatchTaxonomy) {
    EXPECT_STREQ(errorCodeName(ErrorCode::NotFound), "NotFound");
    EXPECT_STREQ(errorCodeName(ErrorCode::BranchConflict), "BranchConflict");
    EXPECT_STREQ(errorCodeName(ErrorCode::NotReachable), "NotReachable");
    EXPECT_STREQ(errorCodeName(ErrorCode::StartTimeout), "StartTimeout");
    EXPECT_STREQ(errorCodeName(ErrorCode::ResourceExhausted), "ResourceExhausted");
    EXPECT_STREQ(errorCodeName(ErrorCode::PushRejected), "PushRejected");
}

TEST(ErrorCodeTest, UserFacingMessageHidesInternals) {
    EXPECT_TRUE(userFacingMessage(ErrorCode::None).empty());
    for (auto code : {ErrorCode::StartTimeout, ErrorCode::ResourceExhausted,
                      ErrorCode::RuntimeUnavailable, ErrorCode::Internal}) {
        EXPECT_EQ(userFacingMessage(code), userFacingMessage(ErrorCode::StartTimeout))
            << "런타임 계열 에러는 같은 재시도 안내를 보여줘야 합니다";
    }
    EXPECT_NE(userFacingMessage(ErrorCode::NotReachable), userFacingMessage(ErrorCode::NotFound));
}

// ============================================================
// Config 테스트
// ============================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        ::unsetenv("PREVIEWD_CONTAINER_IMAGE");
        ::unsetenv("PREVIEWD_IDLE_IDLE_THRESHOLD_MS");
        std::error_code ec;
        std::filesystem::remove(file_, ec);
    }

    std::filesystem::path file_ = std::filesystem::temp_directory_path() / "previewd_config_test.conf";
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_FALSE(config.validate().has_value());
    EXPECT_EQ(config.git.branch_prefix, "kosuke/chat-");
    EXPECT_EQ(config.container.probe_timeout_ms, 2000);
    EXPECT_EQ(config.container.start_timeout_ms, 120000);
    EXPECT_EQ(config.container.claim_ttl_ms, 60000);
    EXPECT_EQ(config.container.port_conflict_retries, 3);
    EXPECT_EQ(config.idle.idle_threshold_ms, 30LL * 60 * 1000);
}

TEST_F(ConfigTest, ApplyKnownAndUnknownKeys) {
    Config config;
    EXPECT_TRUE(config.apply("container.image", "example/app:1"));
    EXPECT_TRUE(config.apply("container.port_range_start", "4000"));
    EXPECT_TRUE(config.apply("container.router_mode", "traefik"));
    EXPECT_EQ(config.container.image, "example/app:1");
    EXPECT_EQ(config.container.port_range_start, 4000);
    EXPECT_EQ(config.container.router_mode, RouterMode::Traefik);

    EXPECT_FALSE(config.apply("container.unknown", "x"));
    EXPECT_FALSE(config.apply("container.port_range_start", "abc"))
        << "숫자가 아닌 값은 거부되어야 합니다";
}

TEST_F(ConfigTest, LoadsFileThenEnvironment) {
    {
        std::ofstream out(file_);
        out << "# 주석\n"
            << "container.image = file/image:2\n"
            << "git.branch_prefix=preview/\n"
            << "idle.idle_threshold_ms=1000\n";
    }
    ::setenv("PREVIEWD_CONTAINER_IMAGE", "env/image:3", 1);

    Config config = Config::load(file_.string());
    EXPECT_EQ(config.container.image, "env/image:3") << "환경 변수가 파일 값을 덮어야 합니다";
    EXPECT_EQ(config.git.branch_prefix, "preview/");
    EXPECT_EQ(config.idle.idle_threshold_ms, 1000);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config config;
    config.container.port_range_start = 5000;
    config.container.port_range_end = 4000;
    EXPECT_TRUE(config.validate().has_value());

    Config traefik;
    traefik.container.router_mode = RouterMode::Traefik;
    EXPECT_TRUE(traefik.validate().has_value()) << "traefik 모드는 기본 도메인이 필요합니다";
    traefik.container.base_domain = "preview.example.com";
    EXPECT_FALSE(traefik.validate().has_value());

    Config probe;
    probe.container.health_path = "health";
    EXPECT_TRUE(probe.validate().has_value());
}

// ============================================================
// PosixCommandRunner 테스트
// ============================================================

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    PosixCommandRunner runner;
    auto ok = runner.run({"sh", "-c", "echo out; echo err >&2"});
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.stdout_text, "out\n");
    EXPECT_EQ(ok.stderr_text, "err\n");

    auto failed = runner.run({"sh", "-c", "exit 3"});
    EXPECT_TRUE(failed.launched);
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_FALSE(failed.ok());
}

TEST(ProcessRunnerTest, MissingExecutableIsNotLaunched) {
    PosixCommandRunner runner;
    auto result = runner.run({"previewd-no-such-binary-xyz"});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.ok());
}

TEST(ProcessRunnerTest, PassesExtraEnvironmentAndWorkingDir) {
    PosixCommandRunner runner;
    ProcessOptions options;
    options.extra_env = {{"PREVIEWD_TEST_VALUE", "secret-value"}};
    options.working_dir = std::filesystem::temp_directory_path();

    auto result = runner.run({"sh", "-c", "printf '%s' \"$PREVIEWD_TEST_VALUE\"; echo; pwd"}, options);
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_THAT(result.stdout_text, ::testing::StartsWith("secret-value\n"));
    EXPECT_THAT(result.stdout_text,
                ::testing::HasSubstr(std::filesystem::canonical(options.working_dir).string()));
}

TEST(ProcessRunnerTest, KillsOnTimeout) {
    PosixCommandRunner runner;
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    auto result = runner.run({"sleep", "5"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

// ============================================================
// SessionRegistry / ActivityTracker 테스트
// ============================================================

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<DataStore>();
        ASSERT_TRUE(store_->open(":memory:"));
        repository_ = std::make_shared<SessionRepository>(store_);
        ASSERT_TRUE(repository_->initialize());
        root_ = std::filesystem::temp_directory_path() / "previewd_registry_test";
        registry_ = std::make_shared<SessionRegistry>(repository_, root_, "kosuke/chat-");
    }

    std::shared_ptr<DataStore> store_;
    std::shared_ptr<SessionRepository> repository_;
    std::shared_ptr<SessionRegistry> registry_;
    std::filesystem::path root_;
};

TEST_F(SessionRegistryTest, BranchNameIsPure) {
    auto id = SessionId::parse("s1");
    ASSERT_TRUE(id);
    EXPECT_EQ(SessionRegistry::branchName("kosuke/chat-", *id), "kosuke/chat-s1");
    EXPECT_EQ(registry_->branchName(*id), registry_->branchName(*id));
}

TEST_F(SessionRegistryTest, ResolvesRegisteredSession) {
    auto id = SessionId::parse("s1");
    ASSERT_TRUE(registry_->registerSession(42, *id));

    auto resolved = registry_->resolveWorkspacePath(42, "s1");
    ASSERT_TRUE(resolved.success) << resolved.error_message;
    EXPECT_EQ(resolved.branch, "kosuke/chat-s1");
    EXPECT_EQ(resolved.path.filename(), "s1");
    EXPECT_EQ(resolved.path.parent_path().filename(), "sessions");
    EXPECT_EQ(resolved.path, registry_->workspacePathFor(SessionKey{42, *id}));
}

TEST_F(SessionRegistryTest, DistinctKeysGetDistinctPaths) {
    auto a = SessionId::parse("a");
    auto b = SessionId::parse("b");
    EXPECT_NE(registry_->workspacePathFor({1, *a}), registry_->workspacePathFor({1, *b}));
    EXPECT_NE(registry_->workspacePathFor({1, *a}), registry_->workspacePathFor({2, *a}));
}

TEST_F(SessionRegistryTest, UnknownOrArchivedSessionIsNotFound) {
    auto missing = registry_->resolveWorkspacePath(42, "nope");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error, ErrorCode::NotFound);

    auto id = SessionId::parse("old");
    ASSERT_TRUE(registry_->registerSession(42, *id));
    ASSERT_TRUE(repository_->archiveSession(42, "old"));
    auto archived = registry_->resolveWorkspacePath(42, "old");
    EXPECT_EQ(archived.error, ErrorCode::NotFound);
}

TEST_F(SessionRegistryTest, InvalidIdIsRejected) {
    auto result = registry_->resolveWorkspacePath(42, "../../etc");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::InvalidArgument);
}

TEST_F(SessionRegistryTest, ActivityNeverDecreases) {
    auto id = SessionId::parse("s1");
    ASSERT_TRUE(registry_->registerSession(7, *id));
    SessionKey key{7, *id};

    int64_t fake_now = 5'000'000'000'000;
    ActivityTracker tracker(repository_, [&fake_now]() { return fake_now; });

    ASSERT_TRUE(tracker.touch(key));
    EXPECT_EQ(tracker.lastActivity(key), fake_now);

    // 늦게 도착한 과거 시각 갱신은 무시
    fake_now -= 60'000;
    EXPECT_TRUE(tracker.touch(key));
    EXPECT_EQ(tracker.lastActivity(key), 5'000'000'000'000);

    fake_now += 120'000;
    tracker.touch(key);
    EXPECT_EQ(tracker.lastActivity(key), fake_now);
}
