#pragma once

/**
 * @file git_client.h
 * @brief git CLI 래퍼
 *
 * 모든 명령은 CommandRunner를 통해 argv 배열로 실행됩니다.
 * 자격 증명 토큰은 GIT_CONFIG_* 환경 변수로만 전달되고 로그에 남지 않습니다.
 */

#include "core/process_runner.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace previewd::vcs {

/**
 * @brief git 명령 결과
 */
struct GitResult {
    bool success{false};
    int exit_code{-1};
    std::string output;         ///< 표준 출력 (끝 공백 제거)
    std::string error_message;  ///< 실패 시 stderr 요약 (토큰 마스킹)
};

/**
 * @brief git 클라이언트
 */
class GitClient {
public:
    GitClient(std::shared_ptr<core::CommandRunner> runner,
              std::string git_binary = "git",
              std::chrono::milliseconds timeout = std::chrono::minutes(2));

    /**
     * @brief 임의 git 명령 실행
     * @param repo 작업 디렉토리 (비어있으면 현재 디렉토리)
     * @param args "git" 뒤에 올 인수
     * @param token 원격 인증 토큰 (비어있으면 인증 헤더 없음)
     */
    GitResult run(const std::filesystem::path& repo,
                  const std::vector<std::string>& args,
                  const std::string& token = "") const;

    // ============================
    // 조회
    // ============================

    /**
     * @brief 디렉토리가 git 작업 트리인지 확인
     */
    [[nodiscard]] bool isRepository(const std::filesystem::path& repo) const;

    /**
     * @brief 리비전을 전체 커밋 SHA로 해석
     * @return 커밋이 아니거나 없으면 std::nullopt
     */
    [[nodiscard]] std::optional<std::string> resolveCommit(const std::filesystem::path& repo,
                                                           const std::string& rev) const;

    /**
     * @brief 현재 브랜치 이름 (detached HEAD면 std::nullopt)
     */
    [[nodiscard]] std::optional<std::string> currentBranch(const std::filesystem::path& repo) const;

    /**
     * @brief ancestor가 descendant의 조상인지 (같으면 true)
     */
    [[nodiscard]] bool isAncestor(const std::filesystem::path& repo,
                                  const std::string& ancestor,
                                  const std::string& descendant) const;

    /**
     * @brief 로컬 브랜치 존재 여부
     */
    [[nodiscard]] bool localBranchExists(const std::filesystem::path& repo,
                                         const std::string& branch) const;

    /**
     * @brief 원격 추적 브랜치 존재 여부 (fetch 이후 기준)
     */
    [[nodiscard]] bool remoteBranchExists(const std::filesystem::path& repo,
                                          const std::string& remote,
                                          const std::string& branch) const;

    /**
     * @brief 원격 URL 조회
     */
    [[nodiscard]] std::optional<std::string> remoteUrl(const std::filesystem::path& repo,
                                                       const std::string& remote) const;

    /**
     * @brief 추적 중인 파일에 커밋되지 않은 변경이 있는지 (추적하지 않는 파일은 제외)
     */
    [[nodiscard]] bool hasUncommittedChanges(const std::filesystem::path& repo) const;

    // ============================
    // 변경
    // ============================

    GitResult clone(const std::string& source, const std::filesystem::path& dest) const;
    GitResult setRemoteUrl(const std::filesystem::path& repo, const std::string& remote,
                           const std::string& url) const;
    GitResult fetch(const std::filesystem::path& repo, const std::string& remote,
                    const std::string& token) const;
    GitResult checkout(const std::filesystem::path& repo, const std::string& branch) const;
    GitResult createBranch(const std::filesystem::path& repo, const std::string& branch,
                           const std::string& start_point) const;
    GitResult fastForward(const std::filesystem::path& repo, const std::string& upstream) const;
    GitResult resetHard(const std::filesystem::path& repo, const std::string& commit) const;

    /**
     * @brief 커밋을 원격 브랜치로 강제 푸시 (lease 조건부)
     *
     * 원격 브랜치가 expected_tip이 아니면 거부됩니다.
     *
     * @param commit 푸시할 커밋 (전체 SHA)
     * @param expected_tip 원격 브랜치의 현재 팁, std::nullopt면 브랜치가 없어야 함
     */
    GitResult forcePush(const std::filesystem::path& repo, const std::string& remote,
                        const std::string& commit, const std::string& branch,
                        const std::optional<std::string>& expected_tip,
                        const std::string& token) const;

    /**
     * @brief 토큰/자격 증명이 포함된 URL 마스킹 (로그용)
     */
    [[nodiscard]] static std::string redact(const std::string& text);

    /**
     * @brief 인증 헤더용 Basic 자격 증명 (base64)
     */
    [[nodiscard]] static std::string basicCredential(const std::string& token);

private:
    std::shared_ptr<core::CommandRunner> runner_;
    std::string git_binary_;
    std::chrono::milliseconds timeout_;
};

} // namespace previewd::vcs
