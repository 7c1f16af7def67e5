#pragma once

/**
 * @file git_revert_operator.h
 * @brief 세션 브랜치를 이전 커밋으로 되돌리고 원격을 강제 업데이트
 *
 * 파괴적 연산입니다. 대상 이후의 커밋은 원격 브랜치 이력에서 사라집니다.
 * 실패 시 로컬 브랜치는 호출 전 상태로 복구됩니다.
 */

#include "core/session_types.h"

#include <filesystem>
#include <memory>
#include <string>

namespace previewd::vcs {

class GitClient;

/**
 * @brief 되돌리기 결과
 */
struct RevertResult {
    bool success{false};
    std::string reverted_to_commit;     ///< 되돌린 대상 (전체 SHA)
    std::string previous_commit;        ///< 되돌리기 전 팁
    std::string branch;                 ///< 대상 브랜치
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief git 되돌리기 실행기
 */
class GitRevertOperator {
public:
    explicit GitRevertOperator(std::shared_ptr<GitClient> git,
                               std::string remote_name = "origin");

    /**
     * @brief 워크스페이스 브랜치를 대상 커밋으로 되돌림
     *
     * 1. 대상이 현재 팁의 조상인지 확인 (아니면 NotReachable, 브랜치 변경 없음)
     * 2. 원격을 가져와 원격 팁 기록
     * 3. 로컬 브랜치를 대상으로 hard reset
     * 4. 대상 커밋을 원격 브랜치로 강제 푸시. 원격 팁이 2의 값과 다르면 거부
     *    (실패 시 로컬 복구 후 PushRejected)
     *
     * 커밋되지 않은 변경이 있으면 BranchConflict입니다. 같은 세션의 워크스페이스
     * 준비와 겹치지 않도록 WorkspaceManager::withSessionLock 안에서 호출합니다.
     *
     * @param workspace_path 세션 워크스페이스
     * @param target_commit_sha 대상 커밋 (4~64자리 16진수)
     * @param credential_token 원격 인증 토큰
     */
    RevertResult revertToCommit(const std::filesystem::path& workspace_path,
                                const std::string& target_commit_sha,
                                const std::string& credential_token);

    /**
     * @brief SHA 형식 검사 (4~64자리 16진수)
     */
    [[nodiscard]] static bool isValidSha(const std::string& sha);

private:
    std::shared_ptr<GitClient> git_;
    std::string remote_name_;
};

} // namespace previewd::vcs
