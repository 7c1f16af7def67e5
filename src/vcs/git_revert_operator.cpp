/**
 * @file git_revert_operator.cpp
 * @brief git 되돌리기 구현
 */

#include "git_revert_operator.h"
#include "git_client.h"

#include <cctype>
#include <iostream>
#include <optional>

namespace previewd::vcs {

using core::ErrorCode;

namespace {

RevertResult failure(ErrorCode code, std::string message) {
    RevertResult result;
    result.error = code;
    result.error_message = std::move(message);
    std::cerr << "[GitRevertOperator] 되돌리기 실패: " << core::errorCodeName(code)
              << " - " << result.error_message << std::endl;
    return result;
}

} // 익명 네임스페이스

GitRevertOperator::GitRevertOperator(std::shared_ptr<GitClient> git, std::string remote_name)
    : git_(std::move(git))
    , remote_name_(std::move(remote_name)) {}

bool GitRevertOperator::isValidSha(const std::string& sha) {
    if (sha.size() < 4 || sha.size() > 64) return false;
    for (char c : sha) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

RevertResult GitRevertOperator::revertToCommit(const std::filesystem::path& workspace_path,
                                               const std::string& target_commit_sha,
                                               const std::string& credential_token) {
    if (!isValidSha(target_commit_sha)) {
        return failure(ErrorCode::InvalidArgument, "잘못된 커밋 SHA 형식");
    }
    if (!git_->isRepository(workspace_path)) {
        return failure(ErrorCode::NotFound, "워크스페이스가 없습니다: " + workspace_path.string());
    }

    auto branch = git_->currentBranch(workspace_path);
    if (!branch) {
        return failure(ErrorCode::BranchConflict, "detached HEAD 상태에서는 되돌릴 수 없습니다");
    }

    auto previous_tip = git_->resolveCommit(workspace_path, "HEAD");
    if (!previous_tip) {
        return failure(ErrorCode::BranchConflict, "현재 팁을 해석할 수 없습니다");
    }

    // hard reset이 지울 변경은 건드리지 않음
    if (git_->hasUncommittedChanges(workspace_path)) {
        return failure(ErrorCode::BranchConflict, *branch + "에 커밋되지 않은 변경이 있습니다");
    }

    // 1. 조상 확인 (실패하면 아무것도 바꾸지 않음)
    auto target = git_->resolveCommit(workspace_path, target_commit_sha);
    if (!target) {
        return failure(ErrorCode::NotReachable, "커밋을 찾을 수 없습니다: " + target_commit_sha);
    }
    if (!git_->isAncestor(workspace_path, *target, *previous_tip)) {
        return failure(ErrorCode::NotReachable,
                       "커밋이 " + *branch + " 이력에 없습니다: " + *target);
    }

    // 2. 원격 팁 확인 (푸시 lease 기준값)
    auto fetched = git_->fetch(workspace_path, remote_name_, credential_token);
    if (!fetched.success) {
        return failure(ErrorCode::PushRejected, "원격에 접근할 수 없습니다: " + fetched.error_message);
    }
    std::optional<std::string> remote_tip;
    if (git_->remoteBranchExists(workspace_path, remote_name_, *branch)) {
        remote_tip = git_->resolveCommit(workspace_path, remote_name_ + "/" + *branch);
    }

    std::cout << "[GitRevertOperator] " << *branch << ": "
              << previous_tip->substr(0, 12) << " -> " << target->substr(0, 12) << std::endl;

    // 3. 로컬 hard reset
    auto reset = git_->resetHard(workspace_path, *target);
    if (!reset.success) {
        // reset 도중 실패해도 원래 팁으로 되돌려 둠
        auto restore = git_->resetHard(workspace_path, *previous_tip);
        if (!restore.success) {
            std::cerr << "[GitRevertOperator] 로컬 복구 실패: " << restore.error_message << std::endl;
        }
        return failure(ErrorCode::Internal, "reset 실패: " + reset.error_message);
    }

    // 4. 확인한 커밋 자체를 푸시. 그 사이 원격이 움직였으면 거부됨
    auto pushed = git_->forcePush(workspace_path, remote_name_, *target, *branch, remote_tip, credential_token);
    if (!pushed.success) {
        auto restore = git_->resetHard(workspace_path, *previous_tip);
        if (!restore.success) {
            std::cerr << "[GitRevertOperator] 푸시 실패 후 로컬 복구 실패: "
                      << restore.error_message << std::endl;
        }
        return failure(ErrorCode::PushRejected, "원격이 업데이트를 거부했습니다: " + pushed.error_message);
    }

    // 다른 프로세스가 푸시 중에 로컬 브랜치를 옮겼으면 다시 맞춤
    auto local_tip = git_->resolveCommit(workspace_path, "HEAD");
    if (local_tip != target) {
        std::cerr << "[GitRevertOperator] 푸시 중 로컬 팁이 바뀌었습니다 ("
                  << local_tip.value_or("?").substr(0, 12) << "), 대상으로 재설정" << std::endl;
        auto realigned = git_->resetHard(workspace_path, *target);
        if (!realigned.success) {
            return failure(ErrorCode::Internal, "푸시 후 로컬 재설정 실패: " + realigned.error_message);
        }
    }

    // 원격 추적 브랜치도 맞춰 둠 (다음 준비 단계의 fast-forward 판정용)
    auto refreshed = git_->fetch(workspace_path, remote_name_, credential_token);
    if (!refreshed.success) {
        std::cerr << "[GitRevertOperator] 푸시 후 fetch 실패 (무시): " << refreshed.error_message << std::endl;
    }

    RevertResult result;
    result.success = true;
    result.reverted_to_commit = *target;
    result.previous_commit = *previous_tip;
    result.branch = *branch;

    std::cout << "[GitRevertOperator] 되돌리기 완료: " << *branch << " @ " << target->substr(0, 12) << std::endl;
    return result;
}

} // namespace previewd::vcs
