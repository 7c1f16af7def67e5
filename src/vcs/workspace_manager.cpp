/**
 * @file workspace_manager.cpp
 * @brief 세션 워크스페이스 준비 구현
 */

#include "workspace_manager.h"
#include "git_client.h"
#include "core/session_registry.h"

#include <iostream>

namespace fs = std::filesystem;

namespace previewd::vcs {

using core::ErrorCode;

namespace {

WorkspaceResult failure(ErrorCode code, std::string message) {
    WorkspaceResult result;
    result.error = code;
    result.error_message = std::move(message);
    return result;
}

/// 실패한 생성 시도의 잔여 디렉토리 정리
void discardPartial(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[WorkspaceManager] 잔여 디렉토리 삭제 실패: " << path
                  << " (" << ec.message() << ")" << std::endl;
    }
}

} // 익명 네임스페이스

const char* workspaceActionName(WorkspaceAction action) {
    switch (action) {
        case WorkspaceAction::Created:       return "created";
        case WorkspaceAction::FastForwarded: return "fast-forwarded";
        case WorkspaceAction::UpToDate:      return "up-to-date";
        case WorkspaceAction::None:          break;
    }
    return "none";
}

WorkspaceManager::WorkspaceManager(std::shared_ptr<core::SessionRegistry> registry,
                                   std::shared_ptr<GitClient> git,
                                   std::string remote_name)
    : registry_(std::move(registry))
    , git_(std::move(git))
    , remote_name_(std::move(remote_name)) {}

// ============================================================
// 준비
// ============================================================

WorkspaceResult WorkspaceManager::prepare(const core::SessionKey& key, const std::string& token) {
    auto resolved = registry_->resolveWorkspacePath(key.project_id, key.session_id.str());
    if (!resolved.success) {
        return failure(resolved.error, resolved.error_message);
    }

    std::lock_guard lock(lockFor(key));

    std::error_code ec;
    bool present = fs::exists(resolved.path, ec);

    if (present && !git_->isRepository(resolved.path)) {
        // 이전 시도가 남긴 빈 디렉토리는 정리 후 새로 생성
        if (fs::is_directory(resolved.path, ec) && fs::is_empty(resolved.path, ec)) {
            discardPartial(resolved.path);
            present = false;
        } else {
            return failure(ErrorCode::BranchConflict,
                           "워크스페이스가 git 체크아웃이 아닙니다: " + resolved.path.string());
        }
    }

    WorkspaceResult result = present
        ? syncWorkspace(resolved.path, resolved.branch, token)
        : createWorkspace(key, resolved.path, resolved.branch, token);

    if (result.success) {
        std::cout << "[WorkspaceManager] " << key.toString() << " 준비 완료 ("
                  << workspaceActionName(result.action) << ", " << result.branch
                  << " @ " << result.head_commit.substr(0, 12) << ")" << std::endl;
    } else {
        std::cerr << "[WorkspaceManager] " << key.toString() << " 준비 실패: "
                  << core::errorCodeName(result.error) << " - " << result.error_message << std::endl;
    }
    return result;
}

WorkspaceResult WorkspaceManager::createWorkspace(const core::SessionKey& key,
                                                  const fs::path& path,
                                                  const std::string& branch,
                                                  const std::string& token) {
    fs::path primary = registry_->primaryCheckoutPath(key.project_id);
    if (!git_->isRepository(primary)) {
        return failure(ErrorCode::NotFound,
                       "프로젝트 기본 체크아웃이 없습니다: " + primary.string());
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return failure(ErrorCode::Internal, "디렉토리 생성 실패: " + ec.message());
    }

    // 1. 기본 체크아웃에서 복제
    auto cloned = git_->clone(primary.string(), path);
    if (!cloned.success) {
        discardPartial(path);
        return failure(ErrorCode::Internal, "복제 실패: " + cloned.error_message);
    }

    // 2. 원격을 기본 체크아웃의 업스트림으로 교체 (없으면 기본 체크아웃 자체가 원격)
    std::string remote_url = primary.string();
    if (auto upstream = git_->remoteUrl(primary, remote_name_)) {
        auto set = git_->setRemoteUrl(path, remote_name_, *upstream);
        if (!set.success) {
            discardPartial(path);
            return failure(ErrorCode::Internal, "원격 설정 실패: " + set.error_message);
        }
        remote_url = *upstream;
    }

    // 3. 원격 최신 상태 가져오기
    auto fetched = git_->fetch(path, remote_name_, token);
    if (!fetched.success) {
        discardPartial(path);
        return failure(ErrorCode::BranchConflict, "원격에 접근할 수 없습니다: " + fetched.error_message);
    }

    // 4. 세션 브랜치 생성/체크아웃
    GitResult switched;
    if (git_->localBranchExists(path, branch)) {
        switched = git_->checkout(path, branch);
    } else if (git_->remoteBranchExists(path, remote_name_, branch)) {
        switched = git_->createBranch(path, branch, remote_name_ + "/" + branch);
    } else {
        switched = git_->createBranch(path, branch, "HEAD");
    }
    if (!switched.success) {
        discardPartial(path);
        return failure(ErrorCode::BranchConflict,
                       "세션 브랜치 생성 실패 (" + branch + "): " + switched.error_message);
    }

    WorkspaceResult result;
    result.success = true;
    result.path = path;
    result.branch = branch;
    result.remote_url = GitClient::redact(remote_url);
    result.head_commit = git_->resolveCommit(path, "HEAD").value_or("");
    result.action = WorkspaceAction::Created;
    return result;
}

WorkspaceResult WorkspaceManager::syncWorkspace(const fs::path& path,
                                                const std::string& branch,
                                                const std::string& token) {
    // 1. 세션 브랜치 확인
    auto current = git_->currentBranch(path);
    if (!current || *current != branch) {
        if (!git_->localBranchExists(path, branch)) {
            return failure(ErrorCode::BranchConflict,
                           "워크스페이스에 세션 브랜치가 없습니다: " + branch);
        }
        if (git_->hasUncommittedChanges(path)) {
            return failure(ErrorCode::BranchConflict,
                           "다른 브랜치(" + current.value_or("detached") + ")에 미커밋 변경이 있습니다");
        }
        auto switched = git_->checkout(path, branch);
        if (!switched.success) {
            return failure(ErrorCode::BranchConflict, "브랜치 전환 실패: " + switched.error_message);
        }
    }

    // 2. 원격 가져오기
    auto fetched = git_->fetch(path, remote_name_, token);
    if (!fetched.success) {
        return failure(ErrorCode::BranchConflict, "원격에 접근할 수 없습니다: " + fetched.error_message);
    }

    WorkspaceResult result;
    result.path = path;
    result.branch = branch;
    result.remote_url = GitClient::redact(git_->remoteUrl(path, remote_name_).value_or(""));

    auto local_head = git_->resolveCommit(path, "HEAD");
    if (!local_head) {
        return failure(ErrorCode::BranchConflict, "HEAD를 해석할 수 없습니다");
    }

    // 3. 원격 브랜치가 아직 없으면 (푸시 전) 그대로 사용
    std::string upstream = remote_name_ + "/" + branch;
    auto remote_head = git_->remoteBranchExists(path, remote_name_, branch)
        ? git_->resolveCommit(path, upstream)
        : std::nullopt;

    if (!remote_head || *remote_head == *local_head) {
        result.success = true;
        result.action = WorkspaceAction::UpToDate;
        result.head_commit = *local_head;
        return result;
    }

    // 4. 뒤처져 있으면 fast-forward, 앞서 있으면 유지, 갈라졌으면 충돌
    if (git_->isAncestor(path, *local_head, *remote_head)) {
        auto merged = git_->fastForward(path, upstream);
        if (!merged.success) {
            return failure(ErrorCode::BranchConflict, "fast-forward 실패: " + merged.error_message);
        }
        result.success = true;
        result.action = WorkspaceAction::FastForwarded;
        result.head_commit = *remote_head;
        return result;
    }

    if (git_->isAncestor(path, *remote_head, *local_head)) {
        result.success = true;
        result.action = WorkspaceAction::UpToDate;
        result.head_commit = *local_head;
        return result;
    }

    return failure(ErrorCode::BranchConflict,
                   "로컬과 원격 브랜치가 갈라졌습니다: " + branch);
}

// ============================================================
// 삭제 / 조회
// ============================================================

bool WorkspaceManager::remove(const core::SessionKey& key) {
    std::lock_guard lock(lockFor(key));

    fs::path path = registry_->workspacePathFor(key);
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[WorkspaceManager] 삭제 실패: " << path << " (" << ec.message() << ")" << std::endl;
        return false;
    }
    std::cout << "[WorkspaceManager] 워크스페이스 삭제: " << key.toString() << std::endl;
    return true;
}

bool WorkspaceManager::exists(const core::SessionKey& key) const {
    std::error_code ec;
    return fs::exists(registry_->workspacePathFor(key), ec);
}

std::mutex& WorkspaceManager::lockFor(const core::SessionKey& key) {
    std::lock_guard lock(locks_mutex_);
    auto& slot = session_locks_[key.toString()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

} // namespace previewd::vcs
