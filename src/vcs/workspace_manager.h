#pragma once

/**
 * @file workspace_manager.h
 * @brief 세션 워크스페이스(체크아웃) 준비
 *
 * 첫 요청 시 프로젝트 기본 체크아웃에서 세션 체크아웃을 만들고
 * 세션 브랜치를 생성합니다. 이후 요청에서는 원격보다 뒤처져 있으면
 * fast-forward 합니다. 일관되지 않은 상태는 BranchConflict로 보고합니다.
 */

#include "core/session_types.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace previewd::core {
class SessionRegistry;
}

namespace previewd::vcs {

class GitClient;

/**
 * @brief 준비 과정에서 수행한 작업
 */
enum class WorkspaceAction {
    None,           ///< 실패
    Created,        ///< 새로 생성
    FastForwarded,  ///< 원격 따라잡음
    UpToDate        ///< 변경 없음
};

[[nodiscard]] const char* workspaceActionName(WorkspaceAction action);

/**
 * @brief 준비 결과
 */
struct WorkspaceResult {
    bool success{false};
    std::filesystem::path path;
    std::string branch;
    std::string remote_url;             ///< 세션 체크아웃의 원격 (토큰 없음)
    std::string head_commit;
    WorkspaceAction action{WorkspaceAction::None};
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief 워크스페이스 관리자
 *
 * 같은 세션에 대한 준비는 프로세스 안에서 직렬화됩니다.
 * 프로세스 간 중복은 상위의 프로비저닝 클레임이 막습니다.
 */
class WorkspaceManager {
public:
    WorkspaceManager(std::shared_ptr<core::SessionRegistry> registry,
                     std::shared_ptr<GitClient> git,
                     std::string remote_name = "origin");

    // 복사 금지
    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    /**
     * @brief 세션 체크아웃 준비
     * @param key 세션 키
     * @param token 원격 인증 토큰 (비공개 저장소)
     */
    WorkspaceResult prepare(const core::SessionKey& key, const std::string& token = "");

    /**
     * @brief 세션 워크스페이스 삭제
     * @return 삭제했거나 원래 없으면 true
     */
    bool remove(const core::SessionKey& key);

    /**
     * @brief 세션 잠금을 잡은 채 fn 실행
     *
     * prepare()와 같은 잠금이므로 fn이 도는 동안 같은 세션의 fetch/fast-forward가
     * 끼어들지 않습니다. fn 안에서 같은 세션의 prepare()/remove()를 부르면 교착됩니다.
     */
    template <typename Fn>
    auto withSessionLock(const core::SessionKey& key, Fn&& fn) -> decltype(fn()) {
        std::lock_guard lock(lockFor(key));
        return fn();
    }

    /**
     * @brief 워크스페이스 존재 여부
     */
    [[nodiscard]] bool exists(const core::SessionKey& key) const;

private:
    WorkspaceResult createWorkspace(const core::SessionKey& key,
                                    const std::filesystem::path& path,
                                    const std::string& branch,
                                    const std::string& token);

    WorkspaceResult syncWorkspace(const std::filesystem::path& path,
                                  const std::string& branch,
                                  const std::string& token);

    std::mutex& lockFor(const core::SessionKey& key);

    std::shared_ptr<core::SessionRegistry> registry_;
    std::shared_ptr<GitClient> git_;
    std::string remote_name_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> session_locks_;
};

} // namespace previewd::vcs
