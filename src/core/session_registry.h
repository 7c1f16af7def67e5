#pragma once

/**
 * @file session_registry.h
 * @brief (프로젝트, 세션) → 워크스페이스 경로 / 브랜치 이름 해석
 */

#include "core/session_types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace previewd::data {
class SessionRepository;
}

namespace previewd::core {

/**
 * @brief 경로 해석 결과
 */
struct WorkspacePathResult {
    bool success{false};
    std::filesystem::path path;         ///< 세션 워크스페이스 경로
    std::string branch;                 ///< 세션 브랜치 이름
    ErrorCode error{ErrorCode::None};
    std::string error_message;
};

/**
 * @brief 세션 레지스트리
 *
 * 경로: <workspace_root>/<project_id>/sessions/<session_id>
 * 브랜치: <branch_prefix><session_id>
 */
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<data::SessionRepository> repository,
                    std::filesystem::path workspace_root,
                    std::string branch_prefix);

    /**
     * @brief 세션 브랜치 이름 (순수 함수)
     */
    [[nodiscard]] static std::string branchName(const std::string& prefix, const SessionId& session_id);

    /**
     * @brief 설정된 접두사로 세션 브랜치 이름 생성
     */
    [[nodiscard]] std::string branchName(const SessionId& session_id) const;

    /**
     * @brief 세션 워크스페이스 경로 해석
     *
     * 세션 ID가 허용 목록을 벗어나면 InvalidArgument,
     * 활성 세션 레코드가 없으면 NotFound.
     */
    [[nodiscard]] WorkspacePathResult resolveWorkspacePath(int64_t project_id,
                                                           const std::string& session_id) const;

    /**
     * @brief 레코드 확인 없이 경로만 계산
     */
    [[nodiscard]] std::filesystem::path workspacePathFor(const SessionKey& key) const;

    /**
     * @brief 프로젝트 기본 체크아웃 경로
     */
    [[nodiscard]] std::filesystem::path primaryCheckoutPath(int64_t project_id) const;

    /**
     * @brief 활성 세션 레코드 조회
     */
    [[nodiscard]] std::optional<SessionRecord> lookup(const SessionKey& key) const;

    /**
     * @brief 세션 등록 (없으면 생성)
     * @return 생성되었거나 이미 있는 레코드
     */
    std::optional<SessionRecord> registerSession(int64_t project_id, const SessionId& session_id,
                                                 bool is_default = false);

    [[nodiscard]] const std::filesystem::path& workspaceRoot() const { return workspace_root_; }
    [[nodiscard]] const std::string& branchPrefix() const { return branch_prefix_; }

private:
    std::shared_ptr<data::SessionRepository> repository_;
    std::filesystem::path workspace_root_;
    std::string branch_prefix_;
};

} // namespace previewd::core
