#pragma once

/**
 * @file preview_service.h
 * @brief 요청 처리기 파사드
 *
 * 세션 레지스트리, 오케스트레이터, 되돌리기 실행기, 감사 로그를
 * 요청 단위 연산으로 묶습니다. CLI와 외부 요청 처리기가 사용합니다.
 */

#include "core/config.h"
#include "core/session_types.h"
#include "data/session_repository.h"
#include "runtime/container_orchestrator.h"
#include "vcs/git_revert_operator.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace previewd::vcs {
class WorkspaceManager;
}

namespace previewd::core {

class SessionRegistry;

/**
 * @brief revert() 결과
 */
struct RevertOutcome {
    bool success{false};
    vcs::RevertResult revert;           ///< git 되돌리기 결과
    int64_t audit_id{-1};               ///< 감사 기록 ID (기록 실패 시 -1)
    bool restarted{false};              ///< 인스턴스를 재시작했는지
    std::string warning;                ///< 되돌리기는 성공했지만 감사 기록이 빠진 경우
    ErrorCode error{ErrorCode::None};
    std::string error_message;
};

/**
 * @brief archive() 결과
 */
struct ArchiveResult {
    bool success{false};
    std::string warning;                ///< 보관은 되었지만 정리가 일부 실패한 경우
    ErrorCode error{ErrorCode::None};
    std::string error_message;
};

/**
 * @brief 미리보기 서비스
 */
class PreviewService {
public:
    PreviewService(const Config& config,
                   std::shared_ptr<SessionRegistry> registry,
                   std::shared_ptr<data::SessionRepository> repository,
                   std::shared_ptr<vcs::WorkspaceManager> workspaces,
                   std::shared_ptr<vcs::GitRevertOperator> reverter,
                   std::shared_ptr<runtime::ContainerOrchestrator> orchestrator);

    // ============================
    // 세션
    // ============================

    /**
     * @brief 세션 생성 (이미 있으면 기존 레코드)
     */
    std::optional<SessionRecord> createSession(int64_t project_id, const std::string& session_id,
                                               bool is_default, ErrorCode* error = nullptr);

    [[nodiscard]] std::vector<SessionRecord> listSessions(int64_t project_id) const;

    /**
     * @brief 세션 보관: 레코드 보관, 인스턴스 정지, 워크스페이스 삭제
     *
     * 기본 세션은 보관할 수 없습니다 (InvalidArgument).
     */
    ArchiveResult archive(int64_t project_id, const std::string& session_id);

    // ============================
    // 미리보기
    // ============================

    runtime::StatusResult status(int64_t project_id, const std::string& session_id);
    runtime::InspectResult inspect(int64_t project_id, const std::string& session_id);
    runtime::StartResult start(int64_t project_id, const std::string& session_id,
                               const data::EnvVarList& env_vars = {},
                               const std::string& user_id = "");
    runtime::StopResult stop(int64_t project_id, const std::string& session_id);
    runtime::StartResult restart(int64_t project_id, const std::string& session_id);

    /**
     * @brief 프로젝트의 미리보기 URL 목록
     */
    [[nodiscard]] std::vector<runtime::PreviewUrlEntry> previewUrls(int64_t project_id) const;

    /**
     * @brief 미리보기 일괄 정지
     * @param project_id 지정하면 그 프로젝트만, 없으면 전체
     * @return 정지한 컨테이너 수
     */
    int stopAll(std::optional<int64_t> project_id = std::nullopt);

    // ============================
    // 되돌리기
    // ============================

    /**
     * @brief 세션 브랜치를 이전 커밋으로 되돌림
     *
     * 성공하면 감사 기록을 추가하고, restart_after가 true이면
     * 실행 중인 인스턴스를 재시작합니다.
     *
     * @param credential_token 비어있으면 설정의 기본 토큰 사용
     */
    RevertOutcome revert(int64_t project_id, const std::string& session_id,
                         const std::string& commit_sha,
                         const std::string& credential_token = "",
                         const std::string& triggering_message_id = "",
                         bool restart_after = true);

    [[nodiscard]] std::vector<RevertRecord> revertHistory(int64_t project_id,
                                                          const std::string& session_id) const;

private:
    Config config_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<data::SessionRepository> repository_;
    std::shared_ptr<vcs::WorkspaceManager> workspaces_;
    std::shared_ptr<vcs::GitRevertOperator> reverter_;
    std::shared_ptr<runtime::ContainerOrchestrator> orchestrator_;
};

} // namespace previewd::core
