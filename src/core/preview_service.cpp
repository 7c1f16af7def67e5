/**
 * @file preview_service.cpp
 * @brief 미리보기 서비스 구현
 */

#include "preview_service.h"
#include "core/session_registry.h"
#include "vcs/workspace_manager.h"

#include <iostream>

namespace previewd::core {

PreviewService::PreviewService(const Config& config,
                               std::shared_ptr<SessionRegistry> registry,
                               std::shared_ptr<data::SessionRepository> repository,
                               std::shared_ptr<vcs::WorkspaceManager> workspaces,
                               std::shared_ptr<vcs::GitRevertOperator> reverter,
                               std::shared_ptr<runtime::ContainerOrchestrator> orchestrator)
    : config_(config)
    , registry_(std::move(registry))
    , repository_(std::move(repository))
    , workspaces_(std::move(workspaces))
    , reverter_(std::move(reverter))
    , orchestrator_(std::move(orchestrator)) {}

// ============================================================
// 세션
// ============================================================

std::optional<SessionRecord> PreviewService::createSession(int64_t project_id, const std::string& session_id,
                                                           bool is_default, ErrorCode* error) {
    auto id = SessionId::parse(session_id);
    if (!id || project_id <= 0) {
        if (error) *error = ErrorCode::InvalidArgument;
        return std::nullopt;
    }
    auto record = registry_->registerSession(project_id, *id, is_default);
    if (!record && error) *error = ErrorCode::Internal;
    return record;
}

std::vector<SessionRecord> PreviewService::listSessions(int64_t project_id) const {
    return repository_->listSessions(project_id);
}

ArchiveResult PreviewService::archive(int64_t project_id, const std::string& session_id) {
    ArchiveResult result;

    auto id = SessionId::parse(session_id);
    if (!id) {
        result.error = ErrorCode::InvalidArgument;
        result.error_message = "허용되지 않는 세션 ID";
        return result;
    }
    SessionKey key{project_id, *id};

    auto record = registry_->lookup(key);
    if (!record) {
        result.error = ErrorCode::NotFound;
        result.error_message = "세션을 찾을 수 없습니다: " + key.toString();
        return result;
    }
    if (record->is_default) {
        result.error = ErrorCode::InvalidArgument;
        result.error_message = "기본 세션은 보관할 수 없습니다";
        return result;
    }

    // 1. 인스턴스 정지 (실패해도 계속)
    auto stopped = orchestrator_->stop(project_id, session_id);
    if (!stopped.success) {
        std::cerr << "[PreviewService] 인스턴스 정지 실패, 보관 계속 (" << key.toString() << "): "
                  << stopped.error_message << std::endl;
        result.warning = "미리보기 인스턴스를 정지하지 못했습니다";
    }

    // 2. 워크스페이스 삭제
    if (!workspaces_->remove(key)) {
        result.warning = "세션은 보관되었지만 일부 파일을 삭제하지 못했습니다";
    }

    // 3. 레코드 보관
    if (!repository_->archiveSession(project_id, session_id)) {
        result.error = ErrorCode::Internal;
        result.error_message = "세션 보관 실패: " + repository_->lastError();
        return result;
    }

    std::cout << "[PreviewService] 세션 보관: " << key.toString() << std::endl;
    result.success = true;
    return result;
}

// ============================================================
// 미리보기
// ============================================================

runtime::StatusResult PreviewService::status(int64_t project_id, const std::string& session_id) {
    return orchestrator_->status(project_id, session_id);
}

runtime::InspectResult PreviewService::inspect(int64_t project_id, const std::string& session_id) {
    return orchestrator_->inspect(project_id, session_id);
}

runtime::StartResult PreviewService::start(int64_t project_id, const std::string& session_id,
                                           const data::EnvVarList& env_vars, const std::string& user_id) {
    return orchestrator_->start(project_id, session_id, env_vars, user_id);
}

runtime::StopResult PreviewService::stop(int64_t project_id, const std::string& session_id) {
    return orchestrator_->stop(project_id, session_id);
}

runtime::StartResult PreviewService::restart(int64_t project_id, const std::string& session_id) {
    return orchestrator_->restart(project_id, session_id);
}

std::vector<runtime::PreviewUrlEntry> PreviewService::previewUrls(int64_t project_id) const {
    return orchestrator_->previewUrlsForProject(project_id);
}

int PreviewService::stopAll(std::optional<int64_t> project_id) {
    return project_id ? orchestrator_->stopAllForProject(*project_id) : orchestrator_->stopAll();
}

// ============================================================
// 되돌리기
// ============================================================

RevertOutcome PreviewService::revert(int64_t project_id, const std::string& session_id,
                                     const std::string& commit_sha,
                                     const std::string& credential_token,
                                     const std::string& triggering_message_id,
                                     bool restart_after) {
    RevertOutcome outcome;

    auto resolved = registry_->resolveWorkspacePath(project_id, session_id);
    if (!resolved.success) {
        outcome.error = resolved.error;
        outcome.error_message = resolved.error_message;
        return outcome;
    }

    auto id = SessionId::parse(session_id);
    if (!id) {
        outcome.error = ErrorCode::InvalidArgument;
        outcome.error_message = "허용되지 않는 세션 ID";
        return outcome;
    }
    const SessionKey key{project_id, *id};

    // reset부터 push까지 같은 세션의 워크스페이스 준비와 배타적
    const std::string& token = credential_token.empty() ? config_.git_token : credential_token;
    outcome.revert = workspaces_->withSessionLock(key, [&]() {
        return reverter_->revertToCommit(resolved.path, commit_sha, token);
    });
    if (!outcome.revert.success) {
        outcome.error = outcome.revert.error;
        outcome.error_message = outcome.revert.error_message;
        return outcome;
    }
    outcome.success = true;

    RevertRecord record;
    record.project_id = project_id;
    record.session_id = session_id;
    record.commit_sha = outcome.revert.reverted_to_commit;
    record.previous_sha = outcome.revert.previous_commit;
    record.reverted_at = nowEpochMs();
    record.triggering_message_id = triggering_message_id;
    outcome.audit_id = repository_->appendRevertRecord(record);
    if (outcome.audit_id < 0) {
        std::cerr << "[PreviewService] 감사 기록 추가 실패: " << repository_->lastError() << std::endl;
        outcome.warning = "되돌리기는 완료되었지만 이력에 기록하지 못했습니다";
    }

    if (restart_after) {
        auto inspected = orchestrator_->inspect(project_id, session_id);
        if (inspected.success && !inspected.instance.instance_id.empty()) {
            auto restarted = orchestrator_->restart(project_id, session_id);
            outcome.restarted = restarted.success;
            if (!restarted.success) {
                std::cerr << "[PreviewService] 되돌리기 후 재시작 실패: " << restarted.error_message << std::endl;
            }
        }
    }
    return outcome;
}

std::vector<RevertRecord> PreviewService::revertHistory(int64_t project_id, const std::string& session_id) const {
    return repository_->revertHistory(project_id, session_id);
}

} // namespace previewd::core
