/**
 * @file session_registry.cpp
 * @brief 세션 레지스트리 구현
 */

#include "session_registry.h"
#include "data/session_repository.h"

#include <iostream>

namespace previewd::core {

SessionRegistry::SessionRegistry(std::shared_ptr<data::SessionRepository> repository,
                                 std::filesystem::path workspace_root,
                                 std::string branch_prefix)
    : repository_(std::move(repository))
    , workspace_root_(std::filesystem::absolute(workspace_root).lexically_normal())
    , branch_prefix_(std::move(branch_prefix)) {}

std::string SessionRegistry::branchName(const std::string& prefix, const SessionId& session_id) {
    return prefix + session_id.str();
}

std::string SessionRegistry::branchName(const SessionId& session_id) const {
    return branchName(branch_prefix_, session_id);
}

std::filesystem::path SessionRegistry::workspacePathFor(const SessionKey& key) const {
    return workspace_root_ / std::to_string(key.project_id) / "sessions" / key.session_id.str();
}

std::filesystem::path SessionRegistry::primaryCheckoutPath(int64_t project_id) const {
    return workspace_root_ / std::to_string(project_id) / "primary";
}

WorkspacePathResult SessionRegistry::resolveWorkspacePath(int64_t project_id,
                                                          const std::string& session_id) const {
    WorkspacePathResult result;

    auto id = SessionId::parse(session_id);
    if (!id) {
        result.error = ErrorCode::InvalidArgument;
        result.error_message = "허용되지 않는 세션 ID";
        std::cerr << "[SessionRegistry] 세션 ID 거부 (프로젝트 " << project_id << ")" << std::endl;
        return result;
    }
    if (project_id <= 0) {
        result.error = ErrorCode::InvalidArgument;
        result.error_message = "잘못된 프로젝트 ID: " + std::to_string(project_id);
        return result;
    }

    SessionKey key{project_id, *id};
    auto record = lookup(key);
    if (!record) {
        result.error = ErrorCode::NotFound;
        result.error_message = "세션을 찾을 수 없습니다: " + key.toString();
        return result;
    }

    result.success = true;
    result.path = workspacePathFor(key);
    // 저장된 이름 사용 (접두사 설정이 바뀌어도 기존 브랜치는 유지)
    result.branch = record->branch_name.empty() ? branchName(*id) : record->branch_name;
    return result;
}

std::optional<SessionRecord> SessionRegistry::lookup(const SessionKey& key) const {
    auto record = repository_->findSession(key.project_id, key.session_id.str());
    if (!record || record->status != SessionStatus::Active) {
        return std::nullopt;
    }
    return record;
}

std::optional<SessionRecord> SessionRegistry::registerSession(int64_t project_id,
                                                              const SessionId& session_id,
                                                              bool is_default) {
    if (project_id <= 0) return std::nullopt;

    auto record = repository_->createSession(project_id, session_id.str(),
                                             branchName(session_id), is_default);
    if (record) {
        std::cout << "[SessionRegistry] 세션 등록: " << project_id << "/" << session_id.str()
                  << " (브랜치 " << record->branch_name << ")" << std::endl;
    }
    return record;
}

} // namespace previewd::core
