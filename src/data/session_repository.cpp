/**
 * @file session_repository.cpp
 * @brief 세션 저장소 구현
 */

#include "session_repository.h"
#include "data_store.h"

#include <iostream>

namespace previewd::data {

using core::RevertRecord;
using core::SessionRecord;
using core::SessionStatus;

namespace {

SessionRecord recordFromRow(const DbRow& row) {
    SessionRecord record;
    record.id = rowInt(row, "id");
    record.project_id = rowInt(row, "project_id");
    record.session_id = rowText(row, "session_id");
    record.branch_name = rowText(row, "branch_name");
    record.status = rowText(row, "status") == "archived"
        ? SessionStatus::Archived : SessionStatus::Active;
    record.is_default = rowInt(row, "is_default") != 0;
    record.last_activity_at = rowInt(row, "last_activity_at");
    record.created_at = rowInt(row, "created_at");
    return record;
}

constexpr const char* kSessionColumns =
    "id, project_id, session_id, branch_name, status, is_default, "
    "last_activity_at, created_at";

} // 익명 네임스페이스

SessionRepository::SessionRepository(std::shared_ptr<DataStore> store)
    : store_(std::move(store)) {}

// ============================================================
// 초기화
// ============================================================

bool SessionRepository::initialize() {
    if (!store_ || !store_->isOpen()) return false;

    Migration sessions;
    sessions.version = 100;
    sessions.name = "세션/환경 변수 테이블 생성";
    sessions.up_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS sessions (
            id                INTEGER PRIMARY KEY AUTOINCREMENT,
            project_id        INTEGER NOT NULL,
            session_id        TEXT NOT NULL,
            branch_name       TEXT NOT NULL,
            status            TEXT NOT NULL DEFAULT 'active',
            is_default        INTEGER NOT NULL DEFAULT 0,
            last_activity_at  INTEGER NOT NULL,
            created_at        INTEGER NOT NULL,
            UNIQUE (project_id, session_id)
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_sessions_default
            ON sessions(project_id) WHERE is_default = 1;
        CREATE INDEX IF NOT EXISTS idx_sessions_activity
            ON sessions(status, last_activity_at);

        CREATE TABLE IF NOT EXISTS project_env_vars (
            project_id  INTEGER NOT NULL,
            key         TEXT NOT NULL,
            value       TEXT NOT NULL,
            PRIMARY KEY (project_id, key)
        );
    )SQL";
    store_->registerMigration(sessions);

    Migration audit;
    audit.version = 200;
    audit.name = "되돌리기 감사 로그";
    audit.up_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS revert_audit (
            id                     INTEGER PRIMARY KEY AUTOINCREMENT,
            project_id             INTEGER NOT NULL,
            session_id             TEXT NOT NULL,
            commit_sha             TEXT NOT NULL,
            previous_sha           TEXT NOT NULL DEFAULT '',
            reverted_at            INTEGER NOT NULL,
            triggering_message_id  TEXT NOT NULL DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_revert_audit_session
            ON revert_audit(project_id, session_id, id);

        CREATE TRIGGER IF NOT EXISTS revert_audit_no_update
            BEFORE UPDATE ON revert_audit
            BEGIN SELECT RAISE(ABORT, 'revert_audit is append-only'); END;
        CREATE TRIGGER IF NOT EXISTS revert_audit_no_delete
            BEFORE DELETE ON revert_audit
            BEGIN SELECT RAISE(ABORT, 'revert_audit is append-only'); END;
    )SQL";
    store_->registerMigration(audit);

    return store_->runMigrations() >= 0;
}

// ============================================================
// 세션 레코드
// ============================================================

std::optional<SessionRecord> SessionRepository::findSession(
    int64_t project_id, const std::string& session_id) const {
    auto rows = store_->query(
        std::string("SELECT ") + kSessionColumns +
        " FROM sessions WHERE project_id = ? AND session_id = ?",
        {project_id, session_id}
    );
    if (rows.empty()) return std::nullopt;
    return recordFromRow(rows.front());
}

std::optional<SessionRecord> SessionRepository::createSession(
    int64_t project_id, const std::string& session_id,
    const std::string& branch_name, bool is_default) {

    std::optional<SessionRecord> created;

    bool ok = store_->transaction([&]() -> bool {
        if (auto existing = findSession(project_id, session_id)) {
            created = existing;
            return true;
        }

        auto default_count = store_->queryScalar(
            "SELECT COUNT(*) FROM sessions WHERE project_id = ? AND is_default = 1",
            {project_id}
        );
        bool has_default = default_count
            && std::holds_alternative<int64_t>(*default_count)
            && std::get<int64_t>(*default_count) > 0;

        // 기본 세션은 프로젝트당 하나
        bool make_default = !has_default;
        if (has_default && is_default) {
            std::cerr << "[SessionRepository] 프로젝트 " << project_id
                      << "에 이미 기본 세션이 있어 일반 세션으로 생성합니다" << std::endl;
        }

        int64_t now = core::nowEpochMs();
        int rc = store_->execute(
            "INSERT INTO sessions (project_id, session_id, branch_name, status, "
            "is_default, last_activity_at, created_at) VALUES (?, ?, ?, 'active', ?, ?, ?)",
            {project_id, session_id, branch_name,
             static_cast<int64_t>(make_default ? 1 : 0), now, now}
        );
        if (rc < 0) return false;

        created = findSession(project_id, session_id);
        return created.has_value();
    });

    if (!ok) {
        std::cerr << "[SessionRepository] 세션 생성 실패: " << store_->lastError() << std::endl;
        return std::nullopt;
    }
    return created;
}

std::vector<SessionRecord> SessionRepository::listSessions(int64_t project_id) const {
    std::vector<SessionRecord> result;
    auto rows = store_->query(
        std::string("SELECT ") + kSessionColumns +
        " FROM sessions WHERE project_id = ? ORDER BY created_at, id",
        {project_id}
    );
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(recordFromRow(row));
    }
    return result;
}

std::vector<SessionRecord> SessionRepository::listIdleSessions(int64_t cutoff_ms) const {
    std::vector<SessionRecord> result;
    auto rows = store_->query(
        std::string("SELECT ") + kSessionColumns +
        " FROM sessions WHERE status = 'active' AND last_activity_at < ?"
        " ORDER BY last_activity_at",
        {cutoff_ms}
    );
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(recordFromRow(row));
    }
    return result;
}

bool SessionRepository::touchActivity(int64_t project_id, const std::string& session_id,
                                      int64_t at_ms) {
    // MAX()로 단조 증가 보장 (늦게 도착한 갱신이 시간을 되돌리지 않음)
    int rc = store_->execute(
        "UPDATE sessions SET last_activity_at = MAX(last_activity_at, ?) "
        "WHERE project_id = ? AND session_id = ?",
        {at_ms, project_id, session_id}
    );
    return rc > 0;
}

bool SessionRepository::archiveSession(int64_t project_id, const std::string& session_id) {
    int rc = store_->execute(
        "UPDATE sessions SET status = 'archived' WHERE project_id = ? AND session_id = ?",
        {project_id, session_id}
    );
    return rc > 0;
}

// ============================================================
// 프로젝트 환경 변수
// ============================================================

EnvVarList SessionRepository::environmentVariables(int64_t project_id) const {
    EnvVarList vars;
    auto rows = store_->query(
        "SELECT key, value FROM project_env_vars WHERE project_id = ? ORDER BY key",
        {project_id}
    );
    vars.reserve(rows.size());
    for (const auto& row : rows) {
        vars.emplace_back(rowText(row, "key"), rowText(row, "value"));
    }
    return vars;
}

bool SessionRepository::setEnvironmentVariable(int64_t project_id, const std::string& key,
                                               const std::string& value) {
    int rc = store_->execute(
        "INSERT INTO project_env_vars (project_id, key, value) VALUES (?, ?, ?) "
        "ON CONFLICT(project_id, key) DO UPDATE SET value = excluded.value",
        {project_id, key, value}
    );
    return rc > 0;
}

bool SessionRepository::removeEnvironmentVariable(int64_t project_id, const std::string& key) {
    return store_->execute(
        "DELETE FROM project_env_vars WHERE project_id = ? AND key = ?",
        {project_id, key}
    ) > 0;
}

// ============================================================
// 감사 로그
// ============================================================

int64_t SessionRepository::appendRevertRecord(const RevertRecord& record) {
    int64_t new_id = -1;
    bool ok = store_->transaction([&]() -> bool {
        int rc = store_->execute(
            "INSERT INTO revert_audit (project_id, session_id, commit_sha, previous_sha, "
            "reverted_at, triggering_message_id) VALUES (?, ?, ?, ?, ?, ?)",
            {record.project_id, record.session_id, record.commit_sha, record.previous_sha,
             record.reverted_at, record.triggering_message_id}
        );
        if (rc <= 0) return false;
        new_id = store_->lastInsertRowId();
        return true;
    });
    if (!ok) {
        std::cerr << "[SessionRepository] 감사 기록 추가 실패: " << store_->lastError() << std::endl;
        return -1;
    }
    return new_id;
}

std::vector<RevertRecord> SessionRepository::revertHistory(
    int64_t project_id, const std::string& session_id) const {
    std::vector<RevertRecord> history;
    auto rows = store_->query(
        "SELECT id, project_id, session_id, commit_sha, previous_sha, reverted_at, "
        "triggering_message_id FROM revert_audit "
        "WHERE project_id = ? AND session_id = ? ORDER BY id",
        {project_id, session_id}
    );
    history.reserve(rows.size());
    for (const auto& row : rows) {
        RevertRecord record;
        record.id = rowInt(row, "id");
        record.project_id = rowInt(row, "project_id");
        record.session_id = rowText(row, "session_id");
        record.commit_sha = rowText(row, "commit_sha");
        record.previous_sha = rowText(row, "previous_sha");
        record.reverted_at = rowInt(row, "reverted_at");
        record.triggering_message_id = rowText(row, "triggering_message_id");
        history.push_back(std::move(record));
    }
    return history;
}

std::string SessionRepository::lastError() const {
    return store_->lastError();
}

} // namespace previewd::data
