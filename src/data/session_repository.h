#pragma once

/**
 * @file session_repository.h
 * @brief 세션 레코드 / 프로젝트 환경 변수 / 되돌리기 감사 로그 저장소
 *
 * 세션 행은 채팅 세션 생성 시 만들어지고, 오케스트레이터는
 * 활동 시간 갱신과 감사 기록 추가 외에는 읽기만 합니다.
 */

#include "core/session_types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace previewd::data {

class DataStore;

/// 프로젝트 환경 변수 목록 (키 순서 유지)
using EnvVarList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief 세션 저장소
 *
 * 공유 DataStore 위에서 동작하며 스레드 안전합니다.
 */
class SessionRepository {
public:
    explicit SessionRepository(std::shared_ptr<DataStore> store);

    // 복사 금지
    SessionRepository(const SessionRepository&) = delete;
    SessionRepository& operator=(const SessionRepository&) = delete;

    /**
     * @brief 스키마 마이그레이션 등록 및 적용
     * @return 성공 여부
     */
    bool initialize();

    // ============================
    // 세션 레코드
    // ============================

    /**
     * @brief 세션 조회
     */
    [[nodiscard]] std::optional<core::SessionRecord> findSession(
        int64_t project_id, const std::string& session_id) const;

    /**
     * @brief 세션 생성
     *
     * 프로젝트의 첫 세션이거나 is_default가 true면 기본 세션이 됩니다.
     * 같은 키가 이미 있으면 기존 레코드를 돌려줍니다.
     */
    std::optional<core::SessionRecord> createSession(
        int64_t project_id, const std::string& session_id,
        const std::string& branch_name, bool is_default);

    /**
     * @brief 프로젝트의 세션 목록 (보관된 세션 포함)
     */
    [[nodiscard]] std::vector<core::SessionRecord> listSessions(int64_t project_id) const;

    /**
     * @brief 활동 시각이 기준보다 오래된 활성 세션 목록
     * @param cutoff_ms 이 시각(epoch ms)보다 이전에 마지막으로 활동한 세션
     */
    [[nodiscard]] std::vector<core::SessionRecord> listIdleSessions(int64_t cutoff_ms) const;

    /**
     * @brief 마지막 활동 시각 갱신 (감소하지 않음)
     * @return 세션이 존재하면 true
     */
    bool touchActivity(int64_t project_id, const std::string& session_id, int64_t at_ms);

    /**
     * @brief 세션 보관 (소프트 삭제)
     */
    bool archiveSession(int64_t project_id, const std::string& session_id);

    // ============================
    // 프로젝트 환경 변수
    // ============================

    /**
     * @brief 프로젝트 환경 변수 조회
     */
    [[nodiscard]] EnvVarList environmentVariables(int64_t project_id) const;

    /**
     * @brief 프로젝트 환경 변수 설정 (덮어쓰기)
     */
    bool setEnvironmentVariable(int64_t project_id, const std::string& key,
                                const std::string& value);

    /**
     * @brief 프로젝트 환경 변수 삭제
     */
    bool removeEnvironmentVariable(int64_t project_id, const std::string& key);

    // ============================
    // 되돌리기 감사 로그 (추가 전용)
    // ============================

    /**
     * @brief 감사 기록 추가
     * @return 새 기록 ID, 실패 시 -1
     */
    int64_t appendRevertRecord(const core::RevertRecord& record);

    /**
     * @brief 세션의 감사 기록 (오래된 순)
     */
    [[nodiscard]] std::vector<core::RevertRecord> revertHistory(
        int64_t project_id, const std::string& session_id) const;

    /**
     * @brief 마지막 에러 메시지
     */
    [[nodiscard]] std::string lastError() const;

private:
    std::shared_ptr<DataStore> store_;
};

} // namespace previewd::data
