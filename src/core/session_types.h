#pragma once

/**
 * @file session_types.h
 * @brief 세션 식별자, 에러 분류, 공용 결과 타입
 *
 * 모든 모듈이 공유하는 기본 타입입니다.
 * SessionId는 허용 목록 검증을 통과한 값만 생성할 수 있습니다.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace previewd::core {

// ============================================================
// 에러 분류
// ============================================================

/**
 * @brief 오케스트레이션 에러 코드
 */
enum class ErrorCode {
    None,               ///< 에러 없음
    NotFound,           ///< 세션/워크스페이스/인스턴스 없음
    BranchConflict,     ///< 브랜치 충돌 또는 원격 접근 불가
    NotReachable,       ///< 되돌릴 커밋이 현재 팁의 조상이 아님
    StartTimeout,       ///< 준비 대기 시간 초과
    ResourceExhausted,  ///< 런타임 자원 풀 고갈
    PushRejected,       ///< 원격이 강제 업데이트 거부
    InvalidArgument,    ///< 입력값 검증 실패
    RuntimeUnavailable, ///< 컨테이너 런타임 데몬 접근 불가
    Internal            ///< 예상하지 못한 하위 프로세스 실패
};

/**
 * @brief 에러 코드 이름 (로그/CLI 출력용)
 */
[[nodiscard]] const char* errorCodeName(ErrorCode code);

/**
 * @brief 클라이언트에 보여줄 일반 안내 문구
 *
 * 내부 에러 텍스트 대신 재시도 가능한 안내를 돌려줍니다.
 */
[[nodiscard]] std::string userFacingMessage(ErrorCode code);

/**
 * @brief 값 없는 연산 결과
 */
struct OpResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string error_message;

    static OpResult ok() { return OpResult{true, ErrorCode::None, {}}; }
    static OpResult fail(ErrorCode code, std::string message) {
        return OpResult{false, code, std::move(message)};
    }
};

// ============================================================
// 세션 식별자
// ============================================================

/**
 * @brief 검증된 세션 ID
 *
 * 허용 문자: [A-Za-z0-9_-], 길이 1..64, 첫 글자는 영숫자.
 * 파일 경로, 브랜치 이름, 컨테이너 이름에 그대로 사용됩니다.
 */
class SessionId {
public:
    static constexpr size_t kMaxLength = 64;

    /**
     * @brief 문자열 검증 후 SessionId 생성
     * @return 허용 목록을 벗어나면 std::nullopt
     */
    [[nodiscard]] static std::optional<SessionId> parse(const std::string& raw);

    /**
     * @brief 허용 목록 검사만 수행
     */
    [[nodiscard]] static bool isValid(const std::string& raw);

    [[nodiscard]] const std::string& str() const { return value_; }

    bool operator==(const SessionId& other) const { return value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return value_ != other.value_; }

private:
    explicit SessionId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/**
 * @brief (프로젝트, 세션) 키
 */
struct SessionKey {
    int64_t project_id{0};
    SessionId session_id;

    /// "42/s1" 형태 (로그용)
    [[nodiscard]] std::string toString() const;
};

// ============================================================
// 세션 레코드
// ============================================================

/**
 * @brief 세션 상태
 */
enum class SessionStatus {
    Active,     ///< 사용 중
    Archived    ///< 보관됨 (소프트 삭제)
};

[[nodiscard]] const char* sessionStatusName(SessionStatus status);

/**
 * @brief 영속 세션 레코드
 */
struct SessionRecord {
    int64_t id{0};                      ///< DB ID
    int64_t project_id{0};              ///< 소유 프로젝트
    std::string session_id;             ///< 세션 키
    std::string branch_name;            ///< 세션 브랜치 (생성 후 불변)
    SessionStatus status{SessionStatus::Active};
    bool is_default{false};             ///< 프로젝트 기본 세션 여부
    int64_t last_activity_at{0};        ///< 마지막 활동 (Unix epoch ms)
    int64_t created_at{0};              ///< 생성 시간 (Unix epoch ms)
};

/**
 * @brief 되돌리기 감사 기록 (추가 전용)
 */
struct RevertRecord {
    int64_t id{0};
    int64_t project_id{0};
    std::string session_id;
    std::string commit_sha;             ///< 되돌린 대상 커밋
    std::string previous_sha;           ///< 되돌리기 직전 팁
    int64_t reverted_at{0};             ///< Unix epoch ms
    std::string triggering_message_id;  ///< 요청을 발생시킨 메시지 참조
};

/**
 * @brief 현재 시간 (Unix epoch ms)
 */
[[nodiscard]] int64_t nowEpochMs();

} // namespace previewd::core
