/**
 * @file session_types.cpp
 * @brief 세션 식별자 검증 및 에러 코드 문자열 구현
 */

#include "session_types.h"

#include <chrono>
#include <cctype>

namespace previewd::core {

// ============================================================
// 에러 코드
// ============================================================

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:               return "None";
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::BranchConflict:     return "BranchConflict";
        case ErrorCode::NotReachable:       return "NotReachable";
        case ErrorCode::StartTimeout:       return "StartTimeout";
        case ErrorCode::ResourceExhausted:  return "ResourceExhausted";
        case ErrorCode::PushRejected:       return "PushRejected";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::RuntimeUnavailable: return "RuntimeUnavailable";
        case ErrorCode::Internal:           return "Internal";
    }
    return "Unknown";
}

std::string userFacingMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "";
        case ErrorCode::NotFound:
            return "This session could not be found. Refresh the page and try again.";
        case ErrorCode::BranchConflict:
            return "The session branch could not be synchronized. Try again in a moment.";
        case ErrorCode::NotReachable:
            return "That version is not part of this session's history.";
        case ErrorCode::PushRejected:
            return "The revert could not be published. Nothing was changed; try again.";
        case ErrorCode::InvalidArgument:
            return "The request was not valid.";
        case ErrorCode::StartTimeout:
        case ErrorCode::ResourceExhausted:
        case ErrorCode::RuntimeUnavailable:
        case ErrorCode::Internal:
            return "The preview could not be started. Please try again in a few moments.";
    }
    return "Something went wrong. Please try again.";
}

// ============================================================
// SessionId
// ============================================================

bool SessionId::isValid(const std::string& raw) {
    if (raw.empty() || raw.size() > kMaxLength) return false;

    // 첫 글자는 영숫자 (옵션처럼 보이는 "-x" 차단)
    if (!std::isalnum(static_cast<unsigned char>(raw.front()))) return false;

    for (char c : raw) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '-') continue;
        return false;
    }
    return true;
}

std::optional<SessionId> SessionId::parse(const std::string& raw) {
    if (!isValid(raw)) return std::nullopt;
    return SessionId(raw);
}

std::string SessionKey::toString() const {
    return std::to_string(project_id) + "/" + session_id.str();
}

const char* sessionStatusName(SessionStatus status) {
    return status == SessionStatus::Archived ? "archived" : "active";
}

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace previewd::core
