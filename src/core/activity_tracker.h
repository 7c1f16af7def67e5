#pragma once

/**
 * @file activity_tracker.h
 * @brief 세션 마지막 활동 시각 기록
 */

#include "core/session_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace previewd::data {
class SessionRepository;
}

namespace previewd::core {

/// 현재 시각 공급자 (epoch ms). 테스트에서 교체 가능
using ClockFn = std::function<int64_t()>;

/**
 * @brief 활동 추적기
 *
 * status/start 요청마다 동기적으로 호출됩니다.
 * 저장되는 값은 절대 감소하지 않습니다.
 */
class ActivityTracker {
public:
    explicit ActivityTracker(std::shared_ptr<data::SessionRepository> repository,
                             ClockFn clock = nowEpochMs);

    /**
     * @brief 마지막 활동 시각을 현재로 갱신
     * @return 세션 레코드가 존재해 갱신되었으면 true
     */
    bool touch(const SessionKey& key);

    /**
     * @brief 마지막 활동 시각 조회
     */
    [[nodiscard]] std::optional<int64_t> lastActivity(const SessionKey& key) const;

    [[nodiscard]] int64_t now() const { return clock_(); }

private:
    std::shared_ptr<data::SessionRepository> repository_;
    ClockFn clock_;
};

} // namespace previewd::core
