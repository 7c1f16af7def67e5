#pragma once

/**
 * @file idle_reclaimer.h
 * @brief 유휴 세션 인스턴스 회수
 */

#include "core/activity_tracker.h"
#include "core/config.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace previewd::data {
class SessionRepository;
}

namespace previewd::runtime {
class ContainerOrchestrator;
}

namespace previewd::core {

/**
 * @brief 한 번의 회수 결과
 */
struct SweepReport {
    int examined{0};    ///< 유휴로 판정된 세션 수
    int stopped{0};     ///< 정지한 인스턴스 수
    int failed{0};      ///< 정지 실패 수
    int skipped{0};     ///< 인스턴스가 없어 건너뛴 수
};

/**
 * @brief 유휴 회수기
 *
 * 최선 노력 방식입니다. 한 세션의 실패는 기록만 하고 나머지를 계속 처리합니다.
 */
class IdleReclaimer {
public:
    IdleReclaimer(std::shared_ptr<data::SessionRepository> repository,
                  std::shared_ptr<runtime::ContainerOrchestrator> orchestrator,
                  IdleConfig config,
                  ClockFn clock = nowEpochMs);
    ~IdleReclaimer();

    // 복사 금지
    IdleReclaimer(const IdleReclaimer&) = delete;
    IdleReclaimer& operator=(const IdleReclaimer&) = delete;

    /**
     * @brief 유휴 세션의 인스턴스를 정지
     */
    SweepReport sweep();

    /**
     * @brief 주기 회수 스레드 시작 (이미 실행 중이면 무시)
     */
    void startPeriodic();

    /**
     * @brief 주기 회수 스레드 중지
     */
    void stopPeriodic();

    [[nodiscard]] bool isRunning() const { return running_; }

private:
    void sweepLoop();

    std::shared_ptr<data::SessionRepository> repository_;
    std::shared_ptr<runtime::ContainerOrchestrator> orchestrator_;
    IdleConfig config_;
    ClockFn clock_;

    std::thread sweep_thread_;
    std::atomic<bool> running_{false};
};

} // namespace previewd::core
