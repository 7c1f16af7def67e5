/**
 * @file idle_reclaimer.cpp
 * @brief 유휴 회수기 구현
 */

#include "idle_reclaimer.h"
#include "data/session_repository.h"
#include "runtime/container_orchestrator.h"

#include <exception>
#include <iostream>

namespace previewd::core {

IdleReclaimer::IdleReclaimer(std::shared_ptr<data::SessionRepository> repository,
                             std::shared_ptr<runtime::ContainerOrchestrator> orchestrator,
                             IdleConfig config,
                             ClockFn clock)
    : repository_(std::move(repository))
    , orchestrator_(std::move(orchestrator))
    , config_(config)
    , clock_(std::move(clock)) {}

IdleReclaimer::~IdleReclaimer() {
    stopPeriodic();
}

SweepReport IdleReclaimer::sweep() {
    SweepReport report;
    const int64_t cutoff = clock_() - config_.idle_threshold_ms;

    for (const auto& session : repository_->listIdleSessions(cutoff)) {
        ++report.examined;
        const std::string tag = std::to_string(session.project_id) + "/" + session.session_id;

        try {
            auto inspected = orchestrator_->inspect(session.project_id, session.session_id);
            if (!inspected.success) {
                ++report.failed;
                std::cerr << "[IdleReclaimer] 조회 실패 (" << tag << "): "
                          << errorCodeName(inspected.error) << " - " << inspected.error_message << std::endl;
                continue;
            }
            if (inspected.instance.instance_id.empty()) {
                ++report.skipped;
                continue;
            }

            auto stopped = orchestrator_->stop(session.project_id, session.session_id);
            if (stopped.success) {
                ++report.stopped;
                std::cout << "[IdleReclaimer] 유휴 인스턴스 정지: " << tag << std::endl;
            } else {
                ++report.failed;
                std::cerr << "[IdleReclaimer] 정지 실패 (" << tag << "): "
                          << errorCodeName(stopped.error) << " - " << stopped.error_message << std::endl;
            }
        } catch (const std::exception& e) {
            ++report.failed;
            std::cerr << "[IdleReclaimer] 처리 중 예외 (" << tag << "): " << e.what() << std::endl;
        }
    }

    if (report.examined > 0) {
        std::cout << "[IdleReclaimer] 회수 완료: 유휴 " << report.examined << ", 정지 " << report.stopped
                  << ", 실패 " << report.failed << ", 건너뜀 " << report.skipped << std::endl;
    }
    return report;
}

void IdleReclaimer::startPeriodic() {
    if (running_) return;
    running_ = true;
    sweep_thread_ = std::thread(&IdleReclaimer::sweepLoop, this);
    std::cout << "[IdleReclaimer] 주기 회수 시작 (" << config_.sweep_interval_ms << "ms 간격)" << std::endl;
}

void IdleReclaimer::stopPeriodic() {
    running_ = false;
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

void IdleReclaimer::sweepLoop() {
    constexpr int64_t kSliceMs = 100;
    while (running_) {
        // 지정된 간격만큼 대기 (중지 요청에 빨리 반응하도록 잘게 나눔)
        for (int64_t waited = 0; waited < config_.sweep_interval_ms && running_; waited += kSliceMs) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kSliceMs));
        }

        if (!running_) break;

        sweep();
    }
}

} // namespace previewd::core
