#pragma once

/**
 * @file preview_app.h
 * @brief previewd 애플리케이션 조립
 *
 * 설정을 받아 저장소, git, 컨테이너 런타임, 오케스트레이터, 회수기를
 * 생성하고 연결합니다. 수명 주기(초기화/종료)를 관리합니다.
 */

#include "core/config.h"

#include <memory>
#include <string>

namespace previewd::data {
class DataStore;
class SessionRepository;
}

namespace previewd::runtime {
class ContainerOrchestrator;
}

namespace previewd::core {

class IdleReclaimer;
class PreviewService;

/**
 * @brief 애플리케이션 상태
 */
enum class AppState {
    Uninitialized,      ///< 초기화 전
    Initializing,       ///< 초기화 중
    Running,            ///< 실행 중
    ShuttingDown,       ///< 종료 중
    Terminated          ///< 종료됨
};

/**
 * @brief previewd 애플리케이션
 */
class PreviewApp {
public:
    PreviewApp();
    ~PreviewApp();

    // 복사 금지
    PreviewApp(const PreviewApp&) = delete;
    PreviewApp& operator=(const PreviewApp&) = delete;

    /**
     * @brief 초기화
     * @param config 검증된 설정
     * @return 성공 여부 (실패 사유는 lastError())
     */
    bool initialize(const Config& config);

    /**
     * @brief 종료 (백그라운드 작업 대기, 주기 회수 중지, DB 닫기)
     */
    void shutdown();

    [[nodiscard]] AppState state() const { return state_; }
    [[nodiscard]] const std::string& lastError() const { return last_error_; }
    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] PreviewService& service() { return *service_; }
    [[nodiscard]] IdleReclaimer& reclaimer() { return *reclaimer_; }
    [[nodiscard]] runtime::ContainerOrchestrator& orchestrator() { return *orchestrator_; }
    [[nodiscard]] data::SessionRepository& repository() { return *repository_; }

private:
    AppState state_{AppState::Uninitialized};
    Config config_;
    std::string last_error_;

    std::shared_ptr<data::DataStore> store_;
    std::shared_ptr<data::SessionRepository> repository_;
    std::shared_ptr<runtime::ContainerOrchestrator> orchestrator_;
    std::unique_ptr<PreviewService> service_;
    std::unique_ptr<IdleReclaimer> reclaimer_;
};

} // namespace previewd::core
