/**
 * @file preview_app.cpp
 * @brief previewd 애플리케이션 조립 구현
 */

#include "preview_app.h"
#include "activity_tracker.h"
#include "idle_reclaimer.h"
#include "preview_service.h"
#include "process_runner.h"
#include "session_registry.h"
#include "data/data_store.h"
#include "data/session_repository.h"
#include "network/health_probe.h"
#include "network/http_client.h"
#include "runtime/container_orchestrator.h"
#include "runtime/docker_driver.h"
#include "runtime/provision_claim.h"
#include "runtime/router_adapter.h"
#include "vcs/git_client.h"
#include "vcs/git_revert_operator.h"
#include "vcs/workspace_manager.h"

#include <filesystem>
#include <iostream>

namespace previewd::core {

PreviewApp::PreviewApp() = default;

PreviewApp::~PreviewApp() {
    if (state_ == AppState::Running) {
        shutdown();
    }
}

bool PreviewApp::initialize(const Config& config) {
    if (state_ != AppState::Uninitialized) {
        last_error_ = "이미 초기화되었거나 실행 중입니다";
        std::cerr << "[PreviewApp] " << last_error_ << std::endl;
        return false;
    }

    state_ = AppState::Initializing;
    config_ = config;

    auto fail = [this](const std::string& message) {
        last_error_ = message;
        std::cerr << "[PreviewApp] " << message << std::endl;
        state_ = AppState::Uninitialized;
        return false;
    };

    // 1. 워크스페이스 루트
    std::error_code ec;
    std::filesystem::create_directories(config_.workspace_root, ec);
    if (ec) {
        return fail("워크스페이스 루트 생성 실패: " + config_.workspace_root + " (" + ec.message() + ")");
    }

    // 2. 상태 DB
    store_ = std::make_shared<data::DataStore>();
    if (!store_->open(config_.database_path)) {
        return fail("상태 DB 열기 실패: " + store_->lastError());
    }
    repository_ = std::make_shared<data::SessionRepository>(store_);
    if (!repository_->initialize()) {
        return fail("세션 스키마 초기화 실패: " + store_->lastError());
    }
    auto claims = std::make_shared<runtime::ProvisionClaimStore>(store_);
    if (!claims->initialize()) {
        return fail("클레임 스키마 초기화 실패: " + store_->lastError());
    }

    // 3. HTTP (libcurl 전역 초기화)
    network::HttpClient::globalInit();

    // 4. git / 워크스페이스
    auto runner = std::make_shared<PosixCommandRunner>();
    auto registry = std::make_shared<SessionRegistry>(repository_, config_.workspace_root,
                                                      config_.git.branch_prefix);
    auto git = std::make_shared<vcs::GitClient>(runner, config_.git.git_binary,
                                                std::chrono::milliseconds(config_.git.command_timeout_ms));
    auto workspaces = std::make_shared<vcs::WorkspaceManager>(registry, git, config_.git.remote_name);
    auto reverter = std::make_shared<vcs::GitRevertOperator>(git, config_.git.remote_name);

    // 5. 컨테이너 런타임
    runtime::OrchestratorComponents components;
    components.registry = registry;
    components.repository = repository_;
    components.activity = std::make_shared<ActivityTracker>(repository_);
    components.workspaces = workspaces;
    components.driver = std::make_shared<runtime::DockerCliDriver>(runner, config_.container.docker_binary,
                                                                   config_.container.container_port);
    components.router = runtime::createRouterAdapter(config_.container);
    components.probe = std::make_shared<network::HttpHealthProbe>(
        config_.container.health_path,
        std::chrono::milliseconds(config_.container.probe_timeout_ms),
        config_.container.probe_host_override);
    components.claims = claims;

    orchestrator_ = std::make_shared<runtime::ContainerOrchestrator>(config_, std::move(components));
    service_ = std::make_unique<PreviewService>(config_, registry, repository_, workspaces, reverter, orchestrator_);
    reclaimer_ = std::make_unique<IdleReclaimer>(repository_, orchestrator_, config_.idle);

    state_ = AppState::Running;
    std::cout << "[PreviewApp] 초기화 완료 (라우터: " << routerModeName(config_.container.router_mode)
              << ", 워크스페이스: " << config_.workspace_root << ")" << std::endl;
    return true;
}

void PreviewApp::shutdown() {
    if (state_ != AppState::Running) return;

    state_ = AppState::ShuttingDown;
    std::cout << "[PreviewApp] 종료 절차 시작..." << std::endl;

    reclaimer_->stopPeriodic();
    orchestrator_->waitForBackgroundTasks();

    reclaimer_.reset();
    service_.reset();
    orchestrator_.reset();
    repository_.reset();
    if (store_) {
        store_->close();
        store_.reset();
    }
    network::HttpClient::globalCleanup();

    state_ = AppState::Terminated;
    std::cout << "[PreviewApp] 종료 완료" << std::endl;
}

} // namespace previewd::core
