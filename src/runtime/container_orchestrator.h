#pragma once

/**
 * @file container_orchestrator.h
 * @brief 세션별 미리보기 인스턴스 오케스트레이터
 *
 * 세션당 최대 하나의 실행 중 인스턴스를 보장합니다.
 * 실행 상태는 매번 런타임 조회와 클레임 테이블에서 복원하며
 * 프로세스 내에 캐시하지 않습니다.
 */

#include "core/config.h"
#include "core/session_types.h"
#include "data/session_repository.h"

#include <chrono>
#include <future>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace previewd::core {
class ActivityTracker;
class SessionRegistry;
}

namespace previewd::network {
class HealthProbe;
}

namespace previewd::vcs {
class WorkspaceManager;
}

namespace previewd::runtime {

class ContainerDriver;
class ProvisionClaimStore;
class RouterAdapter;
struct ContainerInfo;

// ============================================================
// 결과 타입
// ============================================================

/**
 * @brief 인스턴스 상태
 */
enum class InstanceState {
    Starting,       ///< 프로비저닝 중 또는 아직 응답 없음
    Running,        ///< 실행 중이고 응답함
    Unresponsive,   ///< 실행 중이지만 프로브 실패
    Stopped         ///< 컨테이너 없음 또는 정지됨
};

[[nodiscard]] const char* instanceStateName(InstanceState state);

/**
 * @brief 런타임에서 복원한 인스턴스 (저장하지 않음)
 */
struct RuntimeInstance {
    std::string instance_id;            ///< 컨테이너 ID
    int64_t project_id{0};
    std::string session_id;
    std::string container_name;
    std::string url;
    std::string started_at;             ///< 런타임이 보고한 생성 시각
    int64_t last_probe_at{0};           ///< 마지막 프로브 시각 (epoch ms, 없으면 0)
    InstanceState state{InstanceState::Stopped};
};

/**
 * @brief status() 결과
 */
struct StatusResult {
    bool success{false};
    bool running{false};
    std::optional<std::string> url;
    bool is_responding{false};
    bool auto_start_triggered{false};   ///< 이번 호출이 백그라운드 시작을 예약함
    bool start_in_progress{false};      ///< 다른 호출의 프로비저닝이 진행 중
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief inspect() 결과
 */
struct InspectResult {
    bool success{false};
    RuntimeInstance instance;
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief start()/restart() 결과
 */
struct StartResult {
    bool success{false};
    std::string url;
    InstanceState status{InstanceState::Stopped};   ///< Running 또는 Starting
    std::string instance_id;
    bool provisioned{false};                        ///< 이번 호출이 컨테이너를 만들었는지
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief stop() 결과
 */
struct StopResult {
    bool success{false};
    bool existed{false};                ///< 정지 전에 컨테이너가 있었는지
    core::ErrorCode error{core::ErrorCode::None};
    std::string error_message;
};

/**
 * @brief 프로젝트 미리보기 목록 항목
 */
struct PreviewUrlEntry {
    std::string session_id;
    std::string branch;
    std::string container_name;
    std::string url;                    ///< 라우팅 정보가 없으면 빈 문자열
    std::string container_state;        ///< 런타임 상태 문자열
    bool running{false};
};

/**
 * @brief 오케스트레이터 협력 객체
 */
struct OrchestratorComponents {
    std::shared_ptr<core::SessionRegistry> registry;
    std::shared_ptr<data::SessionRepository> repository;
    std::shared_ptr<core::ActivityTracker> activity;
    std::shared_ptr<vcs::WorkspaceManager> workspaces;
    std::shared_ptr<ContainerDriver> driver;
    std::shared_ptr<RouterAdapter> router;
    std::shared_ptr<network::HealthProbe> probe;
    std::shared_ptr<ProvisionClaimStore> claims;
};

// ============================================================
// ContainerOrchestrator
// ============================================================

/**
 * @brief 컨테이너 오케스트레이터
 *
 * 서로 다른 세션은 독립적으로 처리됩니다. 같은 세션의 start()만
 * TTL 클레임으로 상호 배제하며, status()/stop()은 진행 중인 start()와
 * 동시에 실행될 수 있습니다.
 */
class ContainerOrchestrator {
public:
    ContainerOrchestrator(const core::Config& config, OrchestratorComponents components);
    ~ContainerOrchestrator();

    // 복사 금지
    ContainerOrchestrator(const ContainerOrchestrator&) = delete;
    ContainerOrchestrator& operator=(const ContainerOrchestrator&) = delete;

    /**
     * @brief 세션 미리보기 상태 조회
     *
     * 활동 시각을 갱신합니다. 실행 중인 인스턴스도 진행 중인 프로비저닝도
     * 없으면 백그라운드에서 start()를 예약하고 running=false를 돌려줍니다.
     */
    StatusResult status(int64_t project_id, const std::string& session_id);

    /**
     * @brief 상태 변경 없는 조회 (자동 시작/활동 갱신 없음)
     */
    InspectResult inspect(int64_t project_id, const std::string& session_id);

    /**
     * @brief 미리보기 인스턴스 시작 (멱등)
     *
     * 이미 실행 중이면 기존 URL을 돌려줍니다. 다른 호출이 프로비저닝 중이면
     * 그 결과를 기다렸다가 재사용합니다.
     *
     * @param env_vars 호출자 환경 변수 (프로젝트 변수를 덮고, 내부 변수에 덮임)
     * @param user_id 시작을 요청한 사용자 (라벨로 기록)
     */
    StartResult start(int64_t project_id, const std::string& session_id,
                      const data::EnvVarList& env_vars = {},
                      const std::string& user_id = "");

    /**
     * @brief 인스턴스 정지 및 삭제 (멱등, 없으면 성공)
     */
    StopResult stop(int64_t project_id, const std::string& session_id);

    /**
     * @brief 기존 인스턴스 재시작 (없으면 NotFound)
     */
    StartResult restart(int64_t project_id, const std::string& session_id);

    /**
     * @brief 프로젝트의 모든 인스턴스 정지
     * @return 정지한 컨테이너 수
     */
    int stopAllForProject(int64_t project_id);

    /**
     * @brief previewd가 만든 모든 인스턴스 정지 (서비스 종료용)
     * @return 정지한 컨테이너 수
     */
    int stopAll();

    /**
     * @brief 프로젝트의 미리보기 URL 목록 (정지된 컨테이너 포함, 세션 ID 순)
     *
     * 런타임 라벨만 읽으며 자동 시작이나 활동 갱신을 하지 않습니다.
     */
    [[nodiscard]] std::vector<PreviewUrlEntry> previewUrlsForProject(int64_t project_id);

    /**
     * @brief 예약된 백그라운드 시작 작업이 모두 끝날 때까지 대기
     */
    void waitForBackgroundTasks();

    /**
     * @brief 결정적 컨테이너 이름: <prefix><projectId>-<sessionId>
     */
    [[nodiscard]] static std::string containerName(const std::string& prefix, const core::SessionKey& key);

    /**
     * @brief 세션 데이터베이스 URL
     */
    [[nodiscard]] static std::string databaseUrl(const core::SessionDatabaseConfig& db,
                                                 const core::SessionKey& key);

    /**
     * @brief 환경 변수 병합 (뒤의 목록이 앞을 덮음, 잘못된 키는 제외)
     */
    [[nodiscard]] static data::EnvVarList mergeEnvironment(
        std::initializer_list<const data::EnvVarList*> layers);

private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    std::optional<core::SessionKey> parseKey(int64_t project_id, const std::string& session_id,
                                             core::ErrorCode& error, std::string& message) const;

    /// 세션 키 검증 + 활성 레코드 확인
    std::optional<core::SessionKey> requireActiveSession(int64_t project_id, const std::string& session_id,
                                                         core::ErrorCode& error, std::string& message) const;

    StartResult startKey(const core::SessionKey& key, const data::EnvVarList& env_vars,
                         const std::string& user_id);

    /// 클레임을 가진 상태에서 실제 프로비저닝 (끝나면 클레임 해제)
    StartResult provision(const core::SessionKey& key, const data::EnvVarList& env_vars,
                          const std::string& user_id, const std::string& claim_token,
                          SteadyTime deadline);

    /// 다른 호출자의 프로비저닝 대기
    std::optional<StartResult> waitForPeer(const core::SessionKey& key, SteadyTime deadline);

    /// 컨테이너가 응답할 때까지 폴링
    StartResult awaitReady(const core::SessionKey& key, const std::string& name,
                           const std::string& url, const std::string& claim_token,
                           SteadyTime deadline);

    RuntimeInstance instanceFrom(const core::SessionKey& key, const ContainerInfo& info) const;

    void scheduleAutoStart(const core::SessionKey& key);

    /// run()이 이름 충돌로 실패했을 때 그 이름의 실행 중 인스턴스를 결과로 사용
    StartResult adoptPeerInstance(const core::SessionKey& key, const std::string& name);

    /// 목록의 컨테이너를 정지 후 삭제, 성공 수 반환
    int stopContainers(const std::vector<ContainerInfo>& containers);

    /// 생성한 컨테이너 정리 (실패 경로)
    void teardown(const std::string& name);

    core::Config config_;
    OrchestratorComponents components_;

    std::mutex background_mutex_;
    std::vector<std::future<void>> background_tasks_;
    std::unordered_set<std::string> pending_autostarts_;
};

} // namespace previewd::runtime
