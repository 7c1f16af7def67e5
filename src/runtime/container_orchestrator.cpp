/**
 * @file container_orchestrator.cpp
 * @brief 컨테이너 오케스트레이터 구현
 */

#include "container_orchestrator.h"
#include "container_driver.h"
#include "provision_claim.h"
#include "router_adapter.h"
#include "core/activity_tracker.h"
#include "core/session_registry.h"
#include "network/health_probe.h"
#include "vcs/workspace_manager.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <thread>

namespace previewd::runtime {

using core::ErrorCode;
using core::SessionKey;
using Clock = std::chrono::steady_clock;

namespace {

StartResult startFailure(ErrorCode code, std::string message) {
    StartResult result;
    result.error = code;
    result.error_message = std::move(message);
    return result;
}

ErrorCode errorFromDriver(DriverError error) {
    switch (error) {
        case DriverError::ResourceExhausted: return ErrorCode::ResourceExhausted;
        case DriverError::Unavailable:       return ErrorCode::RuntimeUnavailable;
        case DriverError::NotFound:          return ErrorCode::NotFound;
        default:                             return ErrorCode::Internal;
    }
}

/// 환경 변수 이름: [A-Za-z_][A-Za-z0-9_]*
bool isValidEnvKey(const std::string& key) {
    if (key.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_') return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // 익명 네임스페이스

const char* instanceStateName(InstanceState state) {
    switch (state) {
        case InstanceState::Starting:     return "starting";
        case InstanceState::Running:      return "running";
        case InstanceState::Unresponsive: return "unresponsive";
        case InstanceState::Stopped:      break;
    }
    return "stopped";
}

ContainerOrchestrator::ContainerOrchestrator(const core::Config& config, OrchestratorComponents components)
    : config_(config)
    , components_(std::move(components)) {}

ContainerOrchestrator::~ContainerOrchestrator() {
    waitForBackgroundTasks();
}

// ============================================================
// 정적 유틸리티
// ============================================================

std::string ContainerOrchestrator::containerName(const std::string& prefix, const SessionKey& key) {
    return prefix + std::to_string(key.project_id) + "-" + key.session_id.str();
}

std::string ContainerOrchestrator::databaseUrl(const core::SessionDatabaseConfig& db, const SessionKey& key) {
    return "postgres://" + db.user + ":" + db.password + "@" + db.host + ":" +
           std::to_string(db.port) + "/" + db.name_prefix + "_" +
           std::to_string(key.project_id) + "_session_" + key.session_id.str();
}

data::EnvVarList ContainerOrchestrator::mergeEnvironment(
    std::initializer_list<const data::EnvVarList*> layers) {
    data::EnvVarList merged;
    for (const auto* layer : layers) {
        if (!layer) continue;
        for (const auto& [key, value] : *layer) {
            if (!isValidEnvKey(key)) {
                std::cerr << "[ContainerOrchestrator] 잘못된 환경 변수 이름 무시: " << key << std::endl;
                continue;
            }
            auto it = std::find_if(merged.begin(), merged.end(),
                                   [&](const auto& entry) { return entry.first == key; });
            if (it != merged.end()) {
                it->second = value;
            } else {
                merged.emplace_back(key, value);
            }
        }
    }
    return merged;
}

// ============================================================
// 키 검증
// ============================================================

std::optional<SessionKey> ContainerOrchestrator::parseKey(int64_t project_id, const std::string& session_id,
                                                          ErrorCode& error, std::string& message) const {
    auto id = core::SessionId::parse(session_id);
    if (!id || project_id <= 0) {
        error = ErrorCode::InvalidArgument;
        message = id ? "잘못된 프로젝트 ID: " + std::to_string(project_id) : "허용되지 않는 세션 ID";
        return std::nullopt;
    }
    return SessionKey{project_id, *id};
}

std::optional<SessionKey> ContainerOrchestrator::requireActiveSession(int64_t project_id,
                                                                      const std::string& session_id,
                                                                      ErrorCode& error,
                                                                      std::string& message) const {
    auto key = parseKey(project_id, session_id, error, message);
    if (!key) return std::nullopt;
    if (!components_.registry->lookup(*key)) {
        error = ErrorCode::NotFound;
        message = "세션을 찾을 수 없습니다: " + key->toString();
        return std::nullopt;
    }
    return key;
}

RuntimeInstance ContainerOrchestrator::instanceFrom(const SessionKey& key, const ContainerInfo& info) const {
    RuntimeInstance instance;
    instance.instance_id = info.id;
    instance.project_id = key.project_id;
    instance.session_id = key.session_id.str();
    instance.container_name = info.name;
    instance.url = components_.router->containerUrl(info).value_or("");
    instance.started_at = info.created_at;
    instance.state = info.running ? InstanceState::Starting : InstanceState::Stopped;
    return instance;
}

// ============================================================
// status / inspect
// ============================================================

StatusResult ContainerOrchestrator::status(int64_t project_id, const std::string& session_id) {
    StatusResult result;
    auto key = requireActiveSession(project_id, session_id, result.error, result.error_message);
    if (!key) return result;

    components_.activity->touch(*key);

    const std::string name = containerName(config_.container.name_prefix, *key);
    DriverError driver_error = DriverError::None;
    auto info = components_.driver->inspect(name, &driver_error);
    if (!info && driver_error != DriverError::None && driver_error != DriverError::NotFound) {
        result.error = errorFromDriver(driver_error);
        result.error_message = "컨테이너 조회 실패: " + name;
        return result;
    }

    if (info && info->running) {
        result.success = true;
        result.running = true;
        result.url = components_.router->containerUrl(*info);
        if (result.url) {
            result.is_responding = components_.probe->probe(*result.url).responding;
        }
        return result;
    }

    result.success = true;
    result.running = false;

    bool pending = false;
    {
        std::lock_guard lock(background_mutex_);
        pending = pending_autostarts_.count(key->toString()) > 0;
    }
    if (pending || components_.claims->isClaimed(*key)) {
        result.start_in_progress = true;
        return result;
    }

    scheduleAutoStart(*key);
    result.auto_start_triggered = true;
    return result;
}

InspectResult ContainerOrchestrator::inspect(int64_t project_id, const std::string& session_id) {
    InspectResult result;
    auto key = parseKey(project_id, session_id, result.error, result.error_message);
    if (!key) return result;

    const std::string name = containerName(config_.container.name_prefix, *key);
    DriverError driver_error = DriverError::None;
    auto info = components_.driver->inspect(name, &driver_error);
    if (!info && driver_error != DriverError::None && driver_error != DriverError::NotFound) {
        result.error = errorFromDriver(driver_error);
        result.error_message = "컨테이너 조회 실패: " + name;
        return result;
    }

    result.success = true;
    if (!info) {
        result.instance.project_id = key->project_id;
        result.instance.session_id = key->session_id.str();
        result.instance.container_name = name;
        result.instance.state = components_.claims->isClaimed(*key)
            ? InstanceState::Starting : InstanceState::Stopped;
        return result;
    }

    result.instance = instanceFrom(*key, *info);
    if (info->running && !result.instance.url.empty()) {
        auto probe = components_.probe->probe(result.instance.url);
        result.instance.last_probe_at = core::nowEpochMs();
        if (probe.responding) {
            result.instance.state = InstanceState::Running;
        } else {
            result.instance.state = components_.claims->isClaimed(*key)
                ? InstanceState::Starting : InstanceState::Unresponsive;
        }
    } else if (!info->running && components_.claims->isClaimed(*key)) {
        result.instance.state = InstanceState::Starting;
    }
    return result;
}

void ContainerOrchestrator::scheduleAutoStart(const SessionKey& key) {
    std::lock_guard lock(background_mutex_);

    // 끝난 작업 정리
    background_tasks_.erase(
        std::remove_if(background_tasks_.begin(), background_tasks_.end(), [](std::future<void>& task) {
            return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        background_tasks_.end());

    const std::string tag = key.toString();
    if (!pending_autostarts_.insert(tag).second) return;

    std::cout << "[ContainerOrchestrator] 자동 시작 예약: " << tag << std::endl;
    background_tasks_.push_back(std::async(std::launch::async, [this, key, tag]() {
        StartResult started = startKey(key, {}, "");
        if (!started.success) {
            std::cerr << "[ContainerOrchestrator] 자동 시작 실패 (" << tag << "): "
                      << core::errorCodeName(started.error) << " - " << started.error_message << std::endl;
        }
        std::lock_guard done_lock(background_mutex_);
        pending_autostarts_.erase(tag);
    }));
}

void ContainerOrchestrator::waitForBackgroundTasks() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard lock(background_mutex_);
        tasks.swap(background_tasks_);
    }
    for (auto& task : tasks) {
        if (task.valid()) task.wait();
    }
}

// ============================================================
// start
// ============================================================

StartResult ContainerOrchestrator::start(int64_t project_id, const std::string& session_id,
                                         const data::EnvVarList& env_vars, const std::string& user_id) {
    ErrorCode error = ErrorCode::None;
    std::string message;
    auto key = requireActiveSession(project_id, session_id, error, message);
    if (!key) return startFailure(error, message);

    components_.activity->touch(*key);
    return startKey(*key, env_vars, user_id);
}

StartResult ContainerOrchestrator::startKey(const SessionKey& key, const data::EnvVarList& env_vars,
                                            const std::string& user_id) {
    const std::string name = containerName(config_.container.name_prefix, key);
    const auto deadline = Clock::now() + std::chrono::milliseconds(config_.container.start_timeout_ms);
    const auto ttl = std::chrono::milliseconds(config_.container.claim_ttl_ms);

    // 대기 중인 호출자는 앞선 시도가 실패하면 한 번 직접 프로비저닝을 시도
    for (int attempt = 0; attempt < 2; ++attempt) {
        DriverError driver_error = DriverError::None;
        auto info = components_.driver->inspect(name, &driver_error);
        if (driver_error == DriverError::Unavailable) {
            return startFailure(ErrorCode::RuntimeUnavailable, "컨테이너 런타임에 접근할 수 없습니다");
        }
        if (info && info->running) {
            StartResult result;
            result.success = true;
            result.url = components_.router->containerUrl(*info).value_or("");
            result.instance_id = info->id;
            result.status = components_.claims->isClaimed(key) ? InstanceState::Starting : InstanceState::Running;
            return result;
        }

        if (auto token = components_.claims->tryAcquire(key, ttl)) {
            return provision(key, env_vars, user_id, *token, deadline);
        }

        std::cout << "[ContainerOrchestrator] " << key.toString() << " 프로비저닝 진행 중, 대기" << std::endl;
        if (auto waited = waitForPeer(key, deadline)) {
            return *waited;
        }
        if (Clock::now() >= deadline) break;
    }

    return startFailure(ErrorCode::StartTimeout, "다른 시작 요청의 완료를 기다리다 시간 초과: " + key.toString());
}

std::optional<StartResult> ContainerOrchestrator::waitForPeer(const SessionKey& key, SteadyTime deadline) {
    const std::string name = containerName(config_.container.name_prefix, key);
    auto backoff = std::chrono::milliseconds(config_.container.backoff_initial_ms);
    const auto backoff_max = std::chrono::milliseconds(config_.container.backoff_max_ms);

    while (Clock::now() < deadline) {
        std::this_thread::sleep_for(std::min(backoff, remaining(deadline)));
        backoff = std::min(backoff * 2, backoff_max);

        if (components_.claims->isClaimed(key)) continue;

        // 클레임 해제: 앞선 시도가 끝남
        auto info = components_.driver->inspect(name);
        if (info && info->running) {
            StartResult result;
            result.success = true;
            result.url = components_.router->containerUrl(*info).value_or("");
            result.instance_id = info->id;
            result.status = InstanceState::Running;
            return result;
        }
        return std::nullopt;
    }

    // 시간 초과: 컨테이너가 떠 있으면 시작 중으로 보고
    auto info = components_.driver->inspect(name);
    if (info && info->running) {
        StartResult result;
        result.success = true;
        result.url = components_.router->containerUrl(*info).value_or("");
        result.instance_id = info->id;
        result.status = InstanceState::Starting;
        return result;
    }
    return startFailure(ErrorCode::StartTimeout, "인스턴스 준비 시간 초과: " + key.toString());
}

StartResult ContainerOrchestrator::provision(const SessionKey& key, const data::EnvVarList& env_vars,
                                             const std::string& user_id, const std::string& claim_token,
                                             SteadyTime deadline) {
    const std::string name = containerName(config_.container.name_prefix, key);
    const auto ttl = std::chrono::milliseconds(config_.container.claim_ttl_ms);

    auto finish = [&](StartResult result) {
        components_.claims->release(key, claim_token);
        if (result.success) {
            std::cout << "[ContainerOrchestrator] " << key.toString() << " 시작 완료: " << result.url << std::endl;
        } else {
            std::cerr << "[ContainerOrchestrator] " << key.toString() << " 시작 실패: "
                      << core::errorCodeName(result.error) << " - " << result.error_message << std::endl;
        }
        return result;
    };

    std::cout << "[ContainerOrchestrator] " << key.toString() << " 프로비저닝 시작" << std::endl;

    // 1. 런타임 확인
    if (!components_.driver->ping()) {
        return finish(startFailure(ErrorCode::RuntimeUnavailable, "컨테이너 런타임에 접근할 수 없습니다"));
    }
    auto image = components_.driver->ensureImage(config_.container.image);
    if (!image.success) {
        return finish(startFailure(errorFromDriver(image.error), "이미지 준비 실패: " + image.message));
    }
    components_.claims->refresh(key, claim_token, ttl);

    // 2. 워크스페이스
    auto workspace = components_.workspaces->prepare(key, config_.git_token);
    if (!workspace.success) {
        return finish(startFailure(workspace.error, workspace.error_message));
    }
    components_.claims->refresh(key, claim_token, ttl);

    // 3. 같은 이름의 멈춘 컨테이너 정리
    DriverError inspect_error = DriverError::None;
    if (auto stale = components_.driver->inspect(name, &inspect_error)) {
        if (stale->running) {
            StartResult result;
            result.success = true;
            result.url = components_.router->containerUrl(*stale).value_or("");
            result.instance_id = stale->id;
            result.status = InstanceState::Running;
            return finish(result);
        }
        auto removed = components_.driver->remove(name);
        if (!removed.success && removed.error != DriverError::NotFound) {
            return finish(startFailure(errorFromDriver(removed.error),
                                       "이전 컨테이너 삭제 실패: " + removed.message));
        }
    } else if (inspect_error == DriverError::Unavailable) {
        return finish(startFailure(ErrorCode::RuntimeUnavailable, "컨테이너 런타임에 접근할 수 없습니다"));
    }

    // 4. 환경 변수 (프로젝트 → 호출자 → 내부)
    const data::EnvVarList project_vars = components_.repository->environmentVariables(key.project_id);
    const std::string database_url = databaseUrl(config_.session_db, key);
    const data::EnvVarList internal_vars = {
        {"NODE_ENV", config_.container.node_env},
        {"PORT", std::to_string(config_.container.container_port)},
        {"PREVIEW_SOURCE_REMOTE", workspace.remote_url},
        {"PREVIEW_BRANCH", workspace.branch},
        {"POSTGRES_URL", database_url},
        {"DATABASE_URL", database_url},
    };

    ContainerSpec spec;
    spec.name = name;
    spec.image = config_.container.image;
    spec.network = config_.container.network;
    spec.env = mergeEnvironment({&project_vars, &env_vars, &internal_vars});
    spec.container_port = config_.container.container_port;
    spec.bind_source = workspace.path.string();
    spec.bind_target = config_.container.mount_path;

    // 5. 실행 (포트 충돌 시 새 포트로 재시도)
    const int max_attempts = components_.router->allocatesHostPorts()
        ? 1 + std::max(0, config_.container.port_conflict_retries) : 1;
    RouteInfo route;
    DriverResult run;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        route = components_.router->prepareRun(key, name);
        spec.host_port = route.host_port;
        spec.labels = route.labels;
        spec.labels[kLabelProjectId] = std::to_string(key.project_id);
        spec.labels[kLabelSessionId] = key.session_id.str();
        spec.labels[kLabelBranch] = workspace.branch;
        spec.labels[kLabelUrl] = route.url;
        spec.labels[kLabelStartedBy] = user_id;
        spec.labels[kLabelManaged] = "true";

        run = components_.driver->run(spec);
        if (run.success) break;

        // 이름을 이미 다른 시도의 컨테이너가 차지함: 삭제하지 않고 그 인스턴스를 사용
        if (run.error == DriverError::NameConflict) {
            return finish(adoptPeerInstance(key, name));
        }

        // 이름이 비어 있었으므로 남은 컨테이너는 이번 시도의 것
        teardown(name);
        if (run.error != DriverError::PortConflict) break;
        std::cerr << "[ContainerOrchestrator] 포트 충돌 ("
                  << (route.host_port ? std::to_string(*route.host_port) : "-") << "), 재시도 "
                  << (attempt + 1) << "/" << (max_attempts - 1) << std::endl;
    }
    if (!run.success) {
        ErrorCode code = run.error == DriverError::PortConflict ? ErrorCode::ResourceExhausted
                                                                : errorFromDriver(run.error);
        return finish(startFailure(code, "컨테이너 실행 실패: " + run.message));
    }

    // 6. 준비 대기
    StartResult ready = awaitReady(key, name, route.url, claim_token, deadline);
    if (!ready.success) {
        teardown(name);
        return finish(ready);
    }
    ready.instance_id = run.container_id;
    ready.provisioned = true;
    return finish(ready);
}

StartResult ContainerOrchestrator::awaitReady(const SessionKey& key, const std::string& name,
                                              const std::string& url, const std::string& claim_token,
                                              SteadyTime deadline) {
    const auto ttl = std::chrono::milliseconds(config_.container.claim_ttl_ms);
    auto backoff = std::chrono::milliseconds(config_.container.backoff_initial_ms);
    const auto backoff_max = std::chrono::milliseconds(config_.container.backoff_max_ms);

    while (true) {
        components_.claims->refresh(key, claim_token, ttl);

        auto info = components_.driver->inspect(name);
        if (!info || !info->running) {
            return startFailure(ErrorCode::Internal,
                                "컨테이너가 준비 전에 종료되었습니다 (" +
                                (info ? info->state : std::string("missing")) + ")");
        }

        if (components_.probe->probe(url).responding) {
            StartResult result;
            result.success = true;
            result.url = url;
            result.status = InstanceState::Running;
            return result;
        }

        if (Clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::min(backoff, remaining(deadline)));
        backoff = std::min(backoff * 2, backoff_max);
    }

    return startFailure(ErrorCode::StartTimeout,
                        "인스턴스가 " + std::to_string(config_.container.start_timeout_ms) +
                        "ms 안에 응답하지 않았습니다: " + url);
}

StartResult ContainerOrchestrator::adoptPeerInstance(const SessionKey& key, const std::string& name) {
    DriverError driver_error = DriverError::None;
    auto info = components_.driver->inspect(name, &driver_error);
    if (!info) {
        if (driver_error == DriverError::Unavailable) {
            return startFailure(ErrorCode::RuntimeUnavailable, "컨테이너 런타임에 접근할 수 없습니다");
        }
        return startFailure(ErrorCode::Internal, "이름 충돌 후 컨테이너가 사라졌습니다: " + name);
    }
    if (!info->running) {
        return startFailure(ErrorCode::Internal,
                            "같은 이름의 컨테이너가 실행 중이 아닙니다 (" + info->state + "): " + name);
    }

    std::cout << "[ContainerOrchestrator] " << key.toString() << " 다른 시도가 만든 인스턴스 사용: "
              << info->id << std::endl;

    StartResult result;
    result.success = true;
    result.url = components_.router->containerUrl(*info).value_or("");
    result.instance_id = info->id;
    result.status = components_.probe->probe(result.url).responding
        ? InstanceState::Running : InstanceState::Starting;
    return result;
}

void ContainerOrchestrator::teardown(const std::string& name) {
    auto removed = components_.driver->remove(name);
    if (!removed.success && removed.error != DriverError::NotFound) {
        std::cerr << "[ContainerOrchestrator] 정리 실패 (" << name << "): " << removed.message << std::endl;
    }
}

// ============================================================
// stop / restart
// ============================================================

StopResult ContainerOrchestrator::stop(int64_t project_id, const std::string& session_id) {
    StopResult result;
    auto key = parseKey(project_id, session_id, result.error, result.error_message);
    if (!key) return result;

    const std::string name = containerName(config_.container.name_prefix, *key);
    const auto grace = std::chrono::seconds(config_.container.stop_grace_seconds);

    auto stopped = components_.driver->stop(name, grace);
    if (!stopped.success) {
        if (stopped.error == DriverError::Unavailable) {
            result.error = ErrorCode::RuntimeUnavailable;
            result.error_message = stopped.message;
            return result;
        }
        if (stopped.error != DriverError::NotFound) {
            std::cerr << "[ContainerOrchestrator] 정상 종료 실패, 강제 삭제 (" << name << "): "
                      << stopped.message << std::endl;
        }
    }
    result.existed = stopped.success || stopped.error != DriverError::NotFound;

    auto removed = components_.driver->remove(name);
    if (!removed.success && removed.error != DriverError::NotFound) {
        result.error = errorFromDriver(removed.error);
        result.error_message = "컨테이너 삭제 실패: " + removed.message;
        std::cerr << "[ContainerOrchestrator] " << result.error_message << std::endl;
        return result;
    }

    if (result.existed) {
        std::cout << "[ContainerOrchestrator] " << key->toString() << " 정지 완료" << std::endl;
    }
    result.success = true;
    return result;
}

StartResult ContainerOrchestrator::restart(int64_t project_id, const std::string& session_id) {
    ErrorCode error = ErrorCode::None;
    std::string message;
    auto key = parseKey(project_id, session_id, error, message);
    if (!key) return startFailure(error, message);

    const std::string name = containerName(config_.container.name_prefix, *key);
    DriverError driver_error = DriverError::None;
    auto info = components_.driver->inspect(name, &driver_error);
    if (!info) {
        if (driver_error == DriverError::None || driver_error == DriverError::NotFound) {
            return startFailure(ErrorCode::NotFound, "재시작할 인스턴스가 없습니다: " + key->toString());
        }
        return startFailure(errorFromDriver(driver_error), "컨테이너 조회 실패: " + name);
    }

    auto restarted = components_.driver->restart(name, std::chrono::seconds(config_.container.stop_grace_seconds));
    if (!restarted.success) {
        return startFailure(errorFromDriver(restarted.error), "재시작 실패: " + restarted.message);
    }

    std::cout << "[ContainerOrchestrator] " << key->toString() << " 재시작" << std::endl;
    StartResult result;
    result.success = true;
    result.url = components_.router->containerUrl(*info).value_or("");
    result.instance_id = info->id;
    result.status = InstanceState::Starting;
    return result;
}

int ContainerOrchestrator::stopAllForProject(int64_t project_id) {
    int stopped = stopContainers(components_.driver->listByLabel(kLabelProjectId, std::to_string(project_id)));
    std::cout << "[ContainerOrchestrator] 프로젝트 " << project_id << " 인스턴스 " << stopped << "개 정지" << std::endl;
    return stopped;
}

int ContainerOrchestrator::stopAll() {
    int stopped = stopContainers(components_.driver->listByLabel(kLabelManaged, "true"));
    std::cout << "[ContainerOrchestrator] 전체 인스턴스 " << stopped << "개 정지" << std::endl;
    return stopped;
}

int ContainerOrchestrator::stopContainers(const std::vector<ContainerInfo>& containers) {
    int stopped = 0;
    const auto grace = std::chrono::seconds(config_.container.stop_grace_seconds);
    for (const auto& info : containers) {
        auto halted = components_.driver->stop(info.name, grace);
        if (!halted.success && halted.error != DriverError::NotFound) {
            std::cerr << "[ContainerOrchestrator] 정상 종료 실패 (" << info.name << "): " << halted.message << std::endl;
        }
        auto removed = components_.driver->remove(info.name);
        if (removed.success || removed.error == DriverError::NotFound) {
            ++stopped;
        } else {
            std::cerr << "[ContainerOrchestrator] 삭제 실패 (" << info.name << "): " << removed.message << std::endl;
        }
    }
    return stopped;
}

// ============================================================
// 목록
// ============================================================

std::vector<PreviewUrlEntry> ContainerOrchestrator::previewUrlsForProject(int64_t project_id) {
    std::vector<PreviewUrlEntry> entries;
    for (const auto& info : components_.driver->listByLabel(kLabelProjectId, std::to_string(project_id))) {
        auto label = [&info](const char* key) {
            auto it = info.labels.find(key);
            return it != info.labels.end() ? it->second : std::string();
        };

        PreviewUrlEntry entry;
        entry.session_id = label(kLabelSessionId);
        entry.branch = label(kLabelBranch);
        entry.container_name = info.name;
        entry.url = components_.router->containerUrl(info).value_or("");
        entry.container_state = info.state;
        entry.running = info.running;
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const PreviewUrlEntry& a, const PreviewUrlEntry& b) {
        return a.session_id < b.session_id;
    });
    return entries;
}

} // namespace previewd::runtime
