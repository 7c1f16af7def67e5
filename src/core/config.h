#pragma once

/**
 * @file config.h
 * @brief previewd 설정
 *
 * 기본값 → key=value 설정 파일 → PREVIEWD_* 환경 변수 순서로 덮어씁니다.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace previewd::core {

/**
 * @brief 라우팅 방식
 */
enum class RouterMode {
    HostPort,   ///< 호스트 포트 매핑 (http://localhost:<port>)
    Traefik     ///< Traefik 서브도메인 (https://project-<id>-<session>.<domain>)
};

/**
 * @brief 컨테이너 관련 설정
 */
struct ContainerConfig {
    std::string docker_binary{"docker"};            ///< docker CLI 경로
    std::string image{"ghcr.io/kosuke-org/kosuke-template:latest"}; ///< 미리보기 이미지
    std::string name_prefix{"kosuke-preview-"};     ///< 컨테이너 이름 접두사
    std::string network{"kosuke_network"};          ///< 컨테이너 네트워크 (비어있으면 기본)
    int container_port{3000};                       ///< 컨테이너 내부 앱 포트
    std::string mount_path{"/app"};                 ///< 워크스페이스 마운트 위치
    RouterMode router_mode{RouterMode::HostPort};   ///< 라우팅 방식
    std::string base_domain;                        ///< Traefik 기본 도메인
    std::string traefik_entrypoint{"websecure"};    ///< Traefik 진입점
    std::string traefik_cert_resolver{"letsencrypt"}; ///< Traefik 인증서 리졸버
    std::string host_address{"localhost"};          ///< 호스트 포트 모드 URL 호스트
    int port_range_start{3001};                     ///< 호스트 포트 범위 시작
    int port_range_end{3100};                       ///< 호스트 포트 범위 끝
    int port_conflict_retries{3};                   ///< 포트 충돌 시 재선택 횟수
    std::string health_path{"/"};                   ///< 준비 확인 경로
    std::string probe_host_override;                ///< 프로브 시 localhost 대체 호스트
    int64_t probe_timeout_ms{2000};                 ///< 프로브 제한 시간
    int64_t start_timeout_ms{120000};               ///< 시작 준비 대기 제한 시간
    int64_t backoff_initial_ms{250};                ///< 준비 폴링 초기 간격
    int64_t backoff_max_ms{4000};                   ///< 준비 폴링 최대 간격
    int64_t claim_ttl_ms{60000};                    ///< 프로비저닝 클레임 TTL
    int stop_grace_seconds{5};                      ///< 정상 종료 대기 (초)
    std::string node_env{"development"};            ///< NODE_ENV 값
};

/**
 * @brief 세션 데이터베이스 연결 정보 (컨테이너에 주입)
 */
struct SessionDatabaseConfig {
    std::string host{"postgres"};
    int port{5432};
    std::string user{"postgres"};
    std::string password{"postgres"};
    std::string name_prefix{"kosuke_project"};  ///< DB 이름: <prefix>_<project>_session_<session>
};

/**
 * @brief git 관련 설정
 */
struct GitConfig {
    std::string git_binary{"git"};              ///< git CLI 경로
    std::string branch_prefix{"kosuke/chat-"};  ///< 세션 브랜치 접두사
    std::string remote_name{"origin"};          ///< 원격 이름
    int64_t command_timeout_ms{120000};         ///< git 명령 제한 시간
};

/**
 * @brief 유휴 회수 설정
 */
struct IdleConfig {
    int64_t idle_threshold_ms{30LL * 60 * 1000};    ///< 유휴 판정 기준 (기본 30분)
    int64_t sweep_interval_ms{5LL * 60 * 1000};     ///< 주기 회수 간격 (기본 5분)
};

/**
 * @brief 전체 설정
 */
struct Config {
    std::string workspace_root{"./projects"};   ///< 프로젝트/세션 워크스페이스 루트
    std::string database_path{"./previewd.db"}; ///< 상태 DB 경로
    std::string git_token;                      ///< 기본 git 자격 증명 토큰

    ContainerConfig container;
    SessionDatabaseConfig session_db;
    GitConfig git;
    IdleConfig idle;

    /**
     * @brief 설정 로드
     * @param path 설정 파일 경로 (비어있거나 없으면 기본값 + 환경 변수)
     */
    [[nodiscard]] static Config load(const std::string& path = "");

    /**
     * @brief key=value 한 쌍 적용
     * @return 알 수 없는 키거나 값이 잘못되면 false
     */
    bool apply(const std::string& key, const std::string& value);

    /**
     * @brief PREVIEWD_* 환경 변수 적용
     */
    void applyEnvironment();

    /**
     * @brief 설정 검증
     * @return 문제가 있으면 에러 메시지
     */
    [[nodiscard]] std::optional<std::string> validate() const;
};

[[nodiscard]] const char* routerModeName(RouterMode mode);

} // namespace previewd::core
