/**
 * @file config.cpp
 * @brief previewd 설정 로드/검증 구현
 */

#include "config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace previewd::core {

namespace {

/// 설정 파일과 환경 변수가 공유하는 키 목록
constexpr const char* kKnownKeys[] = {
    "workspace_root", "database_path", "git_token",
    "container.docker_binary", "container.image", "container.name_prefix",
    "container.network", "container.container_port", "container.mount_path",
    "container.router_mode", "container.base_domain", "container.traefik_entrypoint",
    "container.traefik_cert_resolver", "container.host_address",
    "container.port_range_start", "container.port_range_end",
    "container.port_conflict_retries", "container.health_path",
    "container.probe_host_override", "container.probe_timeout_ms",
    "container.start_timeout_ms", "container.backoff_initial_ms",
    "container.backoff_max_ms", "container.claim_ttl_ms",
    "container.stop_grace_seconds", "container.node_env",
    "session_db.host", "session_db.port", "session_db.user",
    "session_db.password", "session_db.name_prefix",
    "git.git_binary", "git.branch_prefix", "git.remote_name", "git.command_timeout_ms",
    "idle.idle_threshold_ms", "idle.sweep_interval_ms",
};

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

/// "container.image" → "PREVIEWD_CONTAINER_IMAGE"
std::string envNameFor(const std::string& key) {
    std::string name = "PREVIEWD_";
    for (char c : key) {
        name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

bool parseInt64(const std::string& value, int64_t& out) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) return false;
        out = static_cast<int64_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& value, int& out) {
    int64_t wide = 0;
    if (!parseInt64(value, wide)) return false;
    out = static_cast<int>(wide);
    return true;
}

} // 익명 네임스페이스

// ============================================================
// 로드
// ============================================================

Config Config::load(const std::string& path) {
    Config config;

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "[Config] 설정 파일을 열 수 없습니다: " << path << std::endl;
        } else {
            std::string line;
            int line_no = 0;
            while (std::getline(in, line)) {
                ++line_no;
                line = trim(line);
                if (line.empty() || line[0] == '#') continue;

                const auto eq = line.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "[Config] " << path << ":" << line_no
                              << " '=' 없음, 무시" << std::endl;
                    continue;
                }

                const std::string key = trim(line.substr(0, eq));
                const std::string value = trim(line.substr(eq + 1));
                if (!config.apply(key, value)) {
                    std::cerr << "[Config] " << path << ":" << line_no
                              << " 알 수 없는 키 또는 잘못된 값: " << key << std::endl;
                }
            }
        }
    }

    config.applyEnvironment();
    return config;
}

void Config::applyEnvironment() {
    for (const char* key : kKnownKeys) {
        std::string env_name = envNameFor(key);
        const char* value = std::getenv(env_name.c_str());
        if (!value) continue;
        if (!apply(key, value)) {
            std::cerr << "[Config] 환경 변수 값이 잘못되었습니다: " << env_name << std::endl;
        }
    }

    // 토큰은 관례적인 이름도 허용
    if (git_token.empty()) {
        if (const char* token = std::getenv("GITHUB_TOKEN")) {
            git_token = token;
        }
    }
}

bool Config::apply(const std::string& key, const std::string& value) {
    // 최상위
    if (key == "workspace_root") { workspace_root = value; return true; }
    if (key == "database_path") { database_path = value; return true; }
    if (key == "git_token") { git_token = value; return true; }

    // 컨테이너
    if (key == "container.docker_binary") { container.docker_binary = value; return true; }
    if (key == "container.image") { container.image = value; return true; }
    if (key == "container.name_prefix") { container.name_prefix = value; return true; }
    if (key == "container.network") { container.network = value; return true; }
    if (key == "container.container_port") return parseInt(value, container.container_port);
    if (key == "container.mount_path") { container.mount_path = value; return true; }
    if (key == "container.router_mode") {
        if (value == "port") { container.router_mode = RouterMode::HostPort; return true; }
        if (value == "traefik") { container.router_mode = RouterMode::Traefik; return true; }
        return false;
    }
    if (key == "container.base_domain") { container.base_domain = value; return true; }
    if (key == "container.traefik_entrypoint") { container.traefik_entrypoint = value; return true; }
    if (key == "container.traefik_cert_resolver") { container.traefik_cert_resolver = value; return true; }
    if (key == "container.host_address") { container.host_address = value; return true; }
    if (key == "container.port_range_start") return parseInt(value, container.port_range_start);
    if (key == "container.port_range_end") return parseInt(value, container.port_range_end);
    if (key == "container.port_conflict_retries") return parseInt(value, container.port_conflict_retries);
    if (key == "container.health_path") { container.health_path = value; return true; }
    if (key == "container.probe_host_override") { container.probe_host_override = value; return true; }
    if (key == "container.probe_timeout_ms") return parseInt64(value, container.probe_timeout_ms);
    if (key == "container.start_timeout_ms") return parseInt64(value, container.start_timeout_ms);
    if (key == "container.backoff_initial_ms") return parseInt64(value, container.backoff_initial_ms);
    if (key == "container.backoff_max_ms") return parseInt64(value, container.backoff_max_ms);
    if (key == "container.claim_ttl_ms") return parseInt64(value, container.claim_ttl_ms);
    if (key == "container.stop_grace_seconds") return parseInt(value, container.stop_grace_seconds);
    if (key == "container.node_env") { container.node_env = value; return true; }

    // 세션 DB
    if (key == "session_db.host") { session_db.host = value; return true; }
    if (key == "session_db.port") return parseInt(value, session_db.port);
    if (key == "session_db.user") { session_db.user = value; return true; }
    if (key == "session_db.password") { session_db.password = value; return true; }
    if (key == "session_db.name_prefix") { session_db.name_prefix = value; return true; }

    // git
    if (key == "git.git_binary") { git.git_binary = value; return true; }
    if (key == "git.branch_prefix") { git.branch_prefix = value; return true; }
    if (key == "git.remote_name") { git.remote_name = value; return true; }
    if (key == "git.command_timeout_ms") return parseInt64(value, git.command_timeout_ms);

    // 유휴 회수
    if (key == "idle.idle_threshold_ms") return parseInt64(value, idle.idle_threshold_ms);
    if (key == "idle.sweep_interval_ms") return parseInt64(value, idle.sweep_interval_ms);

    return false;
}

// ============================================================
// 검증
// ============================================================

std::optional<std::string> Config::validate() const {
    if (workspace_root.empty()) {
        return "workspace_root가 비어있습니다";
    }
    if (database_path.empty()) {
        return "database_path가 비어있습니다";
    }
    if (container.image.empty()) {
        return "container.image가 비어있습니다";
    }
    if (container.name_prefix.empty()) {
        return "container.name_prefix가 비어있습니다";
    }
    if (container.container_port <= 0 || container.container_port > 65535) {
        return "container.container_port 범위 오류";
    }
    if (container.router_mode == RouterMode::HostPort) {
        if (container.port_range_start <= 0 || container.port_range_end > 65535 ||
            container.port_range_start > container.port_range_end) {
            return "호스트 포트 범위 오류: " + std::to_string(container.port_range_start)
                   + "-" + std::to_string(container.port_range_end);
        }
    }
    if (container.router_mode == RouterMode::Traefik && container.base_domain.empty()) {
        return "traefik 모드에는 container.base_domain이 필요합니다";
    }
    if (container.health_path.empty() || container.health_path.front() != '/') {
        return "container.health_path는 '/'로 시작해야 합니다";
    }
    if (container.probe_timeout_ms <= 0 || container.start_timeout_ms <= 0) {
        return "프로브/시작 제한 시간은 양수여야 합니다";
    }
    if (container.backoff_initial_ms <= 0 || container.backoff_max_ms < container.backoff_initial_ms) {
        return "백오프 설정 오류";
    }
    if (container.claim_ttl_ms <= 0) {
        return "container.claim_ttl_ms는 양수여야 합니다";
    }
    if (git.branch_prefix.empty()) {
        return "git.branch_prefix가 비어있습니다";
    }
    if (idle.idle_threshold_ms <= 0 || idle.sweep_interval_ms <= 0) {
        return "유휴 회수 간격은 양수여야 합니다";
    }
    return std::nullopt;
}

const char* routerModeName(RouterMode mode) {
    return mode == RouterMode::Traefik ? "traefik" : "port";
}

} // namespace previewd::core
