/**
 * @file router_adapter.cpp
 * @brief 라우팅 전략 구현
 */

#include "router_adapter.h"
#include "core/config.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace previewd::runtime {

namespace {

constexpr size_t kMaxDnsLabel = 63;
constexpr size_t kHashSuffixLength = 8;

/// SHA-256 앞부분 16진수
std::string shortDigest(const std::string& text) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        return std::string(kHashSuffixLength, '0');
    }
    std::string hex;
    char buf[3];
    for (unsigned int i = 0; i < length && hex.size() < kHashSuffixLength; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex.substr(0, kHashSuffixLength);
}

/// 소문자 + [a-z0-9-], 연속 '-' 축약, 앞뒤 '-' 제거
std::string sanitizeLabel(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        char lower = static_cast<char>(std::tolower(c));
        bool allowed = std::isalnum(static_cast<unsigned char>(lower)) || lower == '-';
        char next = allowed ? lower : '-';
        if (next == '-' && !out.empty() && out.back() == '-') continue;
        out += next;
    }
    while (!out.empty() && out.front() == '-') out.erase(0, 1);
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

} // 익명 네임스페이스

int randomPortInRange(int first, int last) {
    if (last <= first) return first;
    uint32_t value = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
        std::cerr << "[RouterAdapter] RAND_bytes 실패, 범위 시작 포트 사용" << std::endl;
        return first;
    }
    const uint32_t span = static_cast<uint32_t>(last - first + 1);
    return first + static_cast<int>(value % span);
}

// ============================================================
// HostPortRouter
// ============================================================

HostPortRouter::HostPortRouter(std::string host_address, int port_first, int port_last,
                               PortPicker picker)
    : host_address_(std::move(host_address))
    , port_first_(port_first)
    , port_last_(port_last)
    , picker_(std::move(picker)) {}

RouteInfo HostPortRouter::prepareRun(const core::SessionKey& /*key*/, const std::string& /*container_name*/) {
    RouteInfo route;
    route.host_port = picker_(port_first_, port_last_);
    route.url = "http://" + host_address_ + ":" + std::to_string(*route.host_port);
    return route;
}

std::optional<std::string> HostPortRouter::containerUrl(const ContainerInfo& info) const {
    if (info.host_port) {
        return "http://" + host_address_ + ":" + std::to_string(*info.host_port);
    }
    auto it = info.labels.find(kLabelUrl);
    if (it != info.labels.end() && !it->second.empty()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================
// TraefikRouter
// ============================================================

TraefikRouter::TraefikRouter(std::string base_domain, std::string entrypoint,
                             std::string cert_resolver, std::string network, int container_port)
    : base_domain_(std::move(base_domain))
    , entrypoint_(std::move(entrypoint))
    , cert_resolver_(std::move(cert_resolver))
    , network_(std::move(network))
    , container_port_(container_port) {}

std::string TraefikRouter::hostnameFor(int64_t project_id, const std::string& session_id) const {
    const std::string prefix = "project-" + std::to_string(project_id) + "-";
    std::string session = sanitizeLabel(session_id);

    const bool lossy = session != session_id;
    const bool truncated = prefix.size() + session.size() > kMaxDnsLabel;
    if (lossy || truncated) {
        const size_t suffix_room = kHashSuffixLength + 1;
        const size_t budget = kMaxDnsLabel > prefix.size() + suffix_room
            ? kMaxDnsLabel - prefix.size() - suffix_room
            : 0;
        if (session.size() > budget) {
            session.resize(budget);
            while (!session.empty() && session.back() == '-') session.pop_back();
        }
        if (!session.empty()) session += '-';
        session += shortDigest(session_id);
        if (prefix.size() + session.size() > kMaxDnsLabel) {
            session = session.substr(session.size() - (kMaxDnsLabel - prefix.size()));
        }
    }
    return prefix + session + "." + base_domain_;
}

RouteInfo TraefikRouter::prepareRun(const core::SessionKey& key, const std::string& container_name) {
    RouteInfo route;
    const std::string host = hostnameFor(key.project_id, key.session_id.str());
    route.url = "https://" + host;

    const std::string router = "routers." + container_name;
    route.labels["traefik.enable"] = "true";
    route.labels["traefik.http." + router + ".rule"] = "Host(`" + host + "`)";
    route.labels["traefik.http." + router + ".entrypoints"] = entrypoint_;
    route.labels["traefik.http." + router + ".tls.certresolver"] = cert_resolver_;
    route.labels["traefik.http.services." + container_name + ".loadbalancer.server.port"] =
        std::to_string(container_port_);
    if (!network_.empty()) {
        route.labels["traefik.docker.network"] = network_;
    }
    return route;
}

std::optional<std::string> TraefikRouter::containerUrl(const ContainerInfo& info) const {
    auto project = info.labels.find(kLabelProjectId);
    auto session = info.labels.find(kLabelSessionId);
    if (project == info.labels.end() || session == info.labels.end()) {
        return std::nullopt;
    }
    try {
        return "https://" + hostnameFor(std::stoll(project->second), session->second);
    } catch (const std::exception& e) {
        std::cerr << "[RouterAdapter] 잘못된 프로젝트 라벨: " << project->second
                  << " (" << e.what() << ")" << std::endl;
        return std::nullopt;
    }
}

// ============================================================
// 팩토리
// ============================================================

std::unique_ptr<RouterAdapter> createRouterAdapter(const core::ContainerConfig& config) {
    if (config.router_mode == core::RouterMode::Traefik) {
        return std::make_unique<TraefikRouter>(config.base_domain, config.traefik_entrypoint,
                                               config.traefik_cert_resolver, config.network,
                                               config.container_port);
    }
    return std::make_unique<HostPortRouter>(config.host_address, config.port_range_start,
                                            config.port_range_end);
}

} // namespace previewd::runtime
