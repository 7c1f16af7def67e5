/**
 * @file health_probe.cpp
 * @brief HTTP 준비 상태 프로브 구현
 */

#include "health_probe.h"
#include "http_client.h"

namespace previewd::network {

HttpHealthProbe::HttpHealthProbe(std::string health_path,
                                 std::chrono::milliseconds timeout,
                                 std::string host_override)
    : health_path_(std::move(health_path))
    , timeout_(timeout)
    , host_override_(std::move(host_override)) {}

std::string HttpHealthProbe::probeUrl(const std::string& base_url) const {
    std::string url = base_url;

    if (!host_override_.empty()) {
        const std::string localhost = "://localhost";
        auto pos = url.find(localhost);
        if (pos != std::string::npos) {
            url.replace(pos + 3, localhost.size() - 3, host_override_);
        }
    }

    // 경로 결합 시 슬래시 중복 방지
    if (!url.empty() && url.back() == '/' && !health_path_.empty() && health_path_.front() == '/') {
        url.pop_back();
    }
    return url + health_path_;
}

ProbeResult HttpHealthProbe::probe(const std::string& base_url) {
    ProbeResult result;

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = probeUrl(base_url);
    request.connect_timeout = timeout_;
    request.transfer_timeout = timeout_;
    request.discard_body = true;
    // 개발 서버는 자체 서명 인증서를 쓰는 경우가 많음
    request.verify_ssl = false;

    // 세션마다 동시에 호출되므로 핸들을 공유하지 않음
    HttpClient client;
    HttpResponse response = client.send(request);

    if (!response.success) {
        result.error_message = response.error_message;
        return result;
    }

    result.status_code = response.status_code;
    result.responding = !response.isServerError() && response.status_code > 0;
    if (!result.responding) {
        result.error_message = "HTTP " + std::to_string(response.status_code);
    }
    return result;
}

} // namespace previewd::network
