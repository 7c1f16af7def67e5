#pragma once

/**
 * @file http_client.h
 * @brief 준비 상태 확인용 HTTP 클라이언트 (libcurl 래퍼)
 *
 * 미리보기 인스턴스가 요청을 받기 시작했는지 확인하는 짧은 요청만 다룹니다.
 * 제한 시간은 요청마다 밀리초 단위로 지정합니다.
 */

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

namespace previewd::network {

/**
 * @brief HTTP 메서드
 */
enum class HttpMethod {
    GET,
    HEAD
};

/**
 * @brief HTTP 요청
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    std::unordered_map<std::string, std::string> headers;

    std::chrono::milliseconds connect_timeout{2000};    ///< TCP/TLS 연결 제한
    std::chrono::milliseconds transfer_timeout{5000};   ///< 전체 요청 제한

    bool verify_ssl{true};
    bool follow_redirects{true};
    int max_redirects{5};
    bool discard_body{false};                           ///< 상태 코드만 필요할 때
};

/**
 * @brief HTTP 응답
 *
 * success는 전송 자체의 성공입니다. 5xx 응답도 success=true입니다.
 */
struct HttpResponse {
    bool success{false};
    int status_code{0};
    std::string body;
    std::unordered_map<std::string, std::string> headers;  ///< 키는 소문자
    std::chrono::milliseconds elapsed{0};

    std::string error_message;
    int curl_error_code{0};

    /// 2xx
    [[nodiscard]] bool isOk() const {
        return success && status_code >= 200 && status_code < 300;
    }

    /// 5xx
    [[nodiscard]] bool isServerError() const {
        return success && status_code >= 500;
    }
};

/**
 * @brief HTTP 클라이언트
 *
 * CURL easy 핸들 하나를 소유하며 send()는 직렬화됩니다.
 * 여러 세션을 동시에 확인하려면 클라이언트를 각각 만듭니다.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /**
     * @brief libcurl 전역 초기화 (스레드를 만들기 전에 호출, 여러 번 호출해도 한 번만 수행)
     */
    static void globalInit();

    /**
     * @brief libcurl 전역 정리
     */
    static void globalCleanup();

    [[nodiscard]] HttpResponse send(const HttpRequest& request);

    [[nodiscard]] HttpResponse get(const std::string& url);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace previewd::network
