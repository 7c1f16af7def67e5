/**
 * @file http_client.cpp
 * @brief 준비 상태 확인용 HTTP 클라이언트 구현
 */

#include "http_client.h"

#include <curl/curl.h>

#include <cctype>
#include <iostream>
#include <mutex>
#include <string_view>

namespace previewd::network {

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

/// 전송 중 수신 버퍼
struct ResponseSink {
    std::string body;
    std::unordered_map<std::string, std::string> headers;
    bool keep_body{true};
};

std::string_view trimView(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<ResponseSink*>(userdata);
    const size_t bytes = size * nmemb;
    if (sink->keep_body) {
        sink->body.append(ptr, bytes);
    }
    return bytes;
}

/// "Key: Value" 한 줄. 리다이렉트마다 상태 줄이 다시 오므로 헤더를 비움
size_t onHeader(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<ResponseSink*>(userdata);
    const size_t bytes = size * nmemb;
    const std::string_view line = trimView(std::string_view(ptr, bytes));

    if (line.rfind("HTTP/", 0) == 0) {
        sink->headers.clear();
        return bytes;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) return bytes;

    std::string key(trimView(line.substr(0, colon)));
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    sink->headers[key] = std::string(trimView(line.substr(colon + 1)));
    return bytes;
}

} // 익명 네임스페이스

struct HttpClient::Impl {
    CurlHandle curl{curl_easy_init()};
    std::mutex mutex;
};

// ============================================================
// 전역 초기화
// ============================================================

void HttpClient::globalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            std::cerr << "[HttpClient] libcurl 전역 초기화 실패: " << curl_easy_strerror(rc) << std::endl;
            return;
        }
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        std::cout << "[HttpClient] libcurl " << (info ? info->version : "?") << " 초기화" << std::endl;
    });
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

HttpClient::HttpClient() : impl_(std::make_unique<Impl>()) {
    if (!impl_->curl) {
        std::cerr << "[HttpClient] CURL 핸들 생성 실패" << std::endl;
    }
}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

// ============================================================
// 요청
// ============================================================

HttpResponse HttpClient::send(const HttpRequest& request) {
    std::lock_guard lock(impl_->mutex);
    HttpResponse response;

    CURL* curl = impl_->curl.get();
    if (!curl) {
        response.error_message = "CURL 핸들이 없습니다";
        return response;
    }
    curl_easy_reset(curl);

    ResponseSink sink;
    sink.keep_body = !request.discard_body;

    curl_slist* raw_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string line = key + ": " + value;
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_headers);
            response.error_message = "헤더 목록 생성 실패";
            return response;
        }
        raw_headers = appended;
    }
    HeaderList header_list(raw_headers);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);   // 여러 스레드에서 동시에 사용
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "previewd/1.0");
    if (request.method == HttpMethod::HEAD) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &sink);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.transfer_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

    const CURLcode rc = curl_easy_perform(curl);

    curl_off_t elapsed_us = 0;
    if (curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME_T, &elapsed_us) == CURLE_OK) {
        response.elapsed = std::chrono::milliseconds(elapsed_us / 1000);
    }

    // 연결 거부는 준비 전 정상 상태라 여기서 로그하지 않음
    if (rc != CURLE_OK) {
        response.curl_error_code = static_cast<int>(rc);
        response.error_message = curl_easy_strerror(rc);
        return response;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.success = true;
    response.status_code = static_cast<int>(status);
    response.body = std::move(sink.body);
    response.headers = std::move(sink.headers);
    return response;
}

HttpResponse HttpClient::get(const std::string& url) {
    HttpRequest request;
    request.url = url;
    return send(request);
}

} // namespace previewd::network
