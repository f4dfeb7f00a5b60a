// src/data/http_client.cpp

#include "fund_ngin/data/http_client.hpp"
#include <curl/curl.h>
#include <mutex>

namespace fund_ngin {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

Result<HttpResponse> http_get(const std::string& url, const HttpOptions& options) {
    ensure_curl_global_init();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize curl",
                                        "HttpClient");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : options.headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR,
                                        "Request timed out: " + url, "HttpClient");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(
            ErrorCode::CONNECTION_ERROR,
            "Request failed for " + url + ": " + std::string(curl_easy_strerror(res)),
            "HttpClient");
    }
    return response;
}

}  // namespace fund_ngin
