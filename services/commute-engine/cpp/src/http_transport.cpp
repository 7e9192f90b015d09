/**
 * @file http_transport.cpp
 * @brief libcurl-backed transport.
 */

#include "http_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace commute {

namespace {

std::once_flag g_curl_init;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

}  // namespace

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlTransport::get(const std::string& url,
                                const std::vector<std::string>& headers) {
    return perform(url, nullptr, headers);
}

HttpResponse CurlTransport::post_json(const std::string& url, const std::string& body,
                                      const std::vector<std::string>& headers) {
    std::vector<std::string> all = headers;
    all.push_back("Content-Type: application/json");
    return perform(url, &body, all);
}

HttpResponse CurlTransport::perform(const std::string& url, const std::string* body,
                                    const std::vector<std::string>& headers) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl init failed");
    }

    HeaderList header_list;
    for (const auto& h : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), h.c_str());
        if (!appended) throw TransportError("curl header allocation failed");
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw TransportError(std::string("curl: ") + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::string url_encode(const std::string& value) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl init failed");
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw TransportError("curl escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}  // namespace commute
