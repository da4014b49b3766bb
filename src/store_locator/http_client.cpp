#include "store_locator/http_client.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>

namespace store_locator {

namespace {

struct CurlEasyDeleter final {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter final {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::size_t write_body(char* contents, std::size_t size, std::size_t nmemb, void* userp) {
    const std::size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(contents, total_size);
    return total_size;
}

}  // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds, std::string user_agent)
    : timeout_seconds_(timeout_seconds),
      str_user_agent_(std::move(user_agent)) {
    if (timeout_seconds_ <= 0) {
        throw std::invalid_argument("CurlHttpClient timeout must be positive");
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    HttpResponse response{};
    CurlEasyHandle curl{curl_easy_init()};
    if (!curl) {
        response.error = "Failed to initialize CURL handle";
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, str_user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CurlHeaderList header_list{};
    for (const auto& [key, value] : headers) {
        const std::string header = key + ": " + value;
        curl_slist* existing = header_list.release();
        curl_slist* appended = curl_slist_append(existing, header.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(existing);
            response.error = "Failed to build HTTP header list";
            return response;
        }
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    const CURLcode result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        response.error = curl_easy_strerror(result);
        return response;
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = status_code;
    return response;
}

}  // namespace store_locator
