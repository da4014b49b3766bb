// === HTTP Client =============================================================
//
// Minimal blocking HTTP GET abstraction used by the geocoder. The interface
// lets tests substitute canned responses; `CurlHttpClient` is the libcurl
// implementation used in production.

#pragma once

#include <map>
#include <string>

namespace store_locator {

using HttpHeaders = std::map<std::string, std::string>;

/** @brief Outcome of a single HTTP exchange. */
struct HttpResponse final {
    long status_code{};      /**< HTTP status, 0 when the transport failed. */
    std::string body{};      /**< Response payload. */
    std::string error{};     /**< Transport error description; empty on success. */

    /** @brief Transport succeeded; the server may still have returned an error status. */
    [[nodiscard]] bool transport_ok() const noexcept { return error.empty(); }
    /** @brief Transport succeeded and the status is 2xx. */
    [[nodiscard]] bool is_success() const noexcept { return transport_ok() && status_code >= 200 && status_code < 300; }
};

/** @brief Blocking HTTP client interface. */
class HttpClient {
  public:
    virtual ~HttpClient() = default;

    /** @brief Perform a GET request against @p url. Transport failures are reported in the response, not thrown. */
    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
};

/** @brief libcurl-backed HttpClient. Owns curl global initialization for its lifetime. */
class CurlHttpClient final : public HttpClient {
  public:
    CurlHttpClient(long timeout_seconds, std::string user_agent);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;

  private:
    long timeout_seconds_;
    std::string str_user_agent_;
};

}  // namespace store_locator
