#pragma once

#include <memory>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief Raw HTTP response (status code and body)
 */
struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status == 200; }
};

// ============================================================================
// HTTP Client Interface
// ============================================================================

/**
 * @brief Abstract HTTP transport
 *
 * Remote sentiment and embedding providers only need JSON POST. Keeping the
 * transport behind this interface lets tests substitute a scripted fake.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief POST a body with the given headers
     *
     * @param url Full request URL
     * @param body Request payload
     * @param headers Header lines ("Name: value")
     * @param timeout_seconds Whole-request timeout
     * @return Status and body; non-2xx statuses are returned, not thrown
     * @throws HttpError on transport failure (DNS, connect, timeout, TLS)
     */
    virtual HttpResponse post(
        const std::string& url,
        const std::string& body,
        const std::vector<std::string>& headers,
        int timeout_seconds
    ) = 0;
};

/**
 * @brief libcurl-backed client (one easy handle per request)
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpResponse post(
        const std::string& url,
        const std::string& body,
        const std::vector<std::string>& headers,
        int timeout_seconds
    ) override;
};

std::shared_ptr<HttpClient> make_default_http_client();

} // namespace tfa
