#include "http/http_client.hpp"
#include "core/errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace tfa {

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::once_flag curl_init_flag;

} // anonymous namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(curl_init_flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpResponse CurlHttpClient::post(
    const std::string& url,
    const std::string& body,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw HttpError("Failed to initialize CURL");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw HttpError("CURL request failed: " + error);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    return response;
}

std::shared_ptr<HttpClient> make_default_http_client() {
    return std::make_shared<CurlHttpClient>();
}

} // namespace tfa
