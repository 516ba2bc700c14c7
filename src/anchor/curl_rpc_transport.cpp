#include "anchor/curl_rpc_transport.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include "core/errors.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace anchor {

CurlRpcTransport::CurlRpcTransport(long timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds > 0 ? timeoutSeconds : 30)
{
    initCurl();
}

// -----------------------------------------------------------------------------
// Static initialization of libcurl for the entire process
// -----------------------------------------------------------------------------
void CurlRpcTransport::initCurl()
{
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw core::AnchorServiceFailure(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

std::string CurlRpcTransport::Post(const std::string &url, const std::string &body)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw core::AnchorServiceFailure("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
    headers.reset(curl_slist_append(headers.release(), "Expect:")); // disable Expect: 100-continue

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        util::logger::error("[CurlRpcTransport] POST " + url + " failed: " + curl_easy_strerror(res));
        throw core::AnchorServiceFailure(std::string("rpc request failed: ") + curl_easy_strerror(res));
    }

    long httpStatus = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpStatus);
    if (httpStatus < 200 || httpStatus >= 300) {
        throw core::AnchorServiceFailure("rpc endpoint answered HTTP " + std::to_string(httpStatus) +
                                         ": " + response.substr(0, 200));
    }
    return response;
}

// -----------------------------------------------------------------------------
// Callback for libcurl to write response data
// -----------------------------------------------------------------------------
size_t CurlRpcTransport::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string *>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

} // namespace anchor
} // namespace mediguard
