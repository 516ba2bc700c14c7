#ifndef MEDIGUARD_ANCHOR_CURL_RPC_TRANSPORT_HPP
#define MEDIGUARD_ANCHOR_CURL_RPC_TRANSPORT_HPP

#include <string>
#include "anchor/rpc_transport.hpp"

/*
  CurlRpcTransport
  --------------------------------
  HTTP POST of a JSON-RPC body with libcurl.

   - curl_global_init runs once per process (see initCurl).
   - One easy handle per request, so instances can be shared between threads.
   - Must be linked against libcurl.
*/

namespace mediguard {
namespace anchor {

class CurlRpcTransport : public IRpcTransport
{
public:
    explicit CurlRpcTransport(long timeoutSeconds = 30);

    std::string Post(const std::string &url, const std::string &body) override;

private:
    static void initCurl();
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    long m_timeoutSeconds;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_CURL_RPC_TRANSPORT_HPP
