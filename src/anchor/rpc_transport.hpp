#ifndef MEDIGUARD_ANCHOR_RPC_TRANSPORT_HPP
#define MEDIGUARD_ANCHOR_RPC_TRANSPORT_HPP

#include <string>

namespace mediguard {
namespace anchor {

/**
 * @class IRpcTransport
 * @brief Sends one JSON-RPC request body and returns the raw response body.
 */
class IRpcTransport
{
public:
    virtual ~IRpcTransport() = default;

    /**
     * @throw core::AnchorServiceFailure on a network error or a non-2xx HTTP status.
     */
    virtual std::string Post(const std::string &url, const std::string &body) = 0;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_RPC_TRANSPORT_HPP
