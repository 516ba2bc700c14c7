#ifndef MEDIGUARD_CONFIG_ANCHOR_NETWORKS_HPP
#define MEDIGUARD_CONFIG_ANCHOR_NETWORKS_HPP

#include <string>
#include <cstdint>
#include <vector>
#include <algorithm>
#include <cctype>

/**
 * @file anchor_networks.hpp
 * @brief Named public networks the RPC anchor service can commit to.
 *
 * Example usage:
 *  @code
 *    auto net = mediguard::config::findAnchorNetwork("polygon");
 *    if (net) { std::cout << net->chainId << "\n"; } // 137
 *  @endcode
 */

namespace mediguard {
namespace config {

/**
 * @struct AnchorNetwork
 * @brief A network name and the EIP-155 chain id transactions must carry.
 */
struct AnchorNetwork
{
    std::string name;
    uint64_t    chainId;
    bool        testnet;
};

inline const std::vector<AnchorNetwork>& knownAnchorNetworks()
{
    static const std::vector<AnchorNetwork> networks = {
        {"sepolia", 11155111, true},
        {"mumbai",  80001,    true},
        {"mainnet", 1,        false},
        {"polygon", 137,      false},
    };
    return networks;
}

/// Default when the configured network name is unknown.
inline const AnchorNetwork& defaultAnchorNetwork()
{
    return knownAnchorNetworks().front();
}

/**
 * @brief Case-insensitive lookup by name.
 * @return nullptr if the name is not a known network.
 */
inline const AnchorNetwork* findAnchorNetwork(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto &net : knownAnchorNetworks()) {
        if (net.name == lower) {
            return &net;
        }
    }
    return nullptr;
}

} // namespace config
} // namespace mediguard

#endif // MEDIGUARD_CONFIG_ANCHOR_NETWORKS_HPP
