#ifndef VOTEFEE_NETWORK_HPP
#define VOTEFEE_NETWORK_HPP

#include <cstdint>
#include <string>

namespace votefee {

typedef uint32_t network_magic;

class network_id
{
public:
    static network_id mainnet();
    static network_id testnet(network_magic magic);

    bool is_mainnet() const;
    // Only meaningful for testnets.
    network_magic magic() const;

    // Low nibble of a shelley address header.
    uint8_t address_tag() const;

    std::string to_string() const;

    bool operator==(const network_id& other) const;
    bool operator!=(const network_id& other) const;

private:
    network_id(bool mainnet, network_magic magic);

    bool mainnet_;
    network_magic magic_;
};

} // namespace votefee

#endif

