#include <votefee/network.hpp>

namespace votefee {

network_id network_id::mainnet()
{
    return network_id(true, 0);
}
network_id network_id::testnet(network_magic magic)
{
    return network_id(false, magic);
}

network_id::network_id(bool mainnet, network_magic magic)
  : mainnet_(mainnet), magic_(magic)
{
}

bool network_id::is_mainnet() const
{
    return mainnet_;
}
network_magic network_id::magic() const
{
    return magic_;
}

uint8_t network_id::address_tag() const
{
    return mainnet_ ? 1 : 0;
}

std::string network_id::to_string() const
{
    if (mainnet_)
        return "mainnet";
    return "testnet " + std::to_string(magic_);
}

bool network_id::operator==(const network_id& other) const
{
    if (mainnet_ != other.mainnet_)
        return false;
    return mainnet_ || magic_ == other.magic_;
}
bool network_id::operator!=(const network_id& other) const
{
    return !(*this == other);
}

} // namespace votefee

