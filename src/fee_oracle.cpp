#include <votefee/fee_oracle.hpp>

#include <votefee/error.hpp>

namespace votefee {

linear_fee_oracle::linear_fee_oracle(boost::optional<uint64_t> max_tx_size)
  : max_tx_size_(max_tx_size)
{
}

size_t linear_fee_oracle::estimate_size(const network_id& network,
    const transaction& tx, size_t witnesses, size_t byron_witnesses) const
{
    // Testnet bootstrap witnesses carry the network magic in their
    // attributes.
    auto byron_size = byron_witness_size;
    if (!network.is_mainnet())
        byron_size += byron_testnet_attributes_size;

    return serialize(tx).size() +
        witnesses * key_witness_size +
        byron_witnesses * byron_size;
}

money linear_fee_oracle::estimate_fee(const network_id& network,
    money min_fee_a, money min_fee_b, const transaction& tx,
    size_t inputs, size_t outputs, size_t witnesses,
    size_t byron_witnesses) const
{
    if (tx.body.inputs.size() != inputs || tx.body.outputs.size() != outputs)
        throw oracle_failure("transaction shape disagrees with counts: " +
            std::to_string(tx.body.inputs.size()) + " inputs, " +
            std::to_string(tx.body.outputs.size()) + " outputs, expected " +
            std::to_string(inputs) + " and " + std::to_string(outputs));

    const auto size = estimate_size(network, tx, witnesses, byron_witnesses);
    if (max_tx_size_ && size > *max_tx_size_)
        throw oracle_failure("transaction size " + std::to_string(size) +
            " exceeds maximum " + std::to_string(*max_tx_size_));

    try
    {
        return checked_add(checked_multiply(min_fee_a, size), min_fee_b);
    }
    catch (const arithmetic_error& error)
    {
        throw oracle_failure(std::string("fee out of range: ") + error.what());
    }
}

} // namespace votefee

