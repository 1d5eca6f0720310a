#ifndef VOTEFEE_FEE_ORACLE_HPP
#define VOTEFEE_FEE_ORACLE_HPP

#include <boost/optional.hpp>
#include <votefee/money.hpp>
#include <votefee/network.hpp>
#include <votefee/transaction.hpp>

namespace votefee {

struct protocol_parameters
{
    // Fee per serialized byte.
    money min_fee_a;
    // Fixed fee per transaction.
    money min_fee_b;
    boost::optional<uint64_t> max_tx_size;
};

// Computes the fee of a candidate transaction from its shape.
// Implementations must be deterministic and side-effect free.
class fee_oracle
{
public:
    virtual ~fee_oracle() {}

    virtual money estimate_fee(const network_id& network,
        money min_fee_a, money min_fee_b, const transaction& tx,
        size_t inputs, size_t outputs, size_t witnesses,
        size_t byron_witnesses) const = 0;
};

constexpr size_t key_witness_size = 101;
constexpr size_t byron_witness_size = 139;
constexpr size_t byron_testnet_attributes_size = 8;

// fee = min_fee_a * size + min_fee_b, where size is the CBOR encoding of
// the unsigned transaction plus an allowance for each expected witness.
class linear_fee_oracle
  : public fee_oracle
{
public:
    explicit linear_fee_oracle(
        boost::optional<uint64_t> max_tx_size = boost::none);

    money estimate_fee(const network_id& network,
        money min_fee_a, money min_fee_b, const transaction& tx,
        size_t inputs, size_t outputs, size_t witnesses,
        size_t byron_witnesses) const override;

    size_t estimate_size(const network_id& network, const transaction& tx,
        size_t witnesses, size_t byron_witnesses) const;

private:
    const boost::optional<uint64_t> max_tx_size_;
};

} // namespace votefee

#endif

