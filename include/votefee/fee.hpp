#ifndef VOTEFEE_FEE_HPP
#define VOTEFEE_FEE_HPP

#include <ostream>
#include <boost/optional.hpp>
#include <votefee/fee_oracle.hpp>
#include <votefee/metadata.hpp>
#include <votefee/money.hpp>
#include <votefee/network.hpp>
#include <votefee/transaction.hpp>

namespace votefee {

// Linear fee model: fee(n) = fee_base + n * fee_per_input.
// Only valid for the network, protocol parameters and metadata it was
// estimated with.
struct fee_params
{
    money fee_base;
    money fee_per_input;
};

bool operator==(const fee_params& left, const fee_params& right);
bool operator!=(const fee_params& left, const fee_params& right);

money required_fee(const fee_params& params, size_t inputs);

class fee_estimator
{
public:
    fee_estimator(const fee_oracle& oracle,
        const transaction_builder& builder);

    // Prices sample transactions with zero inputs and with one mock input,
    // both expiring at ttl.
    fee_params estimate(const network_id& network,
        const protocol_parameters& params,
        const transaction_metadata& metadata, slot_number ttl) const;
    fee_params estimate(const network_id& network,
        const protocol_parameters& params,
        const transaction_metadata& metadata, slot_number ttl,
        std::ostream& stream) const;

    // Fee of a single-output transaction assuming one signature.
    money estimate_transaction_fee(const network_id& network,
        const protocol_parameters& params, slot_number ttl,
        const input_reference_list& inputs, const shelley_address& address,
        money value, const transaction_metadata& metadata) const;

    // Oracle fee of an unsigned body that will carry one signature.
    money price_transaction(const network_id& network,
        const protocol_parameters& params,
        const transaction_body& body) const;

    // Builds a body paying total - fee back to address, raising the fee
    // until the oracle accepts it for the body as written. None when total
    // cannot cover the fee.
    boost::optional<transaction_body> balance_transaction(
        const network_id& network, const protocol_parameters& params,
        const transaction_extra_content& extra, slot_number ttl,
        const input_reference_list& inputs, const shelley_address& address,
        money total, money fee) const;

private:
    const fee_oracle& oracle_;
    const transaction_builder& builder_;
};

// Uses linear_fee_oracle and standard_transaction_builder.
fee_params estimate_fee_params(const network_id& network,
    const protocol_parameters& params, const transaction_metadata& metadata,
    slot_number ttl);

} // namespace votefee

#endif

