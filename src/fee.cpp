#include <votefee/fee.hpp>

#include <votefee/error.hpp>
#include <votefee/mock_identity.hpp>

namespace votefee {

bool operator==(const fee_params& left, const fee_params& right)
{
    return left.fee_base == right.fee_base &&
        left.fee_per_input == right.fee_per_input;
}
bool operator!=(const fee_params& left, const fee_params& right)
{
    return !(left == right);
}

money required_fee(const fee_params& params, size_t inputs)
{
    return checked_add(params.fee_base,
        checked_multiply(params.fee_per_input, inputs));
}

fee_estimator::fee_estimator(const fee_oracle& oracle,
    const transaction_builder& builder)
  : oracle_(oracle), builder_(builder)
{
}

fee_params fee_estimator::estimate(const network_id& network,
    const protocol_parameters& params,
    const transaction_metadata& metadata, slot_number ttl) const
{
    std::ostream null_stream(nullptr);
    return estimate(network, params, metadata, ttl, null_stream);
}

fee_params fee_estimator::estimate(const network_id& network,
    const protocol_parameters& params,
    const transaction_metadata& metadata, slot_number ttl,
    std::ostream& stream) const
{
    const auto address = mock_address(network);
    stream << "Probing fees on " << network.to_string()
        << " with mock address " << encode_address(address) << std::endl;

    const auto fee_base = estimate_transaction_fee(network, params,
        ttl, {}, address, 0, metadata);
    stream << "fee with no inputs: " << fee_base << std::endl;

    const auto fee_with_input = estimate_transaction_fee(network, params,
        ttl, { mock_input_reference() }, address, 0, metadata);
    stream << "fee with one input: " << fee_with_input << std::endl;

    if (fee_with_input < fee_base)
        throw oracle_failure("fee decreased from " +
            std::to_string(fee_base) + " to " +
            std::to_string(fee_with_input) + " when adding an input");

    return { fee_base, fee_with_input - fee_base };
}

money fee_estimator::estimate_transaction_fee(const network_id& network,
    const protocol_parameters& params, slot_number ttl,
    const input_reference_list& inputs, const shelley_address& address,
    money value, const transaction_metadata& metadata) const
{
    const transaction_output_list outputs{ { address, value } };

    // An empty payload is left out, as the real transaction will be.
    transaction_extra_content extra;
    if (!metadata.empty())
        extra.metadata = metadata;

    const auto body = builder_.make_transaction(extra, ttl, 0,
        inputs, outputs);
    return price_transaction(network, params, body);
}

money fee_estimator::price_transaction(const network_id& network,
    const protocol_parameters& params, const transaction_body& body) const
{
    const auto tx = builder_.make_signed_transaction({}, body);
    return oracle_.estimate_fee(network, params.min_fee_a, params.min_fee_b,
        tx, body.inputs.size(), body.outputs.size(), 1, 0);
}

boost::optional<transaction_body> fee_estimator::balance_transaction(
    const network_id& network, const protocol_parameters& params,
    const transaction_extra_content& extra, slot_number ttl,
    const input_reference_list& inputs, const shelley_address& address,
    money total, money fee) const
{
    // The fee only rises and is bounded by total, so this terminates.
    while (fee <= total)
    {
        const transaction_output_list outputs{ { address, total - fee } };
        auto body = builder_.make_transaction(extra, ttl, fee,
            inputs, outputs);
        const auto needed = price_transaction(network, params, body);
        if (needed <= fee)
            return body;
        fee = needed;
    }
    return boost::none;
}

fee_params estimate_fee_params(const network_id& network,
    const protocol_parameters& params, const transaction_metadata& metadata,
    slot_number ttl)
{
    const linear_fee_oracle oracle(params.max_tx_size);
    standard_transaction_builder builder;
    return fee_estimator(oracle, builder).estimate(network, params, metadata,
        ttl);
}

} // namespace votefee

