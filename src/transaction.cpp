#include <votefee/transaction.hpp>

namespace votefee {

bool operator==(const input_reference& left, const input_reference& right)
{
    return left.tx_id == right.tx_id && left.index == right.index;
}
bool operator!=(const input_reference& left, const input_reference& right)
{
    return !(left == right);
}

std::string encode_input_reference(const input_reference& reference)
{
    return bcs::encode_base16(reference.tx_id) + "#" +
        std::to_string(reference.index);
}

bcs::data_chunk to_bytes(const shelley_address& address)
{
    // Type 0 (key hash, key hash) in the high nibble.
    const uint8_t header = address.network.address_tag();
    return bcs::build_chunk({
        bcs::to_chunk(header),
        address.payment,
        address.stake
    });
}

std::string encode_address(const shelley_address& address)
{
    return bcs::encode_base16(to_bytes(address));
}

boost::optional<shelley_address> decode_address(
    const std::string& encoded, const network_id& network)
{
    bcs::data_chunk bytes;
    if (!bcs::decode_base16(bytes, encoded))
        return boost::none;
    if (bytes.size() != shelley_address_size)
        return boost::none;
    if (bytes[0] != network.address_tag())
        return boost::none;

    shelley_address address{ network, {}, {} };
    auto payment_begin = bytes.begin() + 1;
    auto stake_begin = payment_begin + bcs::short_hash_size;
    std::copy(payment_begin, stake_begin, address.payment.begin());
    std::copy(stake_begin, bytes.end(), address.stake.begin());
    return address;
}

json body_to_json(const transaction_body& body)
{
    json inputs = json::array();
    for (const auto& input: body.inputs)
        inputs.push_back(json::array({
            json::binary(bcs::to_chunk(input.tx_id)), input.index }));

    json outputs = json::array();
    for (const auto& output: body.outputs)
        outputs.push_back(json::array({
            json::binary(to_bytes(output.address)), output.value }));

    json result = {
        {"0", inputs},
        {"1", outputs},
        {"2", body.fee},
        {"3", body.ttl}
    };

    const auto& extra = body.extra;
    if (!extra.certificates.empty())
    {
        json certificates = json::array();
        for (const auto& certificate: extra.certificates)
            certificates.push_back(json::binary(certificate));
        result["4"] = certificates;
    }
    if (!extra.withdrawals.empty())
    {
        json withdrawals = json::object();
        for (const auto& entry: extra.withdrawals)
            withdrawals[bcs::encode_base16(entry.stake_address)] = entry.amount;
        result["5"] = withdrawals;
    }
    if (extra.update_proposal)
        result["6"] = json::binary(*extra.update_proposal);
    if (extra.metadata)
        result["7"] = json::binary(bcs::to_chunk(
            metadata_hash(*extra.metadata)));
    return result;
}

json transaction_to_json(const transaction& tx)
{
    json witness_set = json::object();
    if (!tx.witnesses.empty())
    {
        json keys = json::array();
        for (const auto& witness: tx.witnesses)
            keys.push_back(json::array({
                json::binary(bcs::to_chunk(witness.key)),
                json::binary(bcs::to_chunk(witness.signature)) }));
        witness_set["0"] = keys;
    }

    json metadata = nullptr;
    if (tx.body.extra.metadata)
        metadata = metadata_to_json(*tx.body.extra.metadata);

    return json::array({ body_to_json(tx.body), witness_set, metadata });
}

bcs::data_chunk serialize(const transaction_body& body)
{
    return json::to_cbor(body_to_json(body));
}
bcs::data_chunk serialize(const transaction& tx)
{
    return json::to_cbor(transaction_to_json(tx));
}

transaction_body standard_transaction_builder::make_transaction(
    const transaction_extra_content& extra, slot_number ttl, money fee,
    const input_reference_list& inputs,
    const transaction_output_list& outputs) const
{
    return { inputs, outputs, fee, ttl, extra };
}

transaction standard_transaction_builder::make_signed_transaction(
    const key_witness_list& witnesses, const transaction_body& body) const
{
    return { body, witnesses };
}

} // namespace votefee

