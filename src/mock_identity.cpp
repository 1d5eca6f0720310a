#include <votefee/mock_identity.hpp>

namespace votefee {

namespace {

bcs::ec_secret mock_key(uint32_t role)
{
    const bcs::wallet::hd_private root(mock_seed());
    return root.derive_private(role).secret();
}

} // namespace

bcs::data_chunk mock_seed()
{
    return bcs::data_chunk(mock_seed_size, 'x');
}

bcs::ec_secret mock_payment_key()
{
    return mock_key(mock_payment_role);
}
bcs::ec_secret mock_stake_key()
{
    return mock_key(mock_stake_role);
}

bcs::short_hash key_hash(const bcs::ec_secret& secret)
{
    const auto point = bcs::ec_scalar(secret) * bcs::ec_point::G;
    return bcs::bitcoin_short_hash(point.point());
}

shelley_address mock_address(const network_id& network)
{
    return {
        network,
        key_hash(mock_payment_key()),
        key_hash(mock_stake_key())
    };
}

input_reference mock_input_reference()
{
    // Hash of the CBOR encoding of unit (null).
    const auto unit = json::to_cbor(nullptr);
    return { bcs::sha256_hash(unit), 1 };
}

} // namespace votefee

