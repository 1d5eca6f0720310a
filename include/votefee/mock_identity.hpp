#ifndef VOTEFEE_MOCK_IDENTITY_HPP
#define VOTEFEE_MOCK_IDENTITY_HPP

#include <bitcoin/system.hpp>
#include <votefee/network.hpp>
#include <votefee/transaction.hpp>

namespace votefee {

namespace bcs = bc::system;

// Fixed identity used only to give sample transactions a realistic shape.
// These keys are public knowledge and must never sign anything.

constexpr size_t mock_seed_size = 32;
constexpr uint32_t mock_payment_role = 0;
constexpr uint32_t mock_stake_role = 2;
constexpr slot_number mock_ttl = 1;

bcs::data_chunk mock_seed();

bcs::ec_secret mock_payment_key();
bcs::ec_secret mock_stake_key();

bcs::short_hash key_hash(const bcs::ec_secret& secret);

shelley_address mock_address(const network_id& network);

// Well-formed but not spendable.
input_reference mock_input_reference();

} // namespace votefee

#endif

