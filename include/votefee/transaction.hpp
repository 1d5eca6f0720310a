#ifndef VOTEFEE_TRANSACTION_HPP
#define VOTEFEE_TRANSACTION_HPP

#include <bitcoin/system.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <votefee/metadata.hpp>
#include <votefee/money.hpp>
#include <votefee/network.hpp>

namespace votefee {

namespace bcs = bc::system;
using json = nlohmann::json;

typedef uint64_t slot_number;

struct input_reference
{
    bcs::hash_digest tx_id;
    uint32_t index;
};

bool operator==(const input_reference& left, const input_reference& right);
bool operator!=(const input_reference& left, const input_reference& right);

typedef std::vector<input_reference> input_reference_list;

std::string encode_input_reference(const input_reference& reference);

// Base address: header, payment key hash, stake key hash.
struct shelley_address
{
    network_id network;
    bcs::short_hash payment;
    bcs::short_hash stake;
};

constexpr size_t shelley_address_size = 1 + 2 * bcs::short_hash_size;

bcs::data_chunk to_bytes(const shelley_address& address);
std::string encode_address(const shelley_address& address);

// The network magic is not carried by the address, so the caller
// supplies the network it expects. Returns none on any mismatch.
boost::optional<shelley_address> decode_address(
    const std::string& encoded, const network_id& network);

struct transaction_output
{
    shelley_address address;
    money value;
};

typedef std::vector<transaction_output> transaction_output_list;

struct withdrawal
{
    bcs::data_chunk stake_address;
    money amount;
};

typedef std::vector<withdrawal> withdrawal_list;

// Certificates and update proposals are carried pre-encoded.
typedef std::vector<bcs::data_chunk> certificate_list;

struct transaction_extra_content
{
    certificate_list certificates;
    withdrawal_list withdrawals;
    boost::optional<transaction_metadata> metadata;
    boost::optional<bcs::data_chunk> update_proposal;
};

struct transaction_body
{
    input_reference_list inputs;
    transaction_output_list outputs;
    money fee;
    slot_number ttl;
    transaction_extra_content extra;
};

struct key_witness
{
    bcs::ec_compressed key;
    bcs::ec_signature signature;
};

typedef std::vector<key_witness> key_witness_list;

struct transaction
{
    transaction_body body;
    key_witness_list witnesses;
};

json body_to_json(const transaction_body& body);
json transaction_to_json(const transaction& tx);

// CBOR encodings.
bcs::data_chunk serialize(const transaction_body& body);
bcs::data_chunk serialize(const transaction& tx);

class transaction_builder
{
public:
    virtual ~transaction_builder() {}

    virtual transaction_body make_transaction(
        const transaction_extra_content& extra, slot_number ttl, money fee,
        const input_reference_list& inputs,
        const transaction_output_list& outputs) const = 0;

    virtual transaction make_signed_transaction(
        const key_witness_list& witnesses,
        const transaction_body& body) const = 0;
};

class standard_transaction_builder
  : public transaction_builder
{
public:
    transaction_body make_transaction(
        const transaction_extra_content& extra, slot_number ttl, money fee,
        const input_reference_list& inputs,
        const transaction_output_list& outputs) const override;

    transaction make_signed_transaction(
        const key_witness_list& witnesses,
        const transaction_body& body) const override;
};

} // namespace votefee

#endif

