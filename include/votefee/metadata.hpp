#ifndef VOTEFEE_METADATA_HPP
#define VOTEFEE_METADATA_HPP

#include <map>
#include <bitcoin/system.hpp>
#include <nlohmann/json.hpp>

namespace votefee {

namespace bcs = bc::system;
using json = nlohmann::json;

// Label -> value. Values are integers, text, byte strings (json::binary),
// lists or maps.
typedef std::map<uint64_t, json> transaction_metadata;

constexpr size_t metadata_text_limit = 64;

// Parses the cardano-cli "no-schema" JSON form. Throws config_error.
transaction_metadata metadata_from_json(const json& document);

json metadata_to_json(const transaction_metadata& metadata);

bcs::data_chunk serialize(const transaction_metadata& metadata);
bcs::hash_digest metadata_hash(const transaction_metadata& metadata);

} // namespace votefee

#endif

