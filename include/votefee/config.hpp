#ifndef VOTEFEE_CONFIG_HPP
#define VOTEFEE_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>
#include <votefee/fee_oracle.hpp>
#include <votefee/metadata.hpp>
#include <votefee/unspent.hpp>

namespace votefee {

using json = nlohmann::json;

// All loaders throw config_error.

json load_json_file(const std::string& filename);
void write_json_file(const std::string& filename, const json& document);

// Accepts txFeePerByte/txFeeFixed or minFeeA/minFeeB.
protocol_parameters protocol_parameters_from_json(const json& document);
protocol_parameters load_protocol_parameters(const std::string& filename);

transaction_metadata load_metadata(const std::string& filename);

// Array of {"tx_id": hex, "index": n, "amount": n}, order kept.
unspent_source_list unspent_sources_from_json(const json& document);
unspent_source_list load_unspent_sources(const std::string& filename);

json unspent_sources_to_json(const unspent_source_list& sources);

} // namespace votefee

#endif

