#include <bitcoin/system.hpp>

#include <iostream>
#include <boost/optional.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <votefee/config.hpp>
#include <votefee/error.hpp>
#include <votefee/fee.hpp>
#include <votefee/fee_oracle.hpp>
#include <votefee/transaction.hpp>
#include <votefee/unspent.hpp>

namespace bcs = bc::system;
using json = nlohmann::json;

constexpr votefee::slot_number default_ttl = 5000;

struct options_result
{
    votefee::network_id network;
    std::string protocol_params_path;
    std::string utxos_path;
    boost::optional<std::string> metadata_path;
    boost::optional<std::string> payment_address;
    boost::optional<std::string> out_file;
    votefee::slot_number ttl;
    bool verbose;
};

void show_error(const std::string& message)
{
    std::cerr << "Error: " << message << std::endl;
}

boost::optional<options_result> read_options(
    const cxxopts::ParseResult& result)
{
    const bool mainnet = result.count("mainnet") > 0;
    const bool testnet = result.count("testnet-magic") > 0;
    if (mainnet == testnet)
    {
        show_error("specify exactly one of --mainnet or --testnet-magic");
        return boost::none;
    }
    if (!result.count("protocol-params"))
    {
        show_error("--protocol-params is required");
        return boost::none;
    }
    if (!result.count("utxos"))
    {
        show_error("--utxos is required");
        return boost::none;
    }
    if (result.count("out-file") && !result.count("payment-address"))
    {
        show_error("--out-file requires --payment-address");
        return boost::none;
    }

    options_result options{
        mainnet ? votefee::network_id::mainnet() :
            votefee::network_id::testnet(
                result["testnet-magic"].as<votefee::network_magic>()),
        result["protocol-params"].as<std::string>(),
        result["utxos"].as<std::string>(),
        boost::none,
        boost::none,
        boost::none,
        result["time-to-live"].as<votefee::slot_number>(),
        result.count("verbose") > 0
    };
    if (result.count("metadata"))
        options.metadata_path = result["metadata"].as<std::string>();
    if (result.count("payment-address"))
        options.payment_address =
            result["payment-address"].as<std::string>();
    if (result.count("out-file"))
        options.out_file = result["out-file"].as<std::string>();
    return options;
}

// Unsigned body returning everything but the fee to the payment address,
// priced as written. None when the selected funds cannot cover that fee.
boost::optional<votefee::transaction_body> balance_transaction_body(
    const options_result& options, const votefee::fee_estimator& estimator,
    const votefee::protocol_parameters& params,
    const votefee::transaction_metadata& metadata,
    const votefee::unspent_source_list& selected, votefee::money fee)
{
    const auto address = votefee::decode_address(
        *options.payment_address, options.network);
    if (!address)
        throw votefee::config_error("invalid payment address for " +
            options.network.to_string() + ": " + *options.payment_address);

    votefee::transaction_extra_content extra;
    if (!metadata.empty())
        extra.metadata = metadata;

    return estimator.balance_transaction(options.network, params, extra,
        options.ttl, votefee::unspent_references(selected), *address,
        votefee::unspent_value(selected), fee);
}

void write_transaction_body(const std::string& filename,
    const votefee::transaction_body& body)
{
    const json envelope = {
        {"type", "TxBodyShelley"},
        {"description", ""},
        {"cborHex", bcs::encode_base16(votefee::serialize(body))}
    };
    votefee::write_json_file(filename, envelope);
}

int run(const options_result& options, std::ostream& stream)
{
    const auto params =
        votefee::load_protocol_parameters(options.protocol_params_path);

    votefee::transaction_metadata metadata;
    if (options.metadata_path)
        metadata = votefee::load_metadata(*options.metadata_path);

    const votefee::linear_fee_oracle oracle(params.max_tx_size);
    votefee::standard_transaction_builder builder;
    const votefee::fee_estimator estimator(oracle, builder);

    const auto fee_params = estimator.estimate(options.network, params,
        metadata, options.ttl, stream);
    stream << "fee_base: " << fee_params.fee_base
        << " fee_per_input: " << fee_params.fee_per_input << std::endl;

    const auto sources = votefee::load_unspent_sources(options.utxos_path);
    stream << "Loaded " << sources.size() << " unspent sources" << std::endl;

    const auto selection = votefee::take_until_fee_paid(fee_params, sources);
    const auto& selected = selection.sources;
    auto fee = votefee::required_fee(fee_params, selected.size());
    const auto total = votefee::unspent_value(selected);
    for (const auto& source: selected)
        stream << "selected " << votefee::encode_input_reference(
            source.reference) << " " << source.amount << std::endl;

    switch (selection.status)
    {
        case votefee::selection_status::empty:
            show_error("no unspent sources available to pay the fee");
            return -1;
        case votefee::selection_status::insufficient:
            show_error("insufficient funds: " +
                votefee::format_money(total) + " available, " +
                votefee::format_money(fee) + " required");
            return -1;
        case votefee::selection_status::funded:
            break;
    }

    boost::optional<votefee::transaction_body> body;
    if (options.out_file)
    {
        body = balance_transaction_body(options, estimator, params, metadata,
            selected, fee);
        if (!body)
        {
            show_error("insufficient funds: " + votefee::format_money(total) +
                " available, not enough for the fee of the written body");
            return -1;
        }
        if (body->fee != fee)
            stream << "fee raised from " << fee << " to " << body->fee
                << " for the written body" << std::endl;
        fee = body->fee;
    }

    const auto change = votefee::checked_subtract(total, fee);
    const json report = {
        {"network", options.network.to_string()},
        {"fee_base", fee_params.fee_base},
        {"fee_per_input", fee_params.fee_per_input},
        {"fee", fee},
        {"total", total},
        {"change", change},
        {"selected", votefee::unspent_sources_to_json(selected)}
    };
    std::cout << report.dump(4) << std::endl;

    if (body)
    {
        write_transaction_body(*options.out_file, *body);
        stream << "Wrote transaction body to " << *options.out_file
            << std::endl;
    }
    return 0;
}

int main(int argc, char** argv)
{
    cxxopts::Options options("votefee",
        "estimate vote transaction fees and select inputs to cover them");
    options.add_options()
        ("h,help", "Show program help")
        ("mainnet", "Use the mainnet")
        ("testnet-magic", "Use a testnet with this network magic",
            cxxopts::value<votefee::network_magic>())
        ("p,protocol-params", "Protocol parameters JSON file",
            cxxopts::value<std::string>())
        ("u,utxos", "Ordered unspent sources JSON file",
            cxxopts::value<std::string>())
        ("m,metadata", "Transaction metadata JSON file (no schema)",
            cxxopts::value<std::string>())
        ("payment-address", "Hex encoded address receiving the change",
            cxxopts::value<std::string>())
        ("time-to-live", "Absolute slot at which the transaction times out "
            "(not an offset from the current tip)",
            cxxopts::value<votefee::slot_number>()->default_value(
                std::to_string(default_ttl)))
        ("o,out-file", "Write the unsigned transaction body here",
            cxxopts::value<std::string>())
        ("v,verbose", "Log progress to stderr")
    ;

    try
    {
        auto result = options.parse(argc, argv);
        if (result.count("help"))
        {
            std::cout << options.help() << std::endl;
            return 1;
        }

        const auto parsed = read_options(result);
        if (!parsed)
            return -1;

        std::ostream null_stream(nullptr);
        std::ostream& stream = parsed->verbose ? std::cerr : null_stream;
        return run(*parsed, stream);
    }
    catch (const cxxopts::OptionException& error)
    {
        show_error(error.what());
    }
    catch (const votefee::config_error& error)
    {
        show_error(error.what());
    }
    catch (const votefee::oracle_failure& error)
    {
        show_error(std::string("fee oracle: ") + error.what());
    }
    catch (const votefee::arithmetic_error& error)
    {
        show_error(error.what());
    }
    return -1;
}

