#include <votefee/config.hpp>

#include <limits>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <votefee/error.hpp>

namespace votefee {

namespace fs = boost::filesystem;

namespace {

money read_money(const json& document, const char* key)
{
    const auto value = document.find(key);
    if (value == document.end())
        throw config_error(std::string("missing field: ") + key);
    if (!value->is_number_unsigned())
        throw config_error(std::string("expected non-negative integer: ") +
            key + " = " + value->dump());
    return value->get<money>();
}

} // namespace

json load_json_file(const std::string& filename)
{
    const fs::path path(filename);
    boost::system::error_code ec;
    const bool regular = fs::is_regular_file(path, ec);
    if (ec)
        throw config_error("unable to access " + filename + ": " +
            ec.message());
    if (!regular)
        throw config_error("no such file: " + filename);

    fs::ifstream file(path);
    if (!file)
        throw config_error("unable to open: " + filename);
    try
    {
        return json::parse(file);
    }
    catch (const json::parse_error& error)
    {
        throw config_error("invalid JSON in " + filename + ": " +
            error.what());
    }
}

void write_json_file(const std::string& filename, const json& document)
{
    fs::ofstream file(fs::path(filename));
    if (!file)
        throw config_error("unable to write: " + filename);
    file << document.dump(4) << std::endl;
}

protocol_parameters protocol_parameters_from_json(const json& document)
{
    if (!document.is_object())
        throw config_error("protocol parameters must be a JSON object");

    protocol_parameters params;
    if (document.count("txFeePerByte") || document.count("txFeeFixed"))
    {
        params.min_fee_a = read_money(document, "txFeePerByte");
        params.min_fee_b = read_money(document, "txFeeFixed");
    }
    else
    {
        params.min_fee_a = read_money(document, "minFeeA");
        params.min_fee_b = read_money(document, "minFeeB");
    }
    if (document.count("maxTxSize"))
        params.max_tx_size = read_money(document, "maxTxSize");
    return params;
}

protocol_parameters load_protocol_parameters(const std::string& filename)
{
    return protocol_parameters_from_json(load_json_file(filename));
}

transaction_metadata load_metadata(const std::string& filename)
{
    return metadata_from_json(load_json_file(filename));
}

unspent_source_list unspent_sources_from_json(const json& document)
{
    if (!document.is_array())
        throw config_error("unspent sources must be a JSON array");

    unspent_source_list sources;
    for (const auto& entry: document)
    {
        if (!entry.is_object())
            throw config_error("invalid unspent source: " + entry.dump());

        const auto tx_id = entry.find("tx_id");
        if (tx_id == entry.end() || !tx_id->is_string())
            throw config_error("missing tx_id: " + entry.dump());

        unspent_source source;
        if (!bcs::decode_base16(source.reference.tx_id,
            tx_id->get<std::string>()))
            throw config_error("invalid tx_id: " + tx_id->dump());

        const auto index = read_money(entry, "index");
        if (index > std::numeric_limits<uint32_t>::max())
            throw config_error("index out of range: " + entry.dump());
        source.reference.index = static_cast<uint32_t>(index);
        source.amount = read_money(entry, "amount");
        sources.push_back(source);
    }
    return sources;
}

unspent_source_list load_unspent_sources(const std::string& filename)
{
    return unspent_sources_from_json(load_json_file(filename));
}

json unspent_sources_to_json(const unspent_source_list& sources)
{
    json result = json::array();
    for (const auto& source: sources)
    {
        result.push_back({
            {"tx_id", bcs::encode_base16(source.reference.tx_id)},
            {"index", source.reference.index},
            {"amount", source.amount}
        });
    }
    return result;
}

} // namespace votefee

