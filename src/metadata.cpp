#include <votefee/metadata.hpp>

#include <algorithm>
#include <stdexcept>
#include <votefee/error.hpp>

namespace votefee {

namespace {

bool is_label(const std::string& key)
{
    if (key.empty() || key.size() > 20)
        return false;
    return std::all_of(key.begin(), key.end(),
        [](char c) { return c >= '0' && c <= '9'; });
}

json metadata_value_from_json(const json& value)
{
    switch (value.type())
    {
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return value;
        case json::value_t::string:
        {
            const auto text = value.get<std::string>();
            if (text.compare(0, 2, "0x") == 0)
            {
                bcs::data_chunk bytes;
                if (!bcs::decode_base16(bytes, text.substr(2)))
                    throw config_error("invalid metadata bytes: " + text);
                if (bytes.size() > metadata_text_limit)
                    throw config_error("metadata bytes exceed " +
                        std::to_string(metadata_text_limit) + ": " + text);
                return json::binary(bytes);
            }
            if (text.size() > metadata_text_limit)
                throw config_error("metadata text exceeds " +
                    std::to_string(metadata_text_limit) + " bytes: " + text);
            return value;
        }
        case json::value_t::array:
        {
            json result = json::array();
            for (const auto& element: value)
                result.push_back(metadata_value_from_json(element));
            return result;
        }
        case json::value_t::object:
        {
            json result = json::object();
            for (const auto& item: value.items())
                result[item.key()] = metadata_value_from_json(item.value());
            return result;
        }
        default:
            throw config_error("unsupported metadata value: " + value.dump());
    }
}

} // namespace

transaction_metadata metadata_from_json(const json& document)
{
    if (!document.is_object())
        throw config_error("metadata must be a JSON object");

    transaction_metadata metadata;
    for (const auto& item: document.items())
    {
        if (!is_label(item.key()))
            throw config_error("invalid metadata label: " + item.key());
        uint64_t label;
        try
        {
            label = std::stoull(item.key());
        }
        catch (const std::out_of_range&)
        {
            throw config_error("metadata label out of range: " + item.key());
        }
        metadata[label] = metadata_value_from_json(item.value());
    }
    return metadata;
}

json metadata_to_json(const transaction_metadata& metadata)
{
    json result = json::object();
    for (const auto& entry: metadata)
        result[std::to_string(entry.first)] = entry.second;
    return result;
}

bcs::data_chunk serialize(const transaction_metadata& metadata)
{
    return json::to_cbor(metadata_to_json(metadata));
}

bcs::hash_digest metadata_hash(const transaction_metadata& metadata)
{
    return bcs::sha256_hash(serialize(metadata));
}

} // namespace votefee

