#include <votefee/metadata.hpp>

#include <gtest/gtest.h>
#include <votefee/error.hpp>

using json = nlohmann::json;

TEST(metadata, parses_no_schema_json)
{
    const auto document = json::parse(R"({
        "61284": {
            "1": "0x0036ef3e1f0d3f5989e2d155ea54bdb2a72c4c456ccb959af4c94868f473f5a0",
            "2": "0xe3cd2404c84de65f96918f18d5b445bcb933a7cda18eeded7945dd191e432369",
            "3": [1, 2, "three"]
        },
        "61285": { "1": "0xab" }
    })");

    const auto metadata = votefee::metadata_from_json(document);
    ASSERT_EQ(2u, metadata.size());
    ASSERT_EQ(1u, metadata.count(61284));
    ASSERT_EQ(1u, metadata.count(61285));

    const auto& registration = metadata.at(61284);
    ASSERT_TRUE(registration["1"].is_binary());
    EXPECT_EQ(32u, registration["1"].get_binary().size());
    EXPECT_EQ(0x00, registration["1"].get_binary()[0]);
    EXPECT_EQ(0x36, registration["1"].get_binary()[1]);
    ASSERT_TRUE(registration["3"].is_array());
    EXPECT_EQ(3u, registration["3"].size());
    EXPECT_TRUE(registration["3"][2].is_string());

    const auto& signature = metadata.at(61285)["1"];
    ASSERT_TRUE(signature.is_binary());
    ASSERT_EQ(1u, signature.get_binary().size());
    EXPECT_EQ(0xab, signature.get_binary()[0]);
}

TEST(metadata, rejects_bad_labels)
{
    EXPECT_THROW(votefee::metadata_from_json(json::parse(R"({"vote": 1})")),
        votefee::config_error);
    EXPECT_THROW(votefee::metadata_from_json(json::parse(R"({"-1": 1})")),
        votefee::config_error);
    EXPECT_THROW(votefee::metadata_from_json(
        json::parse(R"({"99999999999999999999": 1})")), votefee::config_error);
    EXPECT_THROW(votefee::metadata_from_json(json::parse("[1, 2]")),
        votefee::config_error);
}

TEST(metadata, rejects_bad_values)
{
    EXPECT_THROW(votefee::metadata_from_json(json::parse(R"({"1": 1.5})")),
        votefee::config_error);
    EXPECT_THROW(votefee::metadata_from_json(json::parse(R"({"1": true})")),
        votefee::config_error);
    EXPECT_THROW(votefee::metadata_from_json(json::parse(R"({"1": "0xzz"})")),
        votefee::config_error);

    json long_text = { {"1", std::string(65, 'a')} };
    EXPECT_THROW(votefee::metadata_from_json(long_text), votefee::config_error);
}

TEST(metadata, text_limit_is_inclusive)
{
    const auto limit = votefee::metadata_text_limit;
    json text = { {"1", std::string(limit, 'a')} };
    EXPECT_EQ(1u, votefee::metadata_from_json(text).size());

    json bytes = { {"1", "0x" + std::string(2 * limit, 'a')} };
    EXPECT_EQ(1u, votefee::metadata_from_json(bytes).size());

    json long_bytes = { {"1", "0x" + std::string(2 * limit + 2, 'a')} };
    try
    {
        votefee::metadata_from_json(long_bytes);
        FAIL() << "expected config_error";
    }
    catch (const votefee::config_error& error)
    {
        const std::string message = error.what();
        EXPECT_NE(std::string::npos,
            message.find("exceed " + std::to_string(limit)));
    }
}

TEST(metadata, empty_object)
{
    EXPECT_TRUE(votefee::metadata_from_json(json::object()).empty());
}

TEST(metadata, hash_tracks_content)
{
    const votefee::transaction_metadata first{ { 1, "a" } };
    const votefee::transaction_metadata second{ { 1, "b" } };
    EXPECT_EQ(votefee::metadata_hash(first), votefee::metadata_hash(first));
    EXPECT_NE(votefee::metadata_hash(first), votefee::metadata_hash(second));
    EXPECT_LT(votefee::serialize(first).size(),
        votefee::serialize(votefee::transaction_metadata{ { 1, "abc" } }).size());
}

TEST(metadata, json_form_uses_decimal_labels)
{
    const votefee::transaction_metadata metadata{ { 61284, 7 } };
    const auto document = votefee::metadata_to_json(metadata);
    ASSERT_TRUE(document.contains("61284"));
    EXPECT_EQ(7, document["61284"].get<int>());
}

