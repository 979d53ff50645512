#include <gtest/gtest.h>
#include "manifest/manifest_parser.h"
#include "security/config_validator.h"
#include "security/security_errors.h"
#include <cstdint>
#include <limits>

using namespace plugsec;

namespace {

const char* FULL_MANIFEST = R"({
    "plugin": {
        "id": "amz-1",
        "name": "Amazon Orders",
        "version": "1.0.0",
        "description": "Imports order history exports",
        "fileTypes": ["csv", "xlsx"],
        "maxFileSize": 1000000,
        "features": ["order import"]
    },
    "endpoints": {
        "upload": "https://good.example/up",
        "status": "https://good.example/status"
    },
    "capabilities": {
        "fileUpload": true,
        "batchProcessing": false
    },
    "signature": {
        "value": "sha256:abc",
        "algorithm": "RSA-SHA256",
        "version": "v1",
        "timestamp": "2026-01-01T00:00:00.000Z"
    },
    "contentHash": "deadbeef",
    "source": "verified.plugins"
})";

} // anonymous namespace

TEST(ManifestParserTest, ParsesFullManifest) {
    PluginManifest manifest = ManifestParser::parseString(FULL_MANIFEST);

    EXPECT_EQ("amz-1", manifest.id);
    EXPECT_EQ("Amazon Orders", manifest.name);
    EXPECT_EQ("1.0.0", manifest.version);
    EXPECT_EQ("Imports order history exports", manifest.description);
    EXPECT_EQ((std::vector<std::string>{"csv", "xlsx"}), manifest.fileTypes);
    EXPECT_EQ(1000000, manifest.maxFileSize);
    EXPECT_EQ(std::vector<std::string>{"order import"}, manifest.features);

    EXPECT_EQ(2u, manifest.endpoints.size());
    EXPECT_EQ("https://good.example/up", manifest.uploadEndpoint());

    EXPECT_TRUE(manifest.capabilities.fileUpload());
    EXPECT_FALSE(manifest.capabilities.batchProcessing());
    EXPECT_EQ(1u, manifest.capabilities.enabledCount());

    ASSERT_TRUE(manifest.signature.has_value());
    EXPECT_EQ("sha256:abc", manifest.signature->value);
    EXPECT_EQ("RSA-SHA256", manifest.signature->algorithm);
    EXPECT_EQ("deadbeef", manifest.contentHash.value_or(""));
    EXPECT_EQ("verified.plugins", manifest.source.value_or(""));
    EXPECT_TRUE(manifest.rawJson.is_object());
}

TEST(ManifestParserTest, MissingFieldsAreLeftEmpty) {
    PluginManifest manifest = ManifestParser::parseString(R"({"plugin": {"name": "x"}})");

    EXPECT_TRUE(manifest.id.empty());
    EXPECT_TRUE(manifest.version.empty());
    EXPECT_TRUE(manifest.fileTypes.empty());
    EXPECT_TRUE(manifest.endpoints.empty());
    EXPECT_FALSE(manifest.signature.has_value());
    EXPECT_FALSE(manifest.contentHash.has_value());
    EXPECT_FALSE(manifest.source.has_value());
}

TEST(ManifestParserTest, WrongTypedIdIsNotCoerced) {
    PluginManifest manifest = ManifestParser::parseString(R"({"plugin": {"id": 42}})");
    EXPECT_TRUE(manifest.id.empty());
    EXPECT_TRUE(manifest.rawJson["plugin"]["id"].is_number());
}

TEST(ManifestParserTest, OutOfRangeFileSizeSaturates) {
    const std::int64_t maxValue = std::numeric_limits<std::int64_t>::max();

    EXPECT_EQ(maxValue, ManifestParser::parseString(R"({"plugin": {"maxFileSize": 1e30}})").maxFileSize);
    EXPECT_EQ(maxValue,
              ManifestParser::parseString(R"({"plugin": {"maxFileSize": 18446744073709551615}})").maxFileSize);
    EXPECT_EQ(std::numeric_limits<std::int64_t>::min(),
              ManifestParser::parseString(R"({"plugin": {"maxFileSize": -1e30}})").maxFileSize);
    EXPECT_EQ(2500000, ManifestParser::parseString(R"({"plugin": {"maxFileSize": 2.5e6}})").maxFileSize);
}

TEST(ManifestParserTest, HugeFileSizeIsReportedTooLarge) {
    PluginManifest manifest = ManifestParser::parseString(R"({
        "plugin": {"id": "amz-1", "name": "Amazon Orders", "version": "1.0.0",
                   "fileTypes": ["csv"], "maxFileSize": 1e30},
        "endpoints": {"upload": "https://good.example/up"}
    })");

    security::ValidationResult result = security::ConfigValidator().validate(manifest);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(1u, result.errors.size());
    EXPECT_EQ("Plugin file size limit too large (max 10MB)", result.errors[0]);
}

TEST(ManifestParserTest, LegacyUploadEndpoint) {
    PluginManifest manifest = ManifestParser::parseString(
        R"({"plugin": {"id": "p", "uploadEndpoint": "https://legacy.example/up"}})");
    EXPECT_EQ("https://legacy.example/up", manifest.uploadEndpoint());
}

TEST(ManifestParserTest, UnknownCapabilitiesAreRecorded) {
    PluginManifest manifest = ManifestParser::parseString(
        R"({"capabilities": {"fileUpload": true, "rootAccess": true, "dataValidation": "yes"}})");

    EXPECT_EQ(std::vector<std::string>{"rootAccess"}, manifest.capabilities.unknownNames());
    EXPECT_FALSE(manifest.capabilities.dataValidation());
    EXPECT_EQ(3u, manifest.capabilities.declared().size());
}

TEST(ManifestParserTest, InvalidJsonThrows) {
    EXPECT_THROW(ManifestParser::parseString("{ not json"), security::ManifestParseError);
}

TEST(ManifestParserTest, NonObjectThrows) {
    EXPECT_THROW(ManifestParser::parseString("[1, 2, 3]"), security::ManifestParseError);
}

TEST(ManifestParserTest, MissingFileThrows) {
    EXPECT_THROW(ManifestParser::parseFile("/nonexistent/manifest.json"), security::ManifestParseError);
}

TEST(ManifestParserTest, ToJsonRoundTripsLayout) {
    PluginManifest manifest = ManifestParser::parseString(FULL_MANIFEST);
    nlohmann::json json = manifest.toJson();

    EXPECT_EQ("amz-1", json["plugin"]["id"]);
    EXPECT_EQ("https://good.example/up", json["endpoints"]["upload"]);
    EXPECT_EQ(true, json["capabilities"]["fileUpload"]);
    EXPECT_EQ("verified.plugins", json["source"]);

    PluginManifest reparsed = ManifestParser::parse(json);
    EXPECT_EQ(manifest.id, reparsed.id);
    EXPECT_EQ(manifest.endpoints, reparsed.endpoints);
    EXPECT_EQ(manifest.capabilities.declared(), reparsed.capabilities.declared());
}
