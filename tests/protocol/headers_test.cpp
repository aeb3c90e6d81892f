#include "tus/protocol/headers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace tus;
using namespace tus::protocol;

TEST(Metadata, EncodesKeyAndBase64Value) {
    auto encoded = encode_metadata({{"filename", "world_domination_plan.pdf"}, {"is_confidential", ""}});
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value(), "filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential");
}

TEST(Metadata, DecodeInvertsEncode) {
    const MetadataPairs pairs = {{"filename", "report.csv"}, {"owner", "ops team"}, {"flag", ""}};
    auto encoded = encode_metadata(pairs);
    ASSERT_TRUE(encoded.is_ok());

    auto decoded = decode_metadata(encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, pairs);
}

TEST(Metadata, DecodeInvertsEncodeForArbitraryBytes) {
    std::string all_bytes;
    for (int b = 0; b < 256; ++b) {
        all_bytes.push_back(static_cast<char>(b));
    }
    const MetadataPairs pairs = {
        {"csv", "a,b,,c"},
        {"spaced", "  leading and trailing  "},
        {"colon", "key:value:more"},
        {"nul", std::string("before\0after", 12)},
        {"high", "\x80\xff\xc3\xa9t\xc3\xa9"},
        {"all", all_bytes},
    };
    auto encoded = encode_metadata(pairs);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(std::count(encoded.value().begin(), encoded.value().end(), ','), 5);

    auto decoded = decode_metadata(encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, pairs);
}

TEST(Metadata, EmptyListEncodesToEmptyString) {
    auto encoded = encode_metadata({});
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value(), "");
    EXPECT_TRUE(decode_metadata("").value_or(MetadataPairs{{"x", "y"}}).empty());
}

TEST(Metadata, RejectsInvalidKeys) {
    const std::vector<std::string> keys = {"", "two words", "a,b", "a:b", "tab\tkey"};
    for (const auto& key : keys) {
        auto encoded = encode_metadata({{key, "value"}});
        ASSERT_TRUE(encoded.is_error()) << "key: " << key;
        EXPECT_EQ(encoded.error().kind, ErrorKind::InvalidHeaderValue);
    }
}

TEST(Metadata, DecodeToleratesWhitespaceAroundEntries) {
    auto decoded = decode_metadata("filename Zm9v , flag");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 2u);
    EXPECT_EQ((*decoded)[0], std::make_pair(std::string("filename"), std::string("foo")));
    EXPECT_EQ((*decoded)[1], std::make_pair(std::string("flag"), std::string()));
}

TEST(Metadata, DecodeRejectsInvalidBase64) {
    EXPECT_FALSE(decode_metadata("filename ***").has_value());
}

TEST(HeaderDecode, StrictRequiresPresence) {
    network::HeaderMap headers;
    auto offset = require_unsigned(headers, HeaderField::UploadOffset);
    ASSERT_TRUE(offset.is_error());
    EXPECT_EQ(offset.error().kind, ErrorKind::MissingHeader);
    EXPECT_EQ(offset.error().header.value_or(""), "Upload-Offset");

    auto location = require_header(headers, HeaderField::Location);
    ASSERT_TRUE(location.is_error());
    EXPECT_EQ(location.error().header.value_or(""), "Location");
}

TEST(HeaderDecode, StrictRejectsUnparsableNumber) {
    network::HeaderMap headers{{"Upload-Offset", "12abc"}};
    auto offset = require_unsigned(headers, HeaderField::UploadOffset);
    ASSERT_TRUE(offset.is_error());
    EXPECT_EQ(offset.error().kind, ErrorKind::MissingHeader);
}

TEST(HeaderDecode, NamesAreCaseInsensitive) {
    network::HeaderMap headers{{"upload-offset", "64"}};
    auto offset = require_unsigned(headers, HeaderField::UploadOffset);
    ASSERT_TRUE(offset.is_ok());
    EXPECT_EQ(offset.value(), 64u);
}

TEST(HeaderDecode, LenientYieldsNothingInsteadOfError) {
    network::HeaderMap headers{{"Tus-Max-Size", "huge"}};
    EXPECT_FALSE(find_unsigned(headers, HeaderField::TusMaxSize).has_value());
    EXPECT_FALSE(find_unsigned(headers, HeaderField::UploadOffset).has_value());
}

TEST(HeaderDecode, ListsAreSplitAndTrimmed) {
    network::HeaderMap headers{{"Tus-Extension", "creation, termination ,,checksum"}};
    auto list = find_list(headers, HeaderField::TusExtension);
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(*list, (std::vector<std::string>{"creation", "termination", "checksum"}));
}

TEST(HeaderDecode, ParseUnsignedGuardsOverflow) {
    EXPECT_EQ(parse_unsigned("18446744073709551615").value_or(0), 18446744073709551615ull);
    EXPECT_FALSE(parse_unsigned("18446744073709551616").has_value());
    EXPECT_FALSE(parse_unsigned("-1").has_value());
    EXPECT_FALSE(parse_unsigned("").has_value());
}

TEST(HeaderDecode, TypedHeadersCollectEveryField) {
    network::HeaderMap headers{
        {"Upload-Offset", "10"},
        {"Upload-Length", "100"},
        {"Tus-Resumable", "1.0.0"},
        {"Tus-Version", "1.0.0,0.2.2"},
        {"Upload-Metadata", "filename Zm9v"},
        {"Location", "http://example.com/files/1"},
    };
    const TypedHeaders typed = decode_headers(headers);
    EXPECT_EQ(typed.offset.value_or(0), 10u);
    EXPECT_EQ(typed.upload_length.value_or(0), 100u);
    EXPECT_EQ(typed.resumable.value_or(""), "1.0.0");
    EXPECT_EQ(typed.location.value_or(""), "http://example.com/files/1");
    ASSERT_TRUE(typed.supported_versions.has_value());
    EXPECT_EQ(typed.supported_versions->size(), 2u);
    ASSERT_TRUE(typed.upload_metadata.has_value());
    EXPECT_EQ(typed.upload_metadata->front().second, "foo");
    EXPECT_FALSE(typed.max_size.has_value());
    EXPECT_FALSE(typed.extensions.has_value());
}

TEST(HeaderField, WireNames) {
    EXPECT_STREQ(wire_name(HeaderField::TusResumable), "Tus-Resumable");
    EXPECT_STREQ(wire_name(HeaderField::UploadMetadata), "Upload-Metadata");
    EXPECT_STREQ(wire_name(HeaderField::MethodOverride), "X-HTTP-Method-Override");
}
