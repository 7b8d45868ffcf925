/**
 * @file test_storage_utils.cpp
 * @brief Unit tests for hashing, encoding and XML helpers
 */

#include <gtest/gtest.h>

#include <kcenon/object_storage/core/storage_utils.h>

#include <chrono>
#include <string>
#include <vector>

namespace kcenon::object_storage::test {

namespace utils = storage_utils;

namespace {

auto bytes(const std::string& text) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST(StorageUtilsTest, BytesToHex) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(utils::bytes_to_hex(data), "000fabff");
}

TEST(StorageUtilsTest, Base64Encode) {
    EXPECT_EQ(utils::base64_encode(bytes("")), "");
    EXPECT_EQ(utils::base64_encode(bytes("f")), "Zg==");
    EXPECT_EQ(utils::base64_encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(utils::base64_encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(StorageUtilsTest, UrlEncodeUnreservedCharactersPassThrough) {
    EXPECT_EQ(utils::url_encode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST(StorageUtilsTest, UrlEncodeSlashHandling) {
    EXPECT_EQ(utils::url_encode("a b/c", true), "a%20b%2Fc");
    EXPECT_EQ(utils::url_encode("a b/c", false), "a%20b/c");
    EXPECT_EQ(utils::url_encode("x=1&y=+"), "x%3D1%26y%3D%2B");
}

TEST(StorageUtilsTest, StripQuotes) {
    EXPECT_EQ(utils::strip_quotes("\"abc\""), "abc");
    EXPECT_EQ(utils::strip_quotes("abc"), "abc");
    EXPECT_EQ(utils::strip_quotes("\"\""), "");
}

TEST(StorageUtilsTest, TrimHeaderValueCollapsesWhitespace) {
    EXPECT_EQ(utils::trim_header_value("  a   b \t c  "), "a b c");
    EXPECT_EQ(utils::trim_header_value("value"), "value");
}

// ============================================================================
// Hashing
// ============================================================================

TEST(StorageUtilsTest, Sha256OfEmptyInput) {
    EXPECT_EQ(utils::sha256_hex(std::string_view{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(StorageUtilsTest, Sha256StringAndSpanAgree) {
    auto data = bytes("object storage");
    EXPECT_EQ(utils::sha256_hex(std::string_view("object storage")),
              utils::sha256_hex(std::span<const uint8_t>(data)));
}

TEST(StorageUtilsTest, HmacSha256Rfc4231Case2) {
    auto key = bytes("Jefe");
    auto mac = utils::hmac_sha256(key, "what do ya want for nothing?");
    EXPECT_EQ(utils::bytes_to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(StorageUtilsTest, Md5Base64) {
    EXPECT_EQ(utils::md5_base64(bytes("")), "1B2M2Y8AsgTpgAmY7PhCfg==");
    EXPECT_EQ(utils::md5_base64(bytes("hello world")), "XrY7u+Ae7tCTyyK7j1rNww==");
}

TEST(StorageUtilsTest, Fnv1aIsStable) {
    EXPECT_EQ(utils::fnv1a_64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(utils::fnv1a_64("abc"), utils::fnv1a_64("abc"));
    EXPECT_NE(utils::fnv1a_64("abc"), utils::fnv1a_64("abd"));
}

// ============================================================================
// Dates
// ============================================================================

TEST(StorageUtilsTest, AmzDateFormats) {
    // 2013-05-24T00:00:00Z
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1369353600));
    EXPECT_EQ(utils::format_amz_date(tp), "20130524T000000Z");
    EXPECT_EQ(utils::format_date_stamp(tp), "20130524");
}

// ============================================================================
// XML
// ============================================================================

TEST(StorageUtilsTest, ExtractXmlElementUnescapes) {
    const std::string xml = "<R><ETag>&quot;abc&quot;</ETag><Key>a&amp;b</Key></R>";
    EXPECT_EQ(utils::extract_xml_element(xml, "ETag").value_or(""), "\"abc\"");
    EXPECT_EQ(utils::extract_xml_element(xml, "Key").value_or(""), "a&b");
    EXPECT_FALSE(utils::extract_xml_element(xml, "Missing").has_value());
}

TEST(StorageUtilsTest, ExtractXmlElementsReturnsEveryBlock) {
    const std::string xml =
        "<L><Contents><Key>a</Key></Contents><Contents><Key>b</Key></Contents></L>";
    auto blocks = utils::extract_xml_elements(xml, "Contents");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "<Key>a</Key>");
    EXPECT_EQ(blocks[1], "<Key>b</Key>");
}

TEST(StorageUtilsTest, XmlEscapeRoundTrip) {
    const std::string text = "<a href=\"x\">&'</a>";
    auto escaped = utils::xml_escape(text);
    EXPECT_EQ(escaped.find('<'), std::string::npos);
    EXPECT_EQ(utils::xml_unescape(escaped), text);
}

TEST(StorageUtilsTest, DetectContentType) {
    EXPECT_EQ(utils::detect_content_type("report.JSON"), "application/json");
    EXPECT_EQ(utils::detect_content_type("dir/photo.jpg"), "image/jpeg");
    EXPECT_EQ(utils::detect_content_type("noextension"), "application/octet-stream");
    EXPECT_EQ(utils::detect_content_type("archive.unknown"), "application/octet-stream");
}

}  // namespace kcenon::object_storage::test
