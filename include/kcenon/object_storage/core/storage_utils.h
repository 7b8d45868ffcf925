/**
 * @file storage_utils.h
 * @brief Encoding, hashing, time and XML helpers shared by the signer and client
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_CORE_STORAGE_UTILS_H
#define KCENON_OBJECT_STORAGE_CORE_STORAGE_UTILS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_storage::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hexadecimal string
 */
auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(std::span<const uint8_t> data) -> std::string;

/**
 * @brief URI-encode a value per RFC 3986 (SigV4 rules)
 * @param value Raw value
 * @param encode_slash Encode '/' as %2F (query values) or keep it (paths)
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Trim surrounding double quotes from an ETag
 */
auto strip_quotes(std::string_view value) -> std::string;

/**
 * @brief Lowercase ASCII copy
 */
auto to_lower(std::string_view value) -> std::string;

/**
 * @brief Trim leading/trailing whitespace and collapse inner runs to one space
 */
auto trim_header_value(std::string_view value) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(std::span<const uint8_t> data) -> std::vector<uint8_t>;

auto sha256_hex(std::string_view data) -> std::string;

auto sha256_hex(std::span<const uint8_t> data) -> std::string;

auto hmac_sha256(std::span<const uint8_t> key, std::string_view data)
    -> std::vector<uint8_t>;

/**
 * @brief Base64 MD5 digest, as used by the Content-MD5 header
 */
auto md5_base64(std::span<const uint8_t> data) -> std::string;

/**
 * @brief 64-bit FNV-1a hash, stable across runs and platforms
 */
auto fnv1a_64(std::string_view data) -> uint64_t;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format as SigV4 timestamp (yyyyMMddTHHmmssZ)
 */
auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Format as SigV4 date stamp (yyyyMMdd)
 */
auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract the text of the first <tag> element
 */
auto extract_xml_element(std::string_view xml, std::string_view tag)
    -> std::optional<std::string>;

/**
 * @brief Extract the inner text of every <tag> element, in document order
 */
auto extract_xml_elements(std::string_view xml, std::string_view tag)
    -> std::vector<std::string>;

/**
 * @brief Decode the five predefined XML entities
 */
auto xml_unescape(std::string_view text) -> std::string;

/**
 * @brief Escape text for inclusion in an XML element
 */
auto xml_escape(std::string_view text) -> std::string;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Guess a content type from the key's extension
 */
auto detect_content_type(std::string_view key) -> std::string;

}  // namespace kcenon::object_storage::storage_utils

#endif  // KCENON_OBJECT_STORAGE_CORE_STORAGE_UTILS_H
