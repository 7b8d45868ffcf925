/**
 * @file storage_utils.cpp
 * @brief Encoding, hashing, time and XML helpers
 * @version 0.1.0
 */

#include "kcenon/object_storage/core/storage_utils.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace kcenon::object_storage::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}  // namespace

auto base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto strip_quotes(std::string_view value) -> std::string {
    auto first = value.find_first_not_of('"');
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = value.find_last_not_of('"');
    return std::string(value.substr(first, last - first + 1));
}

auto to_lower(std::string_view value) -> std::string {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim_header_value(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(std::span<const uint8_t> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

auto sha256_hex(std::string_view data) -> std::string {
    return bytes_to_hex(sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size())));
}

auto sha256_hex(std::span<const uint8_t> data) -> std::string {
    return bytes_to_hex(sha256(data));
}

auto hmac_sha256(std::span<const uint8_t> key, std::string_view data)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto md5_base64(std::span<const uint8_t> data) -> std::string {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_md5(), nullptr);
    digest.resize(len);
    return base64_encode(digest);
}

auto fnv1a_64(std::string_view data) -> uint64_t {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {
auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}
}  // namespace

auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d");
    return oss.str();
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(std::string_view xml, std::string_view tag)
    -> std::optional<std::string> {
    std::string open_tag = "<" + std::string(tag) + ">";
    std::string close_tag = "</" + std::string(tag) + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string_view::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string_view::npos) {
        return std::nullopt;
    }

    return xml_unescape(xml.substr(start_pos, end_pos - start_pos));
}

auto extract_xml_elements(std::string_view xml, std::string_view tag)
    -> std::vector<std::string> {
    std::string open_tag = "<" + std::string(tag) + ">";
    std::string close_tag = "</" + std::string(tag) + ">";

    std::vector<std::string> elements;
    std::size_t pos = 0;
    while (true) {
        auto start_pos = xml.find(open_tag, pos);
        if (start_pos == std::string_view::npos) {
            break;
        }
        start_pos += open_tag.length();
        auto end_pos = xml.find(close_tag, start_pos);
        if (end_pos == std::string_view::npos) {
            break;
        }
        elements.emplace_back(xml.substr(start_pos, end_pos - start_pos));
        pos = end_pos + close_tag.length();
    }
    return elements;
}

auto xml_unescape(std::string_view text) -> std::string {
    static const std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '&') {
            bool replaced = false;
            for (const auto& [entity, ch] : entities) {
                if (text.substr(i, entity.size()) == entity) {
                    out += ch;
                    i += entity.size() - 1;
                    replaced = true;
                    break;
                }
            }
            if (replaced) continue;
        }
        out += text[i];
    }
    return out;
}

auto xml_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(std::string_view key) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
    };

    auto dot_pos = key.rfind('.');
    if (dot_pos == std::string_view::npos) {
        return "application/octet-stream";
    }

    auto it = mime_types.find(to_lower(key.substr(dot_pos)));
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

}  // namespace kcenon::object_storage::storage_utils
