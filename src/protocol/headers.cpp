#include "tus/protocol/headers.hpp"
#include "tus/protocol/base64.hpp"

#include <cctype>
#include <limits>

namespace tus::protocol {
namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        const auto end = value.find(delimiter, start);
        parts.push_back(value.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return parts;
}

bool is_valid_metadata_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (unsigned char c : key) {
        if (c == ' ' || c == kMetadataDelimiter || c == ':' || std::iscntrl(c) || c > 0x7e) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* wire_name(HeaderField field) noexcept {
    switch (field) {
        case HeaderField::TusResumable: return "Tus-Resumable";
        case HeaderField::TusVersion: return "Tus-Version";
        case HeaderField::TusExtension: return "Tus-Extension";
        case HeaderField::TusMaxSize: return "Tus-Max-Size";
        case HeaderField::TusChecksumAlgorithm: return "Tus-Checksum-Algorithm";
        case HeaderField::UploadLength: return "Upload-Length";
        case HeaderField::UploadOffset: return "Upload-Offset";
        case HeaderField::UploadMetadata: return "Upload-Metadata";
        case HeaderField::ContentType: return "Content-Type";
        case HeaderField::Location: return "Location";
        case HeaderField::MethodOverride: return "X-HTTP-Method-Override";
    }
    return "";
}

Result<std::string> encode_metadata(const MetadataPairs& pairs) {
    std::string encoded;
    for (const auto& [key, value] : pairs) {
        if (!is_valid_metadata_key(key)) {
            return Err<std::string>(Error{ErrorKind::InvalidHeaderValue,
                                          "Invalid Upload-Metadata key: '" + key + "'",
                                          std::nullopt,
                                          std::string(wire_name(HeaderField::UploadMetadata))});
        }
        if (!encoded.empty()) {
            encoded += kMetadataDelimiter;
        }
        encoded += key;
        if (!value.empty()) {
            encoded += ' ';
            encoded += base64_encode(value);
        }
    }
    return Ok(std::move(encoded));
}

std::optional<MetadataPairs> decode_metadata(const std::string& value) {
    MetadataPairs pairs;
    for (const auto& raw_entry : split(value, kMetadataDelimiter)) {
        const std::string entry = trim(raw_entry);
        if (entry.empty()) {
            continue;
        }

        const auto space = entry.find(' ');
        std::string key = entry.substr(0, space);
        if (key.empty()) {
            return std::nullopt;
        }

        std::string decoded;
        if (space != std::string::npos) {
            auto bytes = base64_decode(trim(entry.substr(space + 1)));
            if (!bytes) {
                return std::nullopt;
            }
            decoded = std::move(*bytes);
        }
        pairs.emplace_back(std::move(key), std::move(decoded));
    }
    return pairs;
}

std::optional<uint64_t> parse_unsigned(const std::string& text) {
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    uint64_t result = 0;
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        const uint64_t digit = c - '0';
        if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

std::optional<std::string> find_header(const network::HeaderMap& headers, HeaderField field) {
    auto it = headers.find(wire_name(field));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint64_t> find_unsigned(const network::HeaderMap& headers, HeaderField field) {
    auto value = find_header(headers, field);
    if (!value) {
        return std::nullopt;
    }
    return parse_unsigned(*value);
}

std::optional<std::vector<std::string>> find_list(const network::HeaderMap& headers, HeaderField field) {
    auto value = find_header(headers, field);
    if (!value) {
        return std::nullopt;
    }

    std::vector<std::string> items;
    for (const auto& part : split(*value, ',')) {
        auto item = trim(part);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

Result<std::string> require_header(const network::HeaderMap& headers, HeaderField field) {
    auto value = find_header(headers, field);
    if (!value || trim(*value).empty()) {
        return Err<std::string>(Error::missing_header(wire_name(field)));
    }
    return Ok(trim(*value));
}

Result<uint64_t> require_unsigned(const network::HeaderMap& headers, HeaderField field) {
    auto value = find_header(headers, field);
    if (!value) {
        return Err<uint64_t>(Error::missing_header(wire_name(field)));
    }
    auto parsed = parse_unsigned(*value);
    if (!parsed) {
        Error error = Error::missing_header(wire_name(field));
        error.message = std::string("Unparsable value for header ") + wire_name(field) + ": '" + *value + "'";
        return Err<uint64_t>(std::move(error));
    }
    return Ok(*parsed);
}

TypedHeaders decode_headers(const network::HeaderMap& headers) {
    TypedHeaders typed;
    typed.offset = find_unsigned(headers, HeaderField::UploadOffset);
    typed.upload_length = find_unsigned(headers, HeaderField::UploadLength);
    typed.max_size = find_unsigned(headers, HeaderField::TusMaxSize);
    typed.resumable = find_header(headers, HeaderField::TusResumable);
    typed.location = find_header(headers, HeaderField::Location);
    typed.supported_versions = find_list(headers, HeaderField::TusVersion);
    typed.extensions = find_list(headers, HeaderField::TusExtension);
    typed.checksum_algorithms = find_list(headers, HeaderField::TusChecksumAlgorithm);
    if (auto metadata = find_header(headers, HeaderField::UploadMetadata)) {
        typed.upload_metadata = decode_metadata(*metadata);
    }
    return typed;
}

} // namespace tus::protocol
