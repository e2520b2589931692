#include "maestro/network/event.hpp"

#include <openssl/evp.h>

namespace maestro {
namespace network {

std::string to_hex(const unsigned char* data, size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

Expected<std::vector<unsigned char>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return tl::unexpected(Error{ErrorCode::InvalidEvent, "Hex string has odd length"});
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<unsigned char> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int high = nibble(hex[i]);
        const int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidEvent, "Invalid hex character"});
        }
        bytes.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return bytes;
}

Expected<std::string> compute_event_id(const Event& event) {
    auto serialized = canonical_serialization(event);
    if (!serialized) {
        return tl::unexpected(serialized.error());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(serialized->data(), serialized->size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return tl::unexpected(Error{ErrorCode::SigningFailed, "SHA-256 digest failed"});
    }
    return to_hex(digest, digest_len);
}

} // namespace network
} // namespace maestro
