// DIRGATE - Encoding Utilities Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/core/encoding.h"

#include <cctype>
#include <stdexcept>

#include <openssl/evp.h>

namespace dirgate {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline bool IsBase64Char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::string Base64Encode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return "";
    }

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL
    std::string result(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  data, static_cast<int>(len));
    if (written < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }
    result.resize(static_cast<size_t>(written));
    return result;
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
    return Base64Encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> Base64Decode(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.empty()) {
        return std::vector<uint8_t>();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    for (size_t i = 0; i < compact.size(); ++i) {
        char c = compact[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i + 2 < compact.size()) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> result(compact.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(result.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

Sha256Digest Sha256(const uint8_t* data, size_t len) {
    Sha256Digest digest{};
    unsigned int digestLen = 0;
    if (EVP_Digest(data, len, digest.data(), &digestLen, EVP_sha256(), nullptr) != 1 ||
        digestLen != digest.size()) {
        throw std::runtime_error("SHA-256 computation failed");
    }
    return digest;
}

std::string Sha256Hex(const std::vector<uint8_t>& data) {
    Sha256Digest digest = Sha256(data.data(), data.size());
    return BytesToHex(digest.data(), digest.size());
}

} // namespace dirgate
