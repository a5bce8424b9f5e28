// DIRGATE - Encoding Utilities
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Hex, base64 and SHA-256 helpers for carrying file contents over the
// JSON-RPC interface. Base64 and hashing are backed by OpenSSL EVP.

#ifndef DIRGATE_CORE_ENCODING_H
#define DIRGATE_CORE_ENCODING_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dirgate {

/// Lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Standard base64 with padding
std::string Base64Encode(const uint8_t* data, size_t len);
std::string Base64Encode(const std::vector<uint8_t>& data);

/**
 * Decode standard base64. ASCII whitespace is ignored.
 * @return nullopt if the input is not valid padded base64
 */
std::optional<std::vector<uint8_t>> Base64Decode(const std::string& encoded);

using Sha256Digest = std::array<uint8_t, 32>;

/// @throws std::runtime_error if the digest cannot be computed
Sha256Digest Sha256(const uint8_t* data, size_t len);

std::string Sha256Hex(const std::vector<uint8_t>& data);

} // namespace dirgate

#endif // DIRGATE_CORE_ENCODING_H
