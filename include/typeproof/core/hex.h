// TypeProof - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_CORE_HEX_H
#define TYPEPROOF_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>

namespace typeproof {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes.
/// Accepts an optional "0x" prefix. Throws std::invalid_argument on odd
/// length or non-hex characters.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (even length, hex digits only, may be empty)
bool IsValidHex(const std::string& str);

} // namespace typeproof

#endif // TYPEPROOF_CORE_HEX_H
