// TypeProof - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/core/hex.h"

namespace typeproof {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";

    inline int NibbleValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline size_t PrefixLength(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return 2;
        }
        return 0;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    size_t start = PrefixLength(hex);
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<uint8_t> out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int high = NibbleValue(hex[i]);
        int low = NibbleValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    size_t start = PrefixLength(str);
    if ((str.size() - start) % 2 != 0) {
        return false;
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (NibbleValue(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace typeproof
