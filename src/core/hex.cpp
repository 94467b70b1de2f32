// LOCKVAULT - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/core/hex.h"

#include <stdexcept>

namespace lockvault {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }

    std::vector<HexByte> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = Nibble(hex[2 * i]);
        int lo = Nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in '" + hex + "'");
        }
        out[i] = static_cast<HexByte>((hi << 4) | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (Nibble(c) < 0) return false;
    }
    return true;
}

} // namespace lockvault
