// LOCKVAULT - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#ifndef LOCKVAULT_CORE_HEX_H
#define LOCKVAULT_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace lockvault {

// Kept free of types.h so types.cpp can use it
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes, throws std::invalid_argument on bad input
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace lockvault

#endif // LOCKVAULT_CORE_HEX_H
