// LOCKVAULT - Serialization Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/core/serialize.h"
#include "lockvault/core/hex.h"

namespace lockvault {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace lockvault
