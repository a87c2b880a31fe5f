#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aranet_types.h"

namespace aranet {

// Leading tag byte of the shared Aranet2-family reading characteristics.
enum class PayloadTag : uint8_t {
    Aranet2 = 2,
    Radon = 3,
    Radiation = 4
};

constexpr size_t ARANET4_MIN_SIZE = 9;
constexpr size_t ARANET4_WITH_TIMING_SIZE = 13;
constexpr size_t ARANET2_MIN_SIZE = 12;
constexpr size_t RADIATION_MIN_SIZE = 28;

// Decodes a current-readings payload read from `characteristic`.
// Throws DecodeError (ErrorCode::InvalidData) for short buffers, unknown
// characteristics, unknown type tags and known-but-unsupported devices.
Reading decode_reading(const std::vector<uint8_t>& data,
                       const std::string& characteristic,
                       const std::string& name = "",
                       const std::string& version = "");

} // namespace aranet
