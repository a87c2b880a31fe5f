#include <cstdint>
#include <string>
#include <vector>

#include "aranet_error.h"
#include "catalog.h"
#include "decoder.h"

namespace aranet {

namespace {

uint8_t read_u8(const std::vector<uint8_t>& d, size_t offset) {
    return d[offset];
}

uint16_t read_u16_le(const std::vector<uint8_t>& d, size_t offset) {
    return static_cast<uint16_t>(d[offset] | (d[offset + 1] << 8));
}

uint32_t read_u32_le(const std::vector<uint8_t>& d, size_t offset) {
    uint32_t v = 0;
    for (size_t i = 0; i < 4; ++i) v |= static_cast<uint32_t>(d[offset + i]) << (8 * i);
    return v;
}

uint64_t read_u64_le(const std::vector<uint8_t>& d, size_t offset) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) v |= static_cast<uint64_t>(d[offset + i]) << (8 * i);
    return v;
}

void require_size(const std::vector<uint8_t>& data, size_t min_size, const char* layout) {
    if (data.size() < min_size) {
        throw DecodeError(DecodeError::Reason::TooShort,
                          std::string(layout) + " payload needs " + std::to_string(min_size) +
                              " bytes, got " + std::to_string(data.size()));
    }
}

std::optional<StatusColor> to_status_color(uint8_t raw) {
    if (raw > static_cast<uint8_t>(StatusColor::Red)) return std::nullopt;
    return static_cast<StatusColor>(raw);
}

// co2 u16, temperature u16 (x20), pressure u16 (x10), humidity u8, battery u8,
// status u8 [, interval u16, age u16]
Reading decode_aranet4(const std::vector<uint8_t>& data) {
    require_size(data, ARANET4_MIN_SIZE, "Aranet4");

    Co2Measurement m;
    m.co2 = read_u16_le(data, 0);
    m.temperature = read_u16_le(data, 2) / 20.0;
    m.pressure = read_u16_le(data, 4) / 10.0;
    m.humidity = read_u8(data, 6);
    m.status = to_status_color(read_u8(data, 8));

    Reading r;
    r.type = DeviceType::Aranet4;
    r.battery = read_u8(data, 7);
    if (data.size() >= ARANET4_WITH_TIMING_SIZE) {
        r.interval = read_u16_le(data, 9);
        r.age = read_u16_le(data, 11);
    }
    r.measurement = m;
    return r;
}

// Tagged layouts: tag u8, reserved u8, interval u16, age u16, battery u8, ...
Reading decode_aranet2(const std::vector<uint8_t>& data) {
    require_size(data, ARANET2_MIN_SIZE, "Aranet2");

    CompactMeasurement m;
    m.temperature = read_u16_le(data, 7) / 20.0;
    m.humidity = read_u16_le(data, 9) / 10.0;
    const uint8_t flags = read_u8(data, 11);
    m.humidity_status = static_cast<AlertStatus>(flags & 0x03);
    m.temperature_status = static_cast<AlertStatus>((flags >> 2) & 0x03);

    Reading r;
    r.type = DeviceType::Aranet2;
    r.interval = read_u16_le(data, 2);
    r.age = read_u16_le(data, 4);
    r.battery = read_u8(data, 6);
    r.measurement = m;
    return r;
}

// The legacy characteristic stores the dose rate x10, the detailed one stores it as is.
Reading decode_radiation(const std::vector<uint8_t>& data, bool legacy_layout) {
    require_size(data, RADIATION_MIN_SIZE, "Aranet Radiation");

    const uint32_t rate_raw = read_u32_le(data, 7);

    RadiationMeasurement m;
    m.rate = legacy_layout ? rate_raw / 10.0 : static_cast<double>(rate_raw);
    m.total = static_cast<double>(read_u64_le(data, 11));
    m.duration = read_u64_le(data, 19);

    Reading r;
    r.type = DeviceType::AranetRadiation;
    r.interval = read_u16_le(data, 2);
    r.age = read_u16_le(data, 4);
    r.battery = read_u8(data, 6);
    r.measurement = m;
    return r;
}

Reading decode_tagged(const std::vector<uint8_t>& data, bool legacy_layout) {
    require_size(data, 1, "Tagged");

    const uint8_t tag = read_u8(data, 0);
    switch (static_cast<PayloadTag>(tag)) {
        case PayloadTag::Aranet2:
            return decode_aranet2(data);
        case PayloadTag::Radiation:
            return decode_radiation(data, legacy_layout);
        case PayloadTag::Radon:
            // Radon Plus layout not implemented.
            throw DecodeError(DecodeError::Reason::UnsupportedDeviceType,
                              std::string(device_type_name(DeviceType::AranetRadon)) +
                                  " readings are not supported");
    }
    throw DecodeError(DecodeError::Reason::UnknownDeviceType,
                      "unknown device type tag " + std::to_string(tag));
}

} // namespace

Reading decode_reading(const std::vector<uint8_t>& data,
                       const std::string& characteristic,
                       const std::string& name,
                       const std::string& version) {
    const std::string uuid = normalize_uuid(characteristic);

    Reading r;
    if (uuid == CHAR_CURRENT_READINGS_DETAILED || uuid == CHAR_CURRENT_READINGS) {
        r = decode_aranet4(data);
    } else if (uuid == CHAR_CURRENT_READINGS_AR2_DETAILED) {
        r = decode_tagged(data, false);
    } else if (uuid == CHAR_CURRENT_READINGS_AR2) {
        r = decode_tagged(data, true);
    } else {
        throw DecodeError(DecodeError::Reason::UnknownCharacteristic,
                          "no reading layout for characteristic " + characteristic);
    }

    r.name = name;
    r.version = version;
    return r;
}

} // namespace aranet
