#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace aranet {

// Peripheral as seen during a scan. id is the platform identifier (the BLE address).
struct DeviceIdentity {
    std::string id;
    std::optional<std::string> name;

    std::string display_name() const { return name ? *name : std::string("Unknown"); }
};

enum class DeviceType : uint8_t {
    Aranet4 = 0,
    Aranet2 = 1,
    AranetRadiation = 2,
    AranetRadon = 3,
    Unknown = 255
};

// Colour shown on the Aranet4 e-ink display.
enum class StatusColor : uint8_t {
    Error = 0,
    Green = 1,
    Yellow = 2,
    Red = 3
};

// Per-parameter alert state (Aranet2).
enum class AlertStatus : uint8_t {
    Off = 0,
    Under = 1,
    Over = 2,
    Dash = 3
};

enum class SessionState {
    Idle,
    Connecting,
    DiscoveringServices,
    DiscoveringCharacteristics,
    AwaitingPayload,
    Completed,
    Failed
};

const char* device_type_name(DeviceType type);
const char* status_color_name(StatusColor color);
const char* alert_status_name(AlertStatus status);
const char* session_state_name(SessionState state);

struct Co2Measurement {
    uint16_t co2 = 0;              // ppm
    double temperature = 0.0;      // degC
    double pressure = 0.0;         // hPa
    uint8_t humidity = 0;          // %
    std::optional<StatusColor> status;
};

struct CompactMeasurement {
    double temperature = 0.0;      // degC
    double humidity = 0.0;         // %
    AlertStatus temperature_status = AlertStatus::Off;
    AlertStatus humidity_status = AlertStatus::Off;
};

struct RadiationMeasurement {
    double rate = 0.0;             // nSv/h
    double total = 0.0;            // nSv
    uint64_t duration = 0;         // s
};

struct RadonMeasurement {
    uint32_t radon = 0;            // Bq/m3
    double temperature = 0.0;
    double pressure = 0.0;
    double humidity = 0.0;
    std::optional<StatusColor> status;
};

using Measurement = std::variant<Co2Measurement, CompactMeasurement,
                                 RadiationMeasurement, RadonMeasurement>;

// One decoded snapshot. Built only by decode_reading().
struct Reading {
    DeviceType type = DeviceType::Unknown;
    std::string name;
    std::string version;
    uint8_t battery = 0;
    std::optional<uint16_t> interval;   // s between measurements
    std::optional<uint16_t> age;        // s since the last measurement
    Measurement measurement;
};

bool operator==(const Co2Measurement& a, const Co2Measurement& b);
bool operator==(const CompactMeasurement& a, const CompactMeasurement& b);
bool operator==(const RadiationMeasurement& a, const RadiationMeasurement& b);
bool operator==(const RadonMeasurement& a, const RadonMeasurement& b);
bool operator==(const Reading& a, const Reading& b);

} // namespace aranet
