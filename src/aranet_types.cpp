#include "aranet_types.h"

namespace aranet {

const char* device_type_name(DeviceType type) {
    switch (type) {
        case DeviceType::Aranet4:         return "Aranet4";
        case DeviceType::Aranet2:         return "Aranet2";
        case DeviceType::AranetRadiation: return "Aranet Radiation";
        case DeviceType::AranetRadon:     return "Aranet Radon Plus";
        case DeviceType::Unknown:         break;
    }
    return "Unknown Aranet Device";
}

const char* status_color_name(StatusColor color) {
    switch (color) {
        case StatusColor::Error:  return "ERROR";
        case StatusColor::Green:  return "GREEN";
        case StatusColor::Yellow: return "YELLOW";
        case StatusColor::Red:    return "RED";
    }
    return "UNKNOWN";
}

const char* alert_status_name(AlertStatus status) {
    switch (status) {
        case AlertStatus::Off:   return "OFF";
        case AlertStatus::Under: return "UNDER";
        case AlertStatus::Over:  return "OVER";
        case AlertStatus::Dash:  return "DASH";
    }
    return "UNKNOWN";
}

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:                       return "Idle";
        case SessionState::Connecting:                 return "Connecting";
        case SessionState::DiscoveringServices:        return "DiscoveringServices";
        case SessionState::DiscoveringCharacteristics: return "DiscoveringCharacteristics";
        case SessionState::AwaitingPayload:            return "AwaitingPayload";
        case SessionState::Completed:                  return "Completed";
        case SessionState::Failed:                     return "Failed";
    }
    return "Unknown";
}

bool operator==(const Co2Measurement& a, const Co2Measurement& b) {
    return a.co2 == b.co2 && a.temperature == b.temperature && a.pressure == b.pressure &&
           a.humidity == b.humidity && a.status == b.status;
}

bool operator==(const CompactMeasurement& a, const CompactMeasurement& b) {
    return a.temperature == b.temperature && a.humidity == b.humidity &&
           a.temperature_status == b.temperature_status && a.humidity_status == b.humidity_status;
}

bool operator==(const RadiationMeasurement& a, const RadiationMeasurement& b) {
    return a.rate == b.rate && a.total == b.total && a.duration == b.duration;
}

bool operator==(const RadonMeasurement& a, const RadonMeasurement& b) {
    return a.radon == b.radon && a.temperature == b.temperature && a.pressure == b.pressure &&
           a.humidity == b.humidity && a.status == b.status;
}

bool operator==(const Reading& a, const Reading& b) {
    return a.type == b.type && a.name == b.name && a.version == b.version &&
           a.battery == b.battery && a.interval == b.interval && a.age == b.age &&
           a.measurement == b.measurement;
}

} // namespace aranet
