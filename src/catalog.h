#pragma once

#include <optional>
#include <string>
#include <vector>

namespace aranet {

// GAP
constexpr const char* SERVICE_GAP = "1800";
constexpr const char* CHAR_DEVICE_NAME = "2a00";

// Device Information Service
constexpr const char* SERVICE_DIS = "180a";
constexpr const char* CHAR_FIRMWARE_REVISION = "2a26";

// SAF Tehnika (Aranet) service, current and pre-v1.2 firmware
constexpr const char* SERVICE_SAF_TEHNIKA = "fce0";
constexpr const char* SERVICE_SAF_TEHNIKA_OLD = "f0cd1400-95da-4f4b-9ac8-aa55d312af0c";

// Aranet4 current readings. Basic needs an authenticated link, detailed does not.
constexpr const char* CHAR_CURRENT_READINGS = "f0cd1503-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* CHAR_CURRENT_READINGS_DETAILED = "f0cd3001-95da-4f4b-9ac8-aa55d312af0c";

// Shared by Aranet2, Aranet Radiation and Aranet Radon Plus; payload starts with a type tag.
constexpr const char* CHAR_CURRENT_READINGS_AR2 = "f0cd1504-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* CHAR_CURRENT_READINGS_AR2_DETAILED = "f0cd3003-95da-4f4b-9ac8-aa55d312af0c";

// SAF Tehnika manufacturer id found in Aranet advertisements.
constexpr unsigned int MANUFACTURER_ID_SAF_TEHNIKA = 0x0702;

enum class CharacteristicRole {
    DeviceName,
    FirmwareRevision,
    ReadingBasic,
    ReadingDetailed
};

enum class ProductLine {
    Generic,      // standard GATT characteristics
    Aranet4,
    Aranet2Family
};

struct CatalogEntry {
    const char* uuid;
    CharacteristicRole role;
    ProductLine line;
};

// ASCII lower-case copy.
std::string to_lower(std::string v);

// Lower-cases and expands 16/32-bit short forms onto the Bluetooth base UUID,
// so "2A00" and "00002a00-0000-1000-8000-00805f9b34fb" compare equal.
std::string normalize_uuid(const std::string& uuid);
bool uuid_equals(const std::string& a, const std::string& b);

const std::vector<CatalogEntry>& characteristic_catalog();
std::optional<CatalogEntry> find_catalog_entry(const std::string& uuid);

// Service uuids an Aranet advertises (scan filter).
std::vector<std::string> aranet_service_filter();

bool is_reading_characteristic(const std::string& uuid);
bool is_informational_characteristic(const std::string& uuid);

// Reading characteristics in descending preference.
const std::vector<std::string>& reading_priority();

// Picks the single reading source among the discovered characteristics,
// or nullopt when none of the catalog's reading roles is present.
std::optional<std::string> select_reading_characteristic(const std::vector<std::string>& discovered);

} // namespace aranet
