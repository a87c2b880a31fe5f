#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "catalog.h"

namespace aranet {

std::string to_lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

std::string normalize_uuid(const std::string& uuid) {
    std::string v = to_lower(uuid);
    if (v.rfind("0x", 0) == 0) v = v.substr(2);

    const bool all_hex = !v.empty() && std::all_of(v.begin(), v.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
    if (all_hex && (v.size() == 4 || v.size() == 8)) {
        return std::string(8 - v.size(), '0') + v + "-0000-1000-8000-00805f9b34fb";
    }
    return v;
}

bool uuid_equals(const std::string& a, const std::string& b) {
    return normalize_uuid(a) == normalize_uuid(b);
}

const std::vector<CatalogEntry>& characteristic_catalog() {
    static const std::vector<CatalogEntry> catalog = {
        {CHAR_DEVICE_NAME, CharacteristicRole::DeviceName, ProductLine::Generic},
        {CHAR_FIRMWARE_REVISION, CharacteristicRole::FirmwareRevision, ProductLine::Generic},
        {CHAR_CURRENT_READINGS_DETAILED, CharacteristicRole::ReadingDetailed, ProductLine::Aranet4},
        {CHAR_CURRENT_READINGS, CharacteristicRole::ReadingBasic, ProductLine::Aranet4},
        {CHAR_CURRENT_READINGS_AR2_DETAILED, CharacteristicRole::ReadingDetailed, ProductLine::Aranet2Family},
        {CHAR_CURRENT_READINGS_AR2, CharacteristicRole::ReadingBasic, ProductLine::Aranet2Family},
    };
    return catalog;
}

std::optional<CatalogEntry> find_catalog_entry(const std::string& uuid) {
    const std::string wanted = normalize_uuid(uuid);
    for (const auto& entry : characteristic_catalog()) {
        if (normalize_uuid(entry.uuid) == wanted) return entry;
    }
    return std::nullopt;
}

std::vector<std::string> aranet_service_filter() {
    return {normalize_uuid(SERVICE_SAF_TEHNIKA), normalize_uuid(SERVICE_SAF_TEHNIKA_OLD)};
}

bool is_reading_characteristic(const std::string& uuid) {
    auto entry = find_catalog_entry(uuid);
    return entry && (entry->role == CharacteristicRole::ReadingBasic ||
                     entry->role == CharacteristicRole::ReadingDetailed);
}

bool is_informational_characteristic(const std::string& uuid) {
    auto entry = find_catalog_entry(uuid);
    return entry && (entry->role == CharacteristicRole::DeviceName ||
                     entry->role == CharacteristicRole::FirmwareRevision);
}

// Primary product line before the secondary one; within a line the
// no-pairing detailed variant before the authenticated basic one.
const std::vector<std::string>& reading_priority() {
    static const std::vector<std::string> priority = [] {
        std::vector<std::string> out;
        for (ProductLine line : {ProductLine::Aranet4, ProductLine::Aranet2Family}) {
            for (CharacteristicRole role : {CharacteristicRole::ReadingDetailed, CharacteristicRole::ReadingBasic}) {
                for (const auto& entry : characteristic_catalog()) {
                    if (entry.line == line && entry.role == role) out.push_back(normalize_uuid(entry.uuid));
                }
            }
        }
        return out;
    }();
    return priority;
}

std::optional<std::string> select_reading_characteristic(const std::vector<std::string>& discovered) {
    std::vector<std::string> normalized;
    normalized.reserve(discovered.size());
    for (const auto& uuid : discovered) normalized.push_back(normalize_uuid(uuid));

    for (const auto& candidate : reading_priority()) {
        if (std::find(normalized.begin(), normalized.end(), candidate) != normalized.end()) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace aranet
