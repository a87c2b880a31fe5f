#pragma once

#include <chrono>
#include <istream>
#include <string>

#include "ble_session.h"
#include "monitor.h"

namespace aranet {

constexpr const char* DEFAULT_CONFIG_FILENAME = "aranetctl.settings";

// Values from the settings file. Durations are written in whole seconds.
struct Settings {
    std::chrono::seconds scan_timeout{10};
    std::chrono::seconds device_scan_timeout{10};
    std::chrono::seconds ready_timeout{5};
    std::chrono::seconds grace_timeout{5};
    std::chrono::seconds absolute_timeout{30};
    std::chrono::seconds monitor_margin{3};
    bool verbose = false;

    SessionOptions session_options() const;
    MonitorOptions monitor_options() const;

    // --timeout: the scan duration for "scan", the device lookup scan for
    // "read" and "monitor". False for any other command.
    bool apply_timeout_override(const std::string& command, std::chrono::seconds timeout);
};

// "key = value" with surrounding whitespace stripped. False when either side is empty.
bool parse_settings_line(const std::string& line, std::string& out_key, std::string& out_value);

// Applies one key/value pair. False for unknown keys or values that do not parse.
bool apply_setting(Settings& settings, const std::string& key, const std::string& value);

// Reads settings lines from `in` into `settings`. Blank lines and lines starting
// with '#', "//" or ';' are skipped; invalid lines are warned about on stderr.
// Returns the number of settings applied.
size_t load_settings(std::istream& in, Settings& settings);

// False when the file cannot be opened; `settings` is then left untouched.
bool load_settings_file(const std::string& path, Settings& settings);

// Resolves `filename` against the working directory (Debug builds also check
// two directories up). Empty when the file does not exist.
std::string resolve_config_path(const std::string& filename);

} // namespace aranet
