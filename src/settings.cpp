#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "logging.h"
#include "settings.h"

namespace aranet {

static std::string trim(std::string s) {
    auto isspace2 = [](unsigned char ch){ return std::isspace(ch) != 0; };
    size_t start = 0;
    while (start < s.size() && isspace2(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && isspace2(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool iequals_ascii(const std::string& a, const char* b) {
    size_t n = a.size();
    size_t m = std::strlen(b);
    if (n != m) return false;
    for (size_t i = 0; i < n; ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

static bool parse_seconds(const std::string& value, std::chrono::seconds& out) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used, 10);
        if (used != value.size() || v < 0) return false;
        out = std::chrono::seconds(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_bool(const std::string& value, bool& out) {
    if (iequals_ascii(value, "true") || iequals_ascii(value, "yes") ||
        iequals_ascii(value, "on") || value == "1") {
        out = true;
        return true;
    }
    if (iequals_ascii(value, "false") || iequals_ascii(value, "no") ||
        iequals_ascii(value, "off") || value == "0") {
        out = false;
        return true;
    }
    return false;
}

SessionOptions Settings::session_options() const {
    SessionOptions options;
    options.ready_timeout = ready_timeout;
    options.grace_timeout = grace_timeout;
    options.absolute_timeout = absolute_timeout;
    return options;
}

MonitorOptions Settings::monitor_options() const {
    MonitorOptions options;
    options.margin = monitor_margin;
    return options;
}

bool Settings::apply_timeout_override(const std::string& command, std::chrono::seconds timeout) {
    if (command == "scan") {
        scan_timeout = timeout;
    } else if (command == "read" || command == "monitor") {
        device_scan_timeout = timeout;
    } else {
        return false;
    }
    return true;
}

bool parse_settings_line(const std::string& line, std::string& out_key, std::string& out_value) {
    auto posEq = line.find('=');
    if (posEq == std::string::npos) return false;

    std::string left = trim(line.substr(0, posEq));
    std::string right = trim(line.substr(posEq + 1));
    if (left.empty() || right.empty()) return false;

    // Optional quotes around the value
    if (right.size() >= 2 && right.front() == '"' && right.back() == '"') {
        right = right.substr(1, right.size() - 2);
    }

    out_key = std::move(left);
    out_value = std::move(right);
    return true;
}

bool apply_setting(Settings& settings, const std::string& key, const std::string& value) {
    if (iequals_ascii(key, "scan_timeout")) return parse_seconds(value, settings.scan_timeout);
    if (iequals_ascii(key, "device_scan_timeout")) return parse_seconds(value, settings.device_scan_timeout);
    if (iequals_ascii(key, "ready_timeout")) return parse_seconds(value, settings.ready_timeout);
    if (iequals_ascii(key, "grace_timeout")) return parse_seconds(value, settings.grace_timeout);
    if (iequals_ascii(key, "absolute_timeout")) return parse_seconds(value, settings.absolute_timeout);
    if (iequals_ascii(key, "monitor_margin")) return parse_seconds(value, settings.monitor_margin);
    if (iequals_ascii(key, "verbose")) return parse_bool(value, settings.verbose);
    return false;
}

size_t load_settings(std::istream& in, Settings& settings) {
    std::string line;
    size_t lineNum = 0;
    size_t applied = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::string raw = trim(line);
        if (raw.empty()) continue;

        // Skip comments
        if (raw.rfind("//", 0) == 0 || raw.rfind("#", 0) == 0 || raw.rfind(";", 0) == 0) continue;

        std::string key;
        std::string value;
        if (!parse_settings_line(raw, key, value)) {
            std::cerr << "Warning: invalid config line " << lineNum << ": " << line << "\n";
            continue;
        }
        if (!apply_setting(settings, key, value)) {
            std::cerr << "Warning: unknown setting or bad value on line " << lineNum << ": " << line << "\n";
            continue;
        }
        ++applied;
    }
    return applied;
}

bool load_settings_file(const std::string& path, Settings& settings) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Config not found: " << path << ". Using defaults.\n";
        return false;
    }
    const size_t applied = load_settings(in, settings);
    ARANET_DEBUG << "Loaded " << applied << " setting(s) from " << path << std::endl;
    return true;
}

std::string resolve_config_path(const std::string& filename) {
    namespace fs = std::filesystem;
    std::error_code ec;

    const fs::path cwd = fs::current_path(ec);
    if (ec) return {};

    fs::path candidate = cwd / filename;
    if (fs::exists(candidate, ec) && !ec) return candidate.string();

#if !defined(NDEBUG)
    fs::path up2 = cwd.parent_path().parent_path();
    candidate = up2 / filename;
    if (fs::exists(candidate, ec) && !ec) return candidate.string();
#endif

    return {};
}

} // namespace aranet
