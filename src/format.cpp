#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

#include "format.h"

namespace aranet {

static const char* const RULE = "---------------------------------------\n";

double nsv_to_usv(double nsv) {
    return nsv / NSV_PER_USV;
}

double nsv_to_msv(double nsv) {
    return nsv / NSV_PER_MSV;
}

double bq_m3_to_pci_l(double bq_m3) {
    return bq_m3 / BQ_M3_PER_PCI_L;
}

std::string format_duration(uint64_t seconds) {
    const uint64_t minutes = (seconds / 60) % 60;
    const uint64_t hours = (seconds / 3600) % 24;
    const uint64_t days = seconds / 86400;

    std::ostringstream out;
    if (days > 0) out << days << "d ";
    if (hours > 0) out << hours << "h ";
    out << minutes << "m";
    return out.str();
}

static void write_age(std::ostringstream& out, const Reading& r) {
    if (r.age && r.interval) {
        out << "Age:          " << *r.age << "/" << *r.interval << " s\n";
    }
}

std::string format_reading(const Reading& r) {
    std::ostringstream out;
    out << std::fixed;

    out << RULE << "Connected: " << r.name;
    if (!r.version.empty()) {
        out << " | " << (r.version[0] == 'v' ? "" : "v") << r.version;
    }
    out << "\n";
    if (r.age && r.interval) {
        out << "Updated " << *r.age << " s ago. Intervals: " << *r.interval << " s\n";
    }
    out << RULE;

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Co2Measurement>) {
            out << "CO2:          " << m.co2 << " ppm\n";
            out << "Temperature:  " << std::setprecision(1) << m.temperature << " \xC2\xB0" "C\n";
            out << "Humidity:     " << static_cast<int>(m.humidity) << " %\n";
            out << "Pressure:     " << std::setprecision(1) << m.pressure << " hPa\n";
            out << "Battery:      " << static_cast<int>(r.battery) << " %\n";
            if (m.status) out << "Status Display: " << status_color_name(*m.status) << "\n";
        } else if constexpr (std::is_same_v<T, CompactMeasurement>) {
            out << "Temperature:  " << std::setprecision(1) << m.temperature << " \xC2\xB0" "C";
            if (m.temperature_status != AlertStatus::Off) {
                out << " [" << alert_status_name(m.temperature_status) << "]";
            }
            out << "\n";
            out << "Humidity:     " << std::setprecision(1) << m.humidity << " %";
            if (m.humidity_status != AlertStatus::Off) {
                out << " [" << alert_status_name(m.humidity_status) << "]";
            }
            out << "\n";
            out << "Battery:      " << static_cast<int>(r.battery) << " %\n";
        } else if constexpr (std::is_same_v<T, RadiationMeasurement>) {
            out << "Dose rate:    " << std::setprecision(2) << nsv_to_usv(m.rate) << " \xC2\xB5Sv/h\n";
            out << "Dose total:   " << std::setprecision(4) << nsv_to_msv(m.total) << " mSv/"
                << format_duration(m.duration) << "\n";
            out << "Battery:      " << static_cast<int>(r.battery) << " %\n";
        } else if constexpr (std::is_same_v<T, RadonMeasurement>) {
            out << "Radon Conc.:  " << m.radon << " Bq/m\xC2\xB3 (" << std::setprecision(2)
                << bq_m3_to_pci_l(m.radon) << " pCi/L)\n";
            out << "Temperature:  " << std::setprecision(1) << m.temperature << " \xC2\xB0" "C\n";
            out << "Humidity:     " << std::setprecision(1) << m.humidity << " %\n";
            out << "Pressure:     " << std::setprecision(1) << m.pressure << " hPa\n";
            out << "Battery:      " << static_cast<int>(r.battery) << " %\n";
            if (m.status) out << "Status Display: " << status_color_name(*m.status) << "\n";
        }
    }, r.measurement);

    write_age(out, r);
    out << RULE;
    return out.str();
}

} // namespace aranet
