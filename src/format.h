#pragma once

#include <cstdint>
#include <string>

#include "aranet_types.h"

namespace aranet {

constexpr double NSV_PER_USV = 1000.0;
constexpr double NSV_PER_MSV = 1000000.0;
constexpr double BQ_M3_PER_PCI_L = 37.0;

double nsv_to_usv(double nsv);
double nsv_to_msv(double nsv);
double bq_m3_to_pci_l(double bq_m3);

// "1d 2h 3m"; zero day/hour parts are left out, minutes always shown.
std::string format_duration(uint64_t seconds);

// Multi-line report as printed by `aranetctl read` and `monitor`.
std::string format_reading(const Reading& reading);

} // namespace aranet
