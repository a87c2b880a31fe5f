#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace aranet {

void set_debug_enabled(bool enabled);
bool debug_enabled();

// "05 C9 01 B4 ..."
std::string to_hex(const std::vector<uint8_t>& data);

} // namespace aranet

// Usage: ARANET_DEBUG << "Connected to " << id << std::endl;
#define ARANET_DEBUG \
    if (!::aranet::debug_enabled()) {} else std::cerr << "[DEBUG] "
