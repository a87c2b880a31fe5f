#include <atomic>
#include <iomanip>
#include <sstream>

#include "logging.h"

namespace aranet {

static std::atomic<bool> g_debug{false};

void set_debug_enabled(bool enabled) {
    g_debug.store(enabled);
}

bool debug_enabled() {
    return g_debug.load();
}

std::string to_hex(const std::vector<uint8_t>& data) {
    std::ostringstream out;
    for (size_t i = 0; i < data.size(); ++i) {
        if (i) out << ' ';
        out << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(data[i]);
    }
    return out.str();
}

} // namespace aranet
