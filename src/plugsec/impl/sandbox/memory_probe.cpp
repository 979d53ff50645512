#include "sandbox/memory_probe.h"
#include "utils/log.h"
#include <fstream>
#include <unistd.h>

namespace plugsec {
namespace sandbox {

std::optional<int64_t> ProcStatmMemoryProbe::residentBytes() {
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) {
        return std::nullopt;
    }

    // size resident shared text lib data dt, in pages
    int64_t sizePages = 0;
    int64_t residentPages = 0;
    if (!(statm >> sizePages >> residentPages)) {
        LOGD("Could not parse /proc/self/statm");
        return std::nullopt;
    }

    long pageSize = sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return std::nullopt;
    }
    return residentPages * static_cast<int64_t>(pageSize);
}

} // namespace sandbox
} // namespace plugsec
