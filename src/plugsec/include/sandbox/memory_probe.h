#ifndef PLUGSEC_MEMORY_PROBE_H
#define PLUGSEC_MEMORY_PROBE_H

#include <cstdint>
#include <optional>

namespace plugsec {
namespace sandbox {

/**
 * @brief Source of process memory snapshots
 */
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    /**
     * @brief Current resident memory in bytes, or nullopt when unavailable
     */
    virtual std::optional<int64_t> residentBytes() = 0;
};

/**
 * @brief Reads resident set size from /proc/self/statm
 */
class ProcStatmMemoryProbe : public MemoryProbe {
public:
    std::optional<int64_t> residentBytes() override;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_MEMORY_PROBE_H
