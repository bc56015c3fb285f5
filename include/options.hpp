#pragma once

#include <cstddef>
#include <string>

namespace tracked {

/**
 * @brief Options for configuring a TrackedMap instance
 */
class TrackedMapOptions {
public:
    // Label printed in log records emitted by this map
    std::string name{"tracked_map"};

    // Number of storage buckets reserved at construction, 0 for none
    std::size_t initial_capacity{0};

    // Emit DEBUG records for clean->dirty transitions, removals and resets
    bool log_transitions{false};

    // Default constructor
    TrackedMapOptions() = default;
};

} // namespace tracked
