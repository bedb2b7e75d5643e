// SPDX-License-Identifier: Apache-2.0
// clock.hpp - Millisecond wall clock shared by the simulation and the wire protocol.
#pragma once
#include <chrono>
#include <cstdint>

namespace astro {

// Unix epoch milliseconds. Round end times travel to clients in this unit.
inline uint64_t wall_clock_ms()
{
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace astro
