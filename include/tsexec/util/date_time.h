#ifndef TSEXEC_DATE_TIME_H
#define TSEXEC_DATE_TIME_H

#include <chrono>
#include <cstdint>

namespace tsexec {
    using engine_clock = std::chrono::system_clock;
    // Microsecond precision, matching the resolution blocks are built at
    using engine_time_t = std::chrono::time_point<engine_clock, std::chrono::microseconds>;
    using engine_time_delta_t = std::chrono::microseconds;

    constexpr engine_time_t min_time() noexcept { return engine_time_t{}; }

    inline int64_t to_micros(engine_time_t t) noexcept { return t.time_since_epoch().count(); }

    inline int64_t to_micros(engine_time_delta_t d) noexcept { return d.count(); }
} // namespace tsexec

#endif  // TSEXEC_DATE_TIME_H
