#include <tsexec/block/block.h>
#include <tsexec/util/errors.h>

namespace tsexec {

    size_t Bounds::steps() const {
        if (step_size.count() <= 0 || duration.count() <= 0) { return 0; }
        return static_cast<size_t>(duration / step_size);
    }

    engine_time_t Bounds::end() const { return start + duration; }

    engine_time_t Bounds::time_for_index(size_t index) const {
        if (index >= steps()) {
            throw_error<std::out_of_range>("step index {} out of range for {} steps", index, steps());
        }
        return start + step_size * static_cast<int64_t>(index);
    }

    bool Bounds::equals(const Bounds &other) const {
        return start == other.start && duration == other.duration && step_size == other.step_size;
    }

    std::string Bounds::to_string() const {
        return fmt::format("Bounds(start={}us, duration={}us, step_size={}us)",
                           to_micros(start), to_micros(duration), to_micros(step_size));
    }

} // namespace tsexec
