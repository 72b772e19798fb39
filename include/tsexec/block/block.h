#ifndef TSEXEC_BLOCK_BLOCK_H
#define TSEXEC_BLOCK_BLOCK_H

#include <tsexec/tsexec_base.h>
#include <tsexec/models/tags.h>

#include <cstddef>
#include <string>
#include <vector>

namespace tsexec {

    /**
     * The time range a block covers. Steps are taken at start, start + step_size, ... up to (but excluding)
     * start + duration.
     */
    struct TSEXEC_EXPORT Bounds {
        engine_time_t start{min_time()};
        engine_time_delta_t duration{};
        engine_time_delta_t step_size{};

        /**
         * Number of steps in the range, zero when the step size is not positive.
         */
        [[nodiscard]] size_t steps() const;

        [[nodiscard]] engine_time_t end() const;

        /**
         * The time of the step at index, raises std::out_of_range for an index past the last step.
         */
        [[nodiscard]] engine_time_t time_for_index(size_t index) const;

        [[nodiscard]] bool equals(const Bounds &other) const;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const Bounds &other) const = default;
    };

    /**
     * Block level metadata, the tags are those common to every series in the block.
     */
    struct TSEXEC_EXPORT BlockMeta {
        Bounds bounds;
        Tags tags;

        bool operator==(const BlockMeta &other) const = default;
    };

    struct TSEXEC_EXPORT SeriesMeta {
        std::string name;
        Tags tags;

        bool operator==(const SeriesMeta &other) const = default;
    };

    /**
     * One time slice across a block, values are aligned with the series metadata of the iterator producing it.
     */
    struct TSEXEC_EXPORT Step {
        virtual ~Step() = default;

        [[nodiscard]] virtual engine_time_t time() const = 0;

        [[nodiscard]] virtual const std::vector<double> &values() const = 0;
    };

    /**
     * A forward only cursor over the steps of a block.
     *
     * next() must be called before the first current(); it returns false once step_count() steps have been visited.
     * The series metadata is fixed for the lifetime of the iterator.
     */
    struct TSEXEC_EXPORT StepIter {
        virtual ~StepIter() = default;

        virtual bool next() = 0;

        /**
         * The step the iterator is positioned on, raises if the step cannot be produced.
         */
        [[nodiscard]] virtual const Step &current() = 0;

        [[nodiscard]] virtual size_t step_count() const = 0;

        [[nodiscard]] virtual const std::vector<SeriesMeta> &series_metas() const = 0;

        [[nodiscard]] virtual const BlockMeta &meta() const = 0;
    };

    /**
     * An immutable, time aligned collection of series. The block must outlive any iterator opened on it.
     */
    struct TSEXEC_EXPORT Block {
        virtual ~Block() = default;

        [[nodiscard]] virtual step_iter_u_ptr step_iter() const = 0;
    };

    /**
     * Write only accumulator for a new block.
     */
    struct TSEXEC_EXPORT Builder {
        virtual ~Builder() = default;

        /**
         * Allocate count further time columns.
         */
        virtual void add_cols(size_t count) = 0;

        /**
         * Append value to the column at row, values land in series order.
         */
        virtual void append_value(size_t row, double value) = 0;

        [[nodiscard]] virtual block_s_ptr build() = 0;
    };

} // namespace tsexec

#endif // TSEXEC_BLOCK_BLOCK_H
