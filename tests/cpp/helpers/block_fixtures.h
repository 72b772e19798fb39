/**
 * @file block_fixtures.h
 * @brief Blocks, iterators and controllers used across the operator tests.
 *
 * Provides a helper to build column blocks from tag sets, plus failing collaborators to check that errors
 * raised outside an operator pass through it untouched.
 */

#ifndef TSEXEC_TESTS_BLOCK_FIXTURES_H
#define TSEXEC_TESTS_BLOCK_FIXTURES_H

#include <tsexec/block/column_block.h>
#include <tsexec/runtime/controller.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tsexec::testing {

    inline Bounds test_bounds(size_t steps) {
        return Bounds{
            engine_time_t{std::chrono::seconds{1000}},
            std::chrono::seconds{static_cast<int64_t>(steps) * 10},
            std::chrono::seconds{10}
        };
    }

    inline SeriesMeta series(std::string name, Tags tags) { return SeriesMeta{std::move(name), std::move(tags)}; }

    /**
     * Column block with one series per entry of series_metas and steps steps. The value of series s at step i
     * is base + s * 100 + i, so every value in a block is distinct.
     */
    inline block_s_ptr block_of(std::vector<SeriesMeta> series_metas, size_t steps, double base = 0.0) {
        std::vector<std::vector<double>> rows(steps);
        for (size_t i = 0; i < steps; ++i) {
            for (size_t s = 0; s < series_metas.size(); ++s) {
                rows[i].push_back(base + static_cast<double>(s) * 100.0 + static_cast<double>(i));
            }
        }
        return make_column_block(BlockMeta{test_bounds(steps), Tags{{"block", "test"}}}, std::move(series_metas), rows);
    }

    inline const ColumnBlock &as_column_block(const block_s_ptr &block) {
        return dynamic_cast<const ColumnBlock &>(*block);
    }

    // Values of the series at position s of a column block, one per step
    inline std::vector<double> series_values(const ColumnBlock &block, size_t s) {
        std::vector<double> values;
        for (const auto &column: block.columns()) { values.push_back(column.at(s)); }
        return values;
    }

    struct IteratorOpenError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct StepReadError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct BuilderError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Raises as soon as an iterator is requested
    struct UnopenableBlock final : Block {
        [[nodiscard]] step_iter_u_ptr step_iter() const override { throw IteratorOpenError("iterator unavailable"); }
    };

    /**
     * Wraps a block, failing on current() once fail_at steps have been read successfully.
     */
    struct FailingStepBlock final : Block {
        FailingStepBlock(block_s_ptr inner, size_t fail_at) : inner_(std::move(inner)), fail_at_(fail_at) {}

        [[nodiscard]] step_iter_u_ptr step_iter() const override {
            return std::make_unique<Iter>(inner_->step_iter(), fail_at_);
        }

    private:
        struct Iter final : StepIter {
            Iter(step_iter_u_ptr inner, size_t fail_at) : inner_(std::move(inner)), fail_at_(fail_at) {}

            bool next() override { return inner_->next(); }

            [[nodiscard]] const Step &current() override {
                if (reads_++ == fail_at_) { throw StepReadError("step unavailable"); }
                return inner_->current();
            }

            [[nodiscard]] size_t step_count() const override { return inner_->step_count(); }

            [[nodiscard]] const std::vector<SeriesMeta> &series_metas() const override {
                return inner_->series_metas();
            }

            [[nodiscard]] const BlockMeta &meta() const override { return inner_->meta(); }

        private:
            step_iter_u_ptr inner_;
            size_t fail_at_;
            size_t reads_{0};
        };

        block_s_ptr inner_;
        size_t fail_at_;
    };

    /**
     * Controller recording the builder requests it receives and the blocks it forwards.
     */
    struct RecordingController : Controller {
        using Controller::Controller;

        [[nodiscard]] builder_u_ptr block_builder(const BlockMeta &meta,
                                                  const std::vector<SeriesMeta> &series_metas) override {
            ++builder_requests;
            requested_meta = meta;
            requested_series_metas = series_metas;
            return Controller::block_builder(meta, series_metas);
        }

        size_t builder_requests{0};
        BlockMeta requested_meta{};
        std::vector<SeriesMeta> requested_series_metas{};
    };

    struct FailingBuilderController final : Controller {
        using Controller::Controller;

        [[nodiscard]] builder_u_ptr block_builder(const BlockMeta &, const std::vector<SeriesMeta> &) override {
            throw BuilderError("no builder available");
        }
    };

    struct FailingAddColsController final : Controller {
        using Controller::Controller;

        [[nodiscard]] builder_u_ptr block_builder(const BlockMeta &, const std::vector<SeriesMeta> &) override {
            struct Failing final : Builder {
                void add_cols(size_t) override { throw BuilderError("cannot allocate columns"); }

                void append_value(size_t, double) override {}

                [[nodiscard]] block_s_ptr build() override { return nullptr; }
            };
            return std::make_unique<Failing>();
        }
    };

    /**
     * Downstream node collecting every block it is sent.
     */
    struct CollectingNode final : OpNode {
        void process(const node_id_t &id, block_s_ptr block) override {
            ids.push_back(id);
            blocks.push_back(std::move(block));
        }

        std::vector<node_id_t> ids;
        std::vector<block_s_ptr> blocks;
    };

} // namespace tsexec::testing

#endif // TSEXEC_TESTS_BLOCK_FIXTURES_H
