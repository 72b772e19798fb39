#include <tsexec/block/column_block.h>
#include <tsexec/util/errors.h>

#include <memory>

namespace tsexec {

    namespace {
        struct ColumnStep final : Step {
            engine_time_t time_{};
            const std::vector<double> *values_{nullptr};

            [[nodiscard]] engine_time_t time() const override { return time_; }

            [[nodiscard]] const std::vector<double> &values() const override { return *values_; }
        };

        struct ColumnStepIter final : StepIter {
            explicit ColumnStepIter(const ColumnBlock &block) : _block(block) {}

            bool next() override {
                if (_index == NOT_STARTED) {
                    _index = 0;
                } else if (_index < step_count()) {
                    ++_index;
                }
                return _index < step_count();
            }

            [[nodiscard]] const Step &current() override {
                if (_index == NOT_STARTED || _index >= step_count()) {
                    throw_error<std::out_of_range>("current() called outside of the {} steps of the block",
                                                   step_count());
                }
                const auto &bounds = _block.meta().bounds;
                _step.time_ = bounds.start + bounds.step_size * static_cast<int64_t>(_index);
                _step.values_ = &_block.columns()[_index];
                return _step;
            }

            [[nodiscard]] size_t step_count() const override { return _block.step_count(); }

            [[nodiscard]] const std::vector<SeriesMeta> &series_metas() const override {
                return _block.series_metas();
            }

            [[nodiscard]] const BlockMeta &meta() const override { return _block.meta(); }

        private:
            static constexpr size_t NOT_STARTED = static_cast<size_t>(-1);

            const ColumnBlock &_block;
            size_t _index{NOT_STARTED};
            ColumnStep _step;
        };
    } // namespace

    ColumnBlock::ColumnBlock(BlockMeta meta, std::vector<SeriesMeta> series_metas, std::vector<column_type> columns)
        : _meta(std::move(meta)), _series_metas(std::move(series_metas)), _columns(std::move(columns)) {
    }

    step_iter_u_ptr ColumnBlock::step_iter() const { return std::make_unique<ColumnStepIter>(*this); }

    ColumnBlockBuilder::ColumnBlockBuilder(BlockMeta meta, std::vector<SeriesMeta> series_metas)
        : _meta(std::move(meta)), _series_metas(std::move(series_metas)) {
    }

    void ColumnBlockBuilder::add_cols(size_t count) {
        _columns.reserve(_columns.size() + count);
        for (size_t i = 0; i < count; ++i) {
            ColumnBlock::column_type column;
            column.reserve(_series_metas.size());
            _columns.push_back(std::move(column));
        }
    }

    void ColumnBlockBuilder::append_value(size_t row, double value) {
        if (row >= _columns.size()) {
            throw_error<std::out_of_range>("row {} not allocated, builder has {} columns", row, _columns.size());
        }
        _columns[row].push_back(value);
    }

    block_s_ptr ColumnBlockBuilder::build() {
        auto block = std::make_shared<ColumnBlock>(std::move(_meta), std::move(_series_metas), std::move(_columns));
        _meta = {};
        _series_metas.clear();
        _columns.clear();
        return block;
    }

    block_s_ptr make_column_block(BlockMeta meta, std::vector<SeriesMeta> series_metas,
                                  const std::vector<std::vector<double>> &rows) {
        const auto width = series_metas.size();
        ColumnBlockBuilder builder{std::move(meta), std::move(series_metas)};
        builder.add_cols(rows.size());
        for (size_t row = 0; row < rows.size(); ++row) {
            if (rows[row].size() != width) {
                throw_error<std::invalid_argument>("row {} has {} values, expected one per series ({})",
                                                   row, rows[row].size(), width);
            }
            for (auto value: rows[row]) { builder.append_value(row, value); }
        }
        return builder.build();
    }

} // namespace tsexec
