#ifndef TSEXEC_BLOCK_COLUMN_BLOCK_H
#define TSEXEC_BLOCK_COLUMN_BLOCK_H

#include <tsexec/block/block.h>

#include <vector>

namespace tsexec {

    /**
     * In-memory block stored column-wise: one column per step, each holding a value per series.
     */
    struct TSEXEC_EXPORT ColumnBlock final : Block {
        using column_type = std::vector<double>;

        ColumnBlock(BlockMeta meta, std::vector<SeriesMeta> series_metas, std::vector<column_type> columns);

        [[nodiscard]] step_iter_u_ptr step_iter() const override;

        [[nodiscard]] const BlockMeta &meta() const { return _meta; }

        [[nodiscard]] const std::vector<SeriesMeta> &series_metas() const { return _series_metas; }

        [[nodiscard]] const std::vector<column_type> &columns() const { return _columns; }

        [[nodiscard]] size_t step_count() const { return _columns.size(); }

    private:
        BlockMeta _meta;
        std::vector<SeriesMeta> _series_metas;
        std::vector<column_type> _columns;
    };

    struct TSEXEC_EXPORT ColumnBlockBuilder final : Builder {
        ColumnBlockBuilder(BlockMeta meta, std::vector<SeriesMeta> series_metas);

        void add_cols(size_t count) override;

        /**
         * Raises std::out_of_range if row has not been allocated with add_cols.
         */
        void append_value(size_t row, double value) override;

        /**
         * Moves the accumulated columns into a new block, leaving the builder empty.
         */
        [[nodiscard]] block_s_ptr build() override;

    private:
        BlockMeta _meta;
        std::vector<SeriesMeta> _series_metas;
        std::vector<ColumnBlock::column_type> _columns;
    };

    /**
     * Build a column block from rows, one row per step. Each row must hold exactly one value per series.
     */
    TSEXEC_EXPORT block_s_ptr make_column_block(BlockMeta meta, std::vector<SeriesMeta> series_metas,
                                                const std::vector<std::vector<double>> &rows);

} // namespace tsexec

#endif // TSEXEC_BLOCK_COLUMN_BLOCK_H
