#ifndef TSEXEC_RUNTIME_CONTROLLER_H
#define TSEXEC_RUNTIME_CONTROLLER_H

#include <tsexec/block/block.h>

#include <vector>

namespace tsexec {

    /**
     * A node in the execution graph that consumes blocks. The id identifies the upstream node the block came from.
     */
    struct TSEXEC_EXPORT OpNode {
        virtual ~OpNode() = default;

        virtual void process(const node_id_t &id, block_s_ptr block) = 0;
    };

    /**
     * The execution handle the host graph gives to each operator.
     *
     * It hands out builders for new blocks and forwards finished blocks to the downstream nodes registered
     * with add_transform. Downstream nodes are not owned, the graph keeps them alive.
     */
    struct TSEXEC_EXPORT Controller {
        explicit Controller(node_id_t id);

        virtual ~Controller() = default;

        Controller(const Controller &) = delete;

        Controller &operator=(const Controller &) = delete;

        [[nodiscard]] const node_id_t &id() const { return _id; }

        void add_transform(OpNode &node);

        [[nodiscard]] size_t transform_count() const { return _transforms.size(); }

        /**
         * Pass block on to every downstream node, tagged with this controller's id.
         */
        void process(const block_s_ptr &block);

        /**
         * Create a builder seeded with the block metadata and the series of the new block.
         * The default builds in-memory column blocks.
         */
        [[nodiscard]] virtual builder_u_ptr block_builder(const BlockMeta &meta,
                                                          const std::vector<SeriesMeta> &series_metas);

    private:
        node_id_t _id;
        std::vector<op_node_ptr> _transforms;
    };

} // namespace tsexec

#endif // TSEXEC_RUNTIME_CONTROLLER_H
