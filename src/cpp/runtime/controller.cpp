#include <tsexec/runtime/controller.h>
#include <tsexec/block/column_block.h>

namespace tsexec {

    Controller::Controller(node_id_t id) : _id(std::move(id)) {}

    void Controller::add_transform(OpNode &node) { _transforms.push_back(&node); }

    void Controller::process(const block_s_ptr &block) {
        for (auto *transform: _transforms) { transform->process(_id, block); }
    }

    builder_u_ptr Controller::block_builder(const BlockMeta &meta, const std::vector<SeriesMeta> &series_metas) {
        return std::make_unique<ColumnBlockBuilder>(meta, series_metas);
    }

} // namespace tsexec
