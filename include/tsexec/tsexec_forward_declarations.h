#ifndef TSEXEC_FORWARD_DECLARATIONS_H
#define TSEXEC_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>
#include <tsexec/util/date_time.h>

namespace tsexec {
    // Identifies a node in the execution graph, assigned by the planner.
    using node_id_t = std::string;

    struct Tag;
    struct Tags;

    struct Bounds;
    struct BlockMeta;
    struct SeriesMeta;
    struct Step;

    // StepIter - owned by the caller that opened it
    struct StepIter;
    using step_iter_u_ptr = std::unique_ptr<StepIter>;

    // Block - immutable once built, shared between downstream consumers
    struct Block;
    using block_s_ptr = std::shared_ptr<Block>;

    // Builder - owned by the processor requesting it
    struct Builder;
    using builder_u_ptr = std::unique_ptr<Builder>;

    struct ColumnBlock;
    struct ColumnBlockBuilder;

    // Controller - owned by the host graph, processors only keep a reference
    struct Controller;

    struct OpNode;
    using op_node_ptr = OpNode*;

    struct VectorMatching;
    struct BaseOp;

    struct Processor;
    using processor_u_ptr = std::unique_ptr<Processor>;

    struct LogicalNode;
    using logical_node_u_ptr = std::unique_ptr<LogicalNode>;

    struct UnlessNode;
} // namespace tsexec

#endif // TSEXEC_FORWARD_DECLARATIONS_H
