#ifndef TSEXEC_FUNCTIONS_LOGICAL_BASE_OP_H
#define TSEXEC_FUNCTIONS_LOGICAL_BASE_OP_H

#include <tsexec/functions/logical/vector_matching.h>
#include <tsexec/runtime/controller.h>

#include <functional>
#include <string>

namespace tsexec {

    /**
     * The single entry point shared by the binary operators: combine a left and right block into a new block.
     *
     * Implementations hold no state between calls, the only mutable state of a call lives on its stack, so a
     * processor may be shared by concurrent evaluations of independent block pairs. Failures are raised,
     * in which case no block is produced.
     */
    struct TSEXEC_EXPORT Processor {
        virtual ~Processor() = default;

        [[nodiscard]] virtual block_s_ptr process(const Block &lhs, const Block &rhs) const = 0;
    };

    using ProcessorFactory = std::function<processor_u_ptr(const BaseOp &, Controller &)>;

    /**
     * Describes a binary logical operator in the compiled graph: the kind of operator, the upstream nodes
     * supplying the left and right blocks, how series are matched, and how to construct its processor.
     *
     * Nothing is validated on construction, problems surface when the processor runs.
     */
    struct TSEXEC_EXPORT BaseOp {
        std::string operator_type;
        node_id_t lnode;
        node_id_t rnode;
        VectorMatching matching;
        ProcessorFactory processor_fn;

        [[nodiscard]] processor_u_ptr processor(Controller &controller) const;

        /**
         * Wrap the processor in a graph node that pairs the blocks arriving from lnode and rnode.
         */
        [[nodiscard]] logical_node_u_ptr node(Controller &controller) const;
    };

    /**
     * Graph node for a binary logical operator.
     *
     * Blocks arrive one at a time from the two upstream nodes; once both sides are present the processor
     * is run and the result is passed on through the controller. Both sides are released after every
     * evaluation, whether it succeeded or not.
     */
    struct TSEXEC_EXPORT LogicalNode final : OpNode {
        LogicalNode(BaseOp op, Controller &controller);

        void process(const node_id_t &id, block_s_ptr block) override;

        [[nodiscard]] const BaseOp &op() const { return _op; }

        [[nodiscard]] bool has_lhs() const { return _lhs != nullptr; }

        [[nodiscard]] bool has_rhs() const { return _rhs != nullptr; }

    private:
        void _evaluate();

        const BaseOp _op;
        Controller &_controller;
        processor_u_ptr _processor;
        block_s_ptr _lhs;
        block_s_ptr _rhs;
    };

} // namespace tsexec

#endif // TSEXEC_FUNCTIONS_LOGICAL_BASE_OP_H
