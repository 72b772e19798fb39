#ifndef TSEXEC_FUNCTIONS_LOGICAL_UNLESS_H
#define TSEXEC_FUNCTIONS_LOGICAL_UNLESS_H

#include <tsexec/functions/logical/base_op.h>

#include <string_view>
#include <vector>

namespace tsexec {

    // Keeps the series of the lhs which have no match in the rhs
    inline constexpr std::string_view UNLESS_TYPE{"unless"};

    TSEXEC_EXPORT BaseOp make_unless_op(node_id_t lnode, node_id_t rnode, VectorMatching matching);

    TSEXEC_EXPORT processor_u_ptr make_unless_node(const BaseOp &op, Controller &controller);

    /**
     * Indices into lhs of the series whose signature appears nowhere in rhs, in ascending order.
     *
     * Series are keyed by signature, so when two lhs series share a signature only the later one is
     * considered; the earlier one is dropped even if nothing in rhs matches it.
     */
    TSEXEC_EXPORT std::vector<size_t> exclusion(const std::vector<SeriesMeta> &lhs,
                                                const std::vector<SeriesMeta> &rhs,
                                                const SignatureFunction &signature_fn);

    /**
     * Processor for the unless operator.
     *
     * process() checks the two blocks have the same number of steps, raising MismatchedStepCountsError
     * otherwise, then streams the values of the surviving lhs series, in their original order, into a
     * builder obtained from the controller. Errors raised by the iterators, the controller or the builder
     * are propagated untouched and no block is returned.
     */
    struct TSEXEC_EXPORT UnlessNode final : Processor {
        UnlessNode(BaseOp op, Controller &controller);

        [[nodiscard]] block_s_ptr process(const Block &lhs, const Block &rhs) const override;

        [[nodiscard]] const BaseOp &op() const { return _op; }

    private:
        const BaseOp _op;
        Controller &_controller;
        const SignatureFunction _signature_fn;
    };

} // namespace tsexec

#endif // TSEXEC_FUNCTIONS_LOGICAL_UNLESS_H
