#include <tsexec/functions/logical/errors.h>
#include <tsexec/functions/logical/unless.h>
#include <tsexec/runtime/observers/operator_trace.h>
#include <tsexec/util/errors.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>

namespace tsexec {

    namespace {
        // Marks a signature present on both sides
        constexpr int64_t EXCLUDED = -1;

        void add_values_at_indices(const std::vector<size_t> &indices, StepIter &iter, Builder &builder) {
            for (size_t row = 0; iter.next(); ++row) {
                const auto &values = iter.current().values();
                for (auto idx: indices) { builder.append_value(row, values.at(idx)); }
            }
        }
    } // namespace

    BaseOp make_unless_op(node_id_t lnode, node_id_t rnode, VectorMatching matching) {
        return BaseOp{
            .operator_type = std::string{UNLESS_TYPE},
            .lnode = std::move(lnode),
            .rnode = std::move(rnode),
            .matching = std::move(matching),
            .processor_fn = &make_unless_node,
        };
    }

    processor_u_ptr make_unless_node(const BaseOp &op, Controller &controller) {
        return std::make_unique<UnlessNode>(op, controller);
    }

    std::vector<size_t> exclusion(const std::vector<SeriesMeta> &lhs, const std::vector<SeriesMeta> &rhs,
                                  const SignatureFunction &signature_fn) {
        ankerl::unordered_dense::map<uint64_t, int64_t> left_sigs;
        left_sigs.reserve(lhs.size());
        for (size_t idx = 0; idx < lhs.size(); ++idx) {
            left_sigs[signature_fn(lhs[idx].tags)] = static_cast<int64_t>(idx);
        }

        for (const auto &rs: rhs) {
            if (auto it = left_sigs.find(signature_fn(rs.tags)); it != left_sigs.end()) { it->second = EXCLUDED; }
        }

        std::vector<size_t> unique_left;
        unique_left.reserve(left_sigs.size());
        for (const auto &[sig, idx]: left_sigs) {
            if (idx != EXCLUDED) { unique_left.push_back(static_cast<size_t>(idx)); }
        }
        // Map iteration order is not part of the contract, the output order is
        std::sort(unique_left.begin(), unique_left.end());
        return unique_left;
    }

    UnlessNode::UnlessNode(BaseOp op, Controller &controller)
        : _op(std::move(op)), _controller(controller), _signature_fn(signature_function(_op.matching)) {
    }

    block_s_ptr UnlessNode::process(const Block &lhs, const Block &rhs) const {
        auto l_iter = lhs.step_iter();
        if (!l_iter) { throw_error("lhs block did not provide a step iterator"); }
        auto r_iter = rhs.step_iter();
        if (!r_iter) { throw_error("rhs block did not provide a step iterator"); }

        if (l_iter->step_count() != r_iter->step_count()) {
            throw_error<MismatchedStepCountsError>(l_iter->step_count(), r_iter->step_count());
        }

        const auto &l_series_metas = l_iter->series_metas();
        const auto &r_series_metas = r_iter->series_metas();
        auto l_ids = exclusion(l_series_metas, r_series_metas, _signature_fn);

        std::vector<SeriesMeta> taken_metas;
        taken_metas.reserve(l_ids.size());
        for (auto idx: l_ids) { taken_metas.push_back(l_series_metas[idx]); }

        OperatorTrace::trace(_op.operator_type, _controller.id(), "kept {} of {} lhs series against {} rhs series",
                             l_ids.size(), l_series_metas.size(), r_series_metas.size());

        auto builder = _controller.block_builder(l_iter->meta(), taken_metas);
        if (!builder) { throw_error("controller did not provide a block builder"); }
        builder->add_cols(l_iter->step_count());
        add_values_at_indices(l_ids, *l_iter, *builder);
        return builder->build();
    }

} // namespace tsexec
