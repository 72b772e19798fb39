#include <tsexec/functions/logical/base_op.h>
#include <tsexec/runtime/observers/operator_trace.h>
#include <tsexec/util/errors.h>

namespace tsexec {

    namespace {
        // Empties both input slots on scope exit, the evaluation may have thrown
        struct SlotRelease {
            block_s_ptr &lhs;
            block_s_ptr &rhs;

            ~SlotRelease() {
                lhs.reset();
                rhs.reset();
            }
        };
    } // namespace

    processor_u_ptr BaseOp::processor(Controller &controller) const {
        if (!processor_fn) { throw_error<std::logic_error>("operator '{}' has no processor factory", operator_type); }
        return processor_fn(*this, controller);
    }

    logical_node_u_ptr BaseOp::node(Controller &controller) const {
        return std::make_unique<LogicalNode>(*this, controller);
    }

    LogicalNode::LogicalNode(BaseOp op, Controller &controller)
        : _op(std::move(op)), _controller(controller), _processor(_op.processor(controller)) {
    }

    void LogicalNode::process(const node_id_t &id, block_s_ptr block) {
        const bool is_lhs = id == _op.lnode;
        const bool is_rhs = id == _op.rnode;
        if (!is_lhs && !is_rhs) {
            throw_error<std::invalid_argument>("'{}' node received a block from unknown node '{}', expected '{}' or '{}'",
                                               _op.operator_type, id, _op.lnode, _op.rnode);
        }
        if (!block) {
            throw_error<std::invalid_argument>("'{}' node received a null block from '{}'", _op.operator_type, id);
        }
        if ((is_lhs && _lhs) || (is_rhs && _rhs)) {
            throw_error<std::logic_error>("'{}' node received a second block from '{}' before evaluating",
                                          _op.operator_type, id);
        }

        // The same upstream node may feed both sides, e.g. `a unless a`
        if (is_lhs) { _lhs = block; }
        if (is_rhs) { _rhs = std::move(block); }

        OperatorTrace::trace(_op.operator_type, _controller.id(), "block from {} (lhs: {}, rhs: {})", id, has_lhs(),
                             has_rhs());

        if (_lhs && _rhs) { _evaluate(); }
    }

    void LogicalNode::_evaluate() {
        SlotRelease release{_lhs, _rhs};
        auto result = _processor->process(*_lhs, *_rhs);
        _controller.process(result);
    }

} // namespace tsexec
