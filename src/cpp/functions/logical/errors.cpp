#include <tsexec/functions/logical/errors.h>

namespace tsexec {

    MismatchedBoundsError::MismatchedBoundsError(const Bounds &lhs_, const Bounds &rhs_)
        : LogicalOpError(fmt::format("block bounds are mismatched: {} != {}", lhs_.to_string(), rhs_.to_string())),
          lhs(lhs_), rhs(rhs_) {
    }

    MismatchedStepCountsError::MismatchedStepCountsError(size_t lhs_steps_, size_t rhs_steps_)
        : LogicalOpError(fmt::format("block step counts are mismatched: {} != {}", lhs_steps_, rhs_steps_)),
          lhs_steps(lhs_steps_), rhs_steps(rhs_steps_) {
    }

    ConflictingTagsError::ConflictingTagsError(const std::string &detail)
        : LogicalOpError(detail.empty() ? std::string{"block tags conflict"}
                                        : fmt::format("block tags conflict: {}", detail)) {
    }

} // namespace tsexec
