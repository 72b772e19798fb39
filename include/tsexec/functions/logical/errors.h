#ifndef TSEXEC_FUNCTIONS_LOGICAL_ERRORS_H
#define TSEXEC_FUNCTIONS_LOGICAL_ERRORS_H

#include <tsexec/block/block.h>

#include <stdexcept>
#include <string>

namespace tsexec {

    /**
     * Base of the preconditions a logical operator checks on its input blocks.
     */
    struct TSEXEC_EXPORT LogicalOpError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Not raised by the operators yet, reserved for a bounds check ahead of processing.
    struct TSEXEC_EXPORT MismatchedBoundsError : LogicalOpError {
        MismatchedBoundsError(const Bounds &lhs, const Bounds &rhs);

        Bounds lhs;
        Bounds rhs;
    };

    struct TSEXEC_EXPORT MismatchedStepCountsError : LogicalOpError {
        MismatchedStepCountsError(size_t lhs_steps, size_t rhs_steps);

        size_t lhs_steps;
        size_t rhs_steps;
    };

    // Not raised by the operators yet, reserved for a tag validation step.
    struct TSEXEC_EXPORT ConflictingTagsError : LogicalOpError {
        explicit ConflictingTagsError(const std::string &detail = {});
    };

} // namespace tsexec

#endif // TSEXEC_FUNCTIONS_LOGICAL_ERRORS_H
