#ifndef TSEXEC_FUNCTIONS_LOGICAL_VECTOR_MATCHING_H
#define TSEXEC_FUNCTIONS_LOGICAL_VECTOR_MATCHING_H

#include <tsexec/models/tags.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tsexec {

    enum class MatchingCardinality : uint8_t {
        ONE_TO_ONE = 0,
        MANY_TO_ONE = 1,
        ONE_TO_MANY = 2,
        MANY_TO_MANY = 3
    };

    TSEXEC_EXPORT std::string_view to_string(MatchingCardinality card);

    /**
     * Describes how series on the two sides of a binary operator are matched.
     *
     * When on is true only the matching_labels identify a series, otherwise every tag except the
     * matching_labels does. include lists the labels carried over from the "one" side for group_left and
     * group_right; the set operators do not use it.
     */
    struct TSEXEC_EXPORT VectorMatching {
        MatchingCardinality card{MatchingCardinality::ONE_TO_ONE};
        std::vector<std::string> matching_labels{};
        bool on{false};
        std::vector<std::string> include{};

        [[nodiscard]] std::string to_string() const;

        bool operator==(const VectorMatching &other) const = default;
    };

    using SignatureFunction = std::function<uint64_t(const Tags &)>;

    /**
     * Hash the identity of a tag set under a matching rule. The returned function is pure and never raises.
     */
    TSEXEC_EXPORT SignatureFunction signature_function(bool on, std::vector<std::string> labels);

    TSEXEC_EXPORT SignatureFunction signature_function(const VectorMatching &matching);

} // namespace tsexec

#endif // TSEXEC_FUNCTIONS_LOGICAL_VECTOR_MATCHING_H
