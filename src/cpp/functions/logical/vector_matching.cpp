#include <tsexec/functions/logical/vector_matching.h>

namespace tsexec {

    std::string_view to_string(MatchingCardinality card) {
        switch (card) {
            case MatchingCardinality::ONE_TO_ONE: return "one-to-one";
            case MatchingCardinality::MANY_TO_ONE: return "many-to-one";
            case MatchingCardinality::ONE_TO_MANY: return "one-to-many";
            case MatchingCardinality::MANY_TO_MANY: return "many-to-many";
        }
        return "unknown";
    }

    std::string VectorMatching::to_string() const {
        return fmt::format("{} {}({}) include({})", tsexec::to_string(card), on ? "on" : "ignoring",
                           fmt::join(matching_labels, ", "), fmt::join(include, ", "));
    }

    SignatureFunction signature_function(bool on, std::vector<std::string> labels) {
        if (on) {
            return [labels = std::move(labels)](const Tags &tags) { return tags.tags_with_keys(labels).id(); };
        }
        return [labels = std::move(labels)](const Tags &tags) { return tags.tags_without_keys(labels).id(); };
    }

    SignatureFunction signature_function(const VectorMatching &matching) {
        return signature_function(matching.on, matching.matching_labels);
    }

} // namespace tsexec
