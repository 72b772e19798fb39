#ifndef TSEXEC_LOGICAL_OP_REGISTRY_H
#define TSEXEC_LOGICAL_OP_REGISTRY_H

#include <tsexec/functions/logical/base_op.h>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsexec {

    using OpFactory = std::function<BaseOp(node_id_t, node_id_t, VectorMatching)>;

    /**
     * LogicalOpRegistry - Central registry of the binary logical operators, keyed by operator type
     *
     * Provides:
     * - Registration of an operator factory by type
     * - Construction of an operator descriptor by type
     * - Thread-safe registration and lookup
     *
     * Usage:
     *   auto& registry = LogicalOpRegistry::global();
     *   BaseOp op = registry.make_op("unless", "lhs", "rhs", matching);
     *   auto processor = op.processor(controller);
     */
    class TSEXEC_EXPORT LogicalOpRegistry {
    public:
        /**
         * Get the global singleton instance, with the built-in operators registered
         */
        static LogicalOpRegistry &global();

        /**
         * Register factory for type, returns false (keeping the existing factory) if type is already registered
         */
        bool register_op(std::string type, OpFactory factory);

        /**
         * Raises std::invalid_argument if type is not registered
         */
        [[nodiscard]] BaseOp make_op(std::string_view type, node_id_t lnode, node_id_t rnode,
                                     VectorMatching matching) const;

        [[nodiscard]] bool contains(std::string_view type) const;

        /**
         * Registered types, sorted
         */
        [[nodiscard]] std::vector<std::string> types() const;

    private:
        LogicalOpRegistry() = default;

        mutable std::mutex _mutex;
        std::unordered_map<std::string, OpFactory> _factories;
    };

} // namespace tsexec

#endif // TSEXEC_LOGICAL_OP_REGISTRY_H
