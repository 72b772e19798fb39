#include <tsexec/functions/logical/logical_op_registry.h>
#include <tsexec/functions/logical/unless.h>
#include <tsexec/util/errors.h>

#include <algorithm>

namespace tsexec {

    LogicalOpRegistry &LogicalOpRegistry::global() {
        static LogicalOpRegistry registry;
        static std::once_flag builtins;
        std::call_once(builtins, [] { registry.register_op(std::string{UNLESS_TYPE}, &make_unless_op); });
        return registry;
    }

    bool LogicalOpRegistry::register_op(std::string type, OpFactory factory) {
        if (!factory) { throw_error<std::invalid_argument>("no factory supplied for operator '{}'", type); }
        std::lock_guard<std::mutex> lock(_mutex);
        return _factories.emplace(std::move(type), std::move(factory)).second;
    }

    BaseOp LogicalOpRegistry::make_op(std::string_view type, node_id_t lnode, node_id_t rnode,
                                      VectorMatching matching) const {
        OpFactory factory;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _factories.find(std::string{type});
            if (it == _factories.end()) { throw_error<std::invalid_argument>("unknown logical operator '{}'", type); }
            factory = it->second;
        }
        return factory(std::move(lnode), std::move(rnode), std::move(matching));
    }

    bool LogicalOpRegistry::contains(std::string_view type) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _factories.contains(std::string{type});
    }

    std::vector<std::string> LogicalOpRegistry::types() const {
        std::vector<std::string> result;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            result.reserve(_factories.size());
            for (const auto &[type, _]: _factories) { result.push_back(type); }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

} // namespace tsexec
