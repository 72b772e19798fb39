#pragma once

#include <tsexec/tsexec_base.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tsexec {

    /**
     * @brief Logs out the steps operators take as they process blocks.
     *
     * This is voluminous but can be helpful tracing down unexpected results, such as series dropped by a
     * set operator. Tracing is off by default and is configured process wide. The settings may be changed while
 * operators are running on other threads.
     */
    class TSEXEC_EXPORT OperatorTrace {
    public:
        static void set_enabled(bool value);

        [[nodiscard]] static bool enabled();

        // To use stdout instead of stderr set this to false.
        static void set_use_logger(bool value);

        /**
         * @brief Restrict output to operators whose "<type>:<node id>" contains filter (substring match).
         */
        static void set_filter(std::optional<std::string> filter);

        template<typename... Ts>
        static void trace(std::string_view operator_type, const node_id_t &id,
                          fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            if (!_should_log(operator_type, id)) { return; }
            _print(operator_type, id, fmt::format(fmt_str, std::forward<Ts>(xs)...));
        }

    private:
        static std::atomic<bool> _enabled;
        static std::atomic<bool> _use_logger;
        static std::mutex _filter_mutex;
        static std::optional<std::string> _filter;

        static bool _should_log(std::string_view operator_type, const node_id_t &id);

        static void _print(std::string_view operator_type, const node_id_t &id, const std::string &msg);
    };

} // namespace tsexec
