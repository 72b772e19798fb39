#include <tsexec/runtime/observers/operator_trace.h>

#include <iostream>

namespace tsexec {

    std::atomic<bool> OperatorTrace::_enabled{false};
    std::atomic<bool> OperatorTrace::_use_logger{true};
    std::mutex OperatorTrace::_filter_mutex;
    std::optional<std::string> OperatorTrace::_filter{};

    void OperatorTrace::set_enabled(bool value) { _enabled.store(value, std::memory_order_relaxed); }

    bool OperatorTrace::enabled() { return _enabled.load(std::memory_order_relaxed); }

    void OperatorTrace::set_use_logger(bool value) { _use_logger.store(value, std::memory_order_relaxed); }

    void OperatorTrace::set_filter(std::optional<std::string> filter) {
        std::lock_guard<std::mutex> lock(_filter_mutex);
        _filter = std::move(filter);
    }

    bool OperatorTrace::_should_log(std::string_view operator_type, const node_id_t &id) {
        if (!enabled()) { return false; }
        std::lock_guard<std::mutex> lock(_filter_mutex);
        if (!_filter.has_value()) { return true; }
        return fmt::format("{}:{}", operator_type, id).find(_filter.value()) != std::string::npos;
    }

    void OperatorTrace::_print(std::string_view operator_type, const node_id_t &id, const std::string &msg) {
        auto now = std::chrono::time_point_cast<engine_time_delta_t>(engine_clock::now());
        std::string formatted = fmt::format("[{}] [{}:{}] {}", to_micros(now), operator_type, id, msg);
        if (_use_logger.load(std::memory_order_relaxed)) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

} // namespace tsexec
