/**
 * @file test_operator_trace.cpp
 * @brief Unit tests for OperatorTrace.
 */

#include <catch2/catch_test_macros.hpp>
#include <tsexec/runtime/observers/operator_trace.h>

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace tsexec;

namespace {

// Captures std::cout for the lifetime of the object
struct CoutCapture {
    CoutCapture() : previous(std::cout.rdbuf(buffer.rdbuf())) {}

    ~CoutCapture() { std::cout.rdbuf(previous); }

    std::ostringstream buffer;
    std::streambuf *previous;
};

struct TraceSettings {
    TraceSettings() {
        OperatorTrace::set_enabled(true);
        OperatorTrace::set_use_logger(false);
    }

    ~TraceSettings() {
        OperatorTrace::set_enabled(false);
        OperatorTrace::set_use_logger(true);
        OperatorTrace::set_filter(std::nullopt);
    }
};

}  // namespace

TEST_CASE("OperatorTrace - disabled by default", "[runtime][trace]") {
    CHECK_FALSE(OperatorTrace::enabled());
    CoutCapture capture;
    OperatorTrace::set_use_logger(false);
    OperatorTrace::trace("unless", "n1", "kept {} series", 3);
    OperatorTrace::set_use_logger(true);
    CHECK(capture.buffer.str().empty());
}

TEST_CASE("OperatorTrace - formats operator, node and message", "[runtime][trace]") {
    TraceSettings settings;
    CoutCapture capture;

    OperatorTrace::trace("unless", "n1", "kept {} of {} series", 2, 5);

    auto out = capture.buffer.str();
    CHECK(out.find("[unless:n1] kept 2 of 5 series") != std::string::npos);
    CHECK(out.back() == '\n');
}

TEST_CASE("OperatorTrace - filter restricts output", "[runtime][trace]") {
    TraceSettings settings;
    OperatorTrace::set_filter("unless:keep");
    CoutCapture capture;

    OperatorTrace::trace("unless", "keep_me", "first");
    OperatorTrace::trace("unless", "other", "second");

    auto out = capture.buffer.str();
    CHECK(out.find("first") != std::string::npos);
    CHECK(out.find("second") == std::string::npos);
}

TEST_CASE("OperatorTrace - settings change while another thread traces", "[runtime][trace]") {
    TraceSettings settings;
    CoutCapture capture;
    std::atomic<bool> done{false};

    std::thread tracer([&done] {
        for (int i = 0; !done.load(); ++i) { OperatorTrace::trace("unless", "n1", "step {}", i); }
    });

    for (int i = 0; i < 500; ++i) {
        OperatorTrace::set_filter(i % 2 == 0 ? std::optional<std::string>{"unless:n1"}
                                             : std::optional<std::string>{"unless:other"});
        OperatorTrace::set_enabled(i % 3 != 0);
    }
    done = true;
    tracer.join();

    OperatorTrace::set_enabled(false);
    CHECK_FALSE(OperatorTrace::enabled());

    std::istringstream lines(capture.buffer.str());
    for (std::string line; std::getline(lines, line);) {
        CHECK(line.find("[unless:n1] step ") != std::string::npos);
    }
}
