#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/vector.h>

#include <tsexec/functions/logical/logical_op_registry.h>
#include <tsexec/functions/logical/unless.h>
#include <tsexec/runtime/observers/operator_trace.h>

namespace nb = nanobind;
using namespace nb::literals;

void export_logical(nb::module_ &m) {
    using namespace tsexec;

    nb::enum_<MatchingCardinality>(m, "MatchingCardinality")
            .value("ONE_TO_ONE", MatchingCardinality::ONE_TO_ONE)
            .value("MANY_TO_ONE", MatchingCardinality::MANY_TO_ONE)
            .value("ONE_TO_MANY", MatchingCardinality::ONE_TO_MANY)
            .value("MANY_TO_MANY", MatchingCardinality::MANY_TO_MANY)
            .export_values();

    nb::class_<VectorMatching>(m, "VectorMatching")
            .def("__init__", [](VectorMatching *self, MatchingCardinality card, std::vector<std::string> matching_labels,
                                bool on, std::vector<std::string> include) {
                new (self) VectorMatching{card, std::move(matching_labels), on, std::move(include)};
            }, "card"_a = MatchingCardinality::ONE_TO_ONE, "matching_labels"_a = std::vector<std::string>{},
            "on"_a = false, "include"_a = std::vector<std::string>{})
            .def_ro("card", &VectorMatching::card)
            .def_ro("matching_labels", &VectorMatching::matching_labels)
            .def_ro("on", &VectorMatching::on)
            .def_ro("include", &VectorMatching::include)
            .def("signature", [](const VectorMatching &self, const Tags &tags) {
                return signature_function(self)(tags);
            }, "tags"_a)
            .def(nb::self == nb::self)
            .def("__repr__", &VectorMatching::to_string);

    nb::class_<Controller>(m, "Controller")
            .def(nb::init<node_id_t>(), "id"_a)
            .def_prop_ro("id", &Controller::id);

    nb::class_<Processor>(m, "Processor")
            .def("process", [](const Processor &self, const Block &lhs, const Block &rhs) {
                return self.process(lhs, rhs);
            }, "lhs"_a, "rhs"_a);

    nb::class_<BaseOp>(m, "BaseOp")
            .def_ro("operator_type", &BaseOp::operator_type)
            .def_ro("lnode", &BaseOp::lnode)
            .def_ro("rnode", &BaseOp::rnode)
            .def_ro("matching", &BaseOp::matching)
            .def("processor", &BaseOp::processor, "controller"_a, nb::keep_alive<0, 2>());

    m.def("make_op", [](const std::string &type, node_id_t lnode, node_id_t rnode, VectorMatching matching) {
              return LogicalOpRegistry::global().make_op(type, std::move(lnode), std::move(rnode),
                                                         std::move(matching));
          }, "type"_a, "lnode"_a, "rnode"_a, "matching"_a,
          "Construct a registered logical operator by type, e.g. 'unless'.");

    m.def("logical_op_types", [] { return LogicalOpRegistry::global().types(); });

    m.def("unless", [](const Block &lhs, const Block &rhs, const VectorMatching &matching) {
              Controller controller{std::string{UNLESS_TYPE}};
              return UnlessNode{make_unless_op("lhs", "rhs", matching), controller}.process(lhs, rhs);
          }, "lhs"_a, "rhs"_a, "matching"_a = VectorMatching{},
          "Series of lhs with no matching series in rhs.");

    m.def("set_trace", [](bool enabled, std::optional<std::string> filter, bool use_logger) {
              OperatorTrace::set_enabled(enabled);
              OperatorTrace::set_filter(std::move(filter));
              OperatorTrace::set_use_logger(use_logger);
          }, "enabled"_a, "filter"_a = nb::none(), "use_logger"_a = true,
          "Trace operator processing to stderr (stdout when use_logger is False).");
}
