/*
 * The entry point into the python _tsexec module exposing the block and operator types to python.
 *
 * Blocks are handed to python as shared pointers, processors and nodes keep their controller alive through
 * keep_alive annotations, as the C++ side only holds a reference to it.
 */
#include <nanobind/nanobind.h>

#include <tsexec/functions/logical/errors.h>

namespace nb = nanobind;

void export_block(nb::module_ &);

void export_logical(nb::module_ &);

NB_MODULE(_tsexec, m) {
    m.doc() = "The tsexec block operators";

    // Failed operator preconditions surface as ValueError, carrying the operator's message
    nb::register_exception_translator([](const std::exception_ptr &p, void *) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const tsexec::LogicalOpError &e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    }, nullptr);

    export_block(m);
    export_logical(m);
}
