/*
 * The core imports for tsexec. Use this to ensure the correct import order can be maintained.
 */

#ifndef TSEXEC_BASE_H
#define TSEXEC_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <tsexec/tsexec_export.h>
#include <tsexec/tsexec_forward_declarations.h>
#include <tsexec/util/date_time.h>

#endif //TSEXEC_BASE_H
