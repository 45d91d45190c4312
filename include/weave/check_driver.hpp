/// \file check_driver.hpp
/// \brief Runs every FFI item against every registered environment and
///        records the outcomes in the items' ledgers.
///
/// Building and running the generated wrappers is delegated to an Evaluator
/// supplied by the caller. A failing evaluation is recorded as an error
/// message; it never aborts the run.

#ifndef WEAVE_CHECK_DRIVER_HPP
#define WEAVE_CHECK_DRIVER_HPP

#include <weave/check.hpp>
#include <weave/core.hpp>
#include <weave/error.hpp>
#include <weave/item.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace weave::store {
class Store;
}

namespace weave::check {

/// Returns the failure message, or nothing if the wrapper works in the
/// given environment. May be called from several threads at once.
using Evaluator = std::function<std::optional<std::string>(const item::FfiItem&,
                                                           const Environment&)>;

struct RunReport {
    std::size_t items_checked{0};
    std::size_t added{0};
    std::size_t changed{0};
    std::size_t unchanged{0};
    std::size_t regressions{0};  ///< Passed before, fails now.
    std::size_t fixes{0};        ///< Failed before, passes now.
};

Result<RunReport> run(store::Store& store, const Evaluator& evaluator,
                      const CheckOptions& options = {});

} // namespace weave::check

#endif // WEAVE_CHECK_DRIVER_HPP
