/// \file weave.hpp
/// \brief Master include for the weave binding-generator core.
///
/// Including this single header brings in every weave namespace.
/// For finer-grained control, include the individual domain headers instead.

#ifndef WEAVE_WEAVE_HPP
#define WEAVE_WEAVE_HPP

#include <weave/error.hpp>
#include <weave/core.hpp>
#include <weave/diagnostics.hpp>
#include <weave/path.hpp>
#include <weave/type.hpp>
#include <weave/check.hpp>
#include <weave/item.hpp>
#include <weave/store.hpp>
#include <weave/check_driver.hpp>

#endif // WEAVE_WEAVE_HPP
