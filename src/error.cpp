/// \file error.cpp
/// \brief Error category names.

#include <weave/error.hpp>

namespace weave {

std::string_view category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation:      return "validation";
        case ErrorCategory::NotFound:        return "not found";
        case ErrorCategory::PathError:       return "path error";
        case ErrorCategory::PackageMismatch: return "package mismatch";
        case ErrorCategory::ConversionError: return "conversion error";
        case ErrorCategory::Internal:        return "internal";
    }
    return "unknown";
}

} // namespace weave
