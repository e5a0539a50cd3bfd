#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coop_catalog {

/// Closed set of reasons a product field can be rejected.
enum class ValidationReason {
    Missing,
    WrongType,
    Blank,              // name is empty after trimming
    TooShort,
    TooLong,
    InvalidNumber,
    NotPositive,
    TooManyDigits,
    TooFewItems,
    TooManyItems,
    NoValidCategory,    // every category was blank
    DuplicateCategory,
    UnknownCategory
};

/// Machine-readable code for a reason, e.g. "string_too_short".
const char* reasonCode(ValidationReason reason);

/// One rejected field.
struct FieldError {
    std::string              field;     // wire name: "nombre", "precio", "categorias"
    ValidationReason         reason;
    std::string              message;
    std::vector<std::string> values;    // offending labels for UnknownCategory
};

/// Either the normalized fields or the errors that prevented them.
struct ValidationResult {
    std::optional<ProductFields> value;
    std::vector<FieldError>      errors;

    bool ok() const { return errors.empty(); }
};

/// Validate and normalize a submitted product.
/// Each field reports at most its first failure; every failing field is
/// reported.  Pure: depends only on @p input and the fixed catalog.
ValidationResult validateProduct(const ProductInput& input);

} // namespace coop_catalog
