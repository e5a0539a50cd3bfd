#include "validation.hpp"
#include "catalog.hpp"
#include "util.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace coop_catalog {

namespace {

constexpr std::size_t kNameMinLength = 3;
constexpr std::size_t kNameMaxLength = 60;
constexpr int64_t     kPriceMaxDigits = 10;

const char* const kNameField       = "nombre";
const char* const kPriceField      = "precio";
const char* const kCategoriesField = "categorias";

FieldError makeError(const char* field, ValidationReason reason, std::string message) {
    return FieldError{field, reason, std::move(message), {}};
}

std::string joinQuoted(const std::vector<std::string>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + values[i] + "'";
    }
    return out + "]";
}

// ---------------------------------------------------------------------------
// Per-field rules.  Each returns the first failure, or fills @p out.
// ---------------------------------------------------------------------------

std::optional<FieldError> checkName(const ProductInput& input, std::string& out) {
    if (input.nameState == FieldState::Missing) {
        return makeError(kNameField, ValidationReason::Missing, "Campo requerido");
    }
    if (input.nameState == FieldState::Malformed) {
        return makeError(kNameField, ValidationReason::WrongType,
                         "El nombre debe ser texto");
    }

    const std::string name = trim(input.name);
    if (name.empty()) {
        return makeError(kNameField, ValidationReason::Blank,
                         "El nombre no puede estar vacío");
    }

    const std::size_t length = utf8Length(name);
    if (length < kNameMinLength) {
        return makeError(kNameField, ValidationReason::TooShort,
                         "El nombre debe tener al menos " +
                         std::to_string(kNameMinLength) + " caracteres");
    }
    if (length > kNameMaxLength) {
        return makeError(kNameField, ValidationReason::TooLong,
                         "El nombre debe tener como máximo " +
                         std::to_string(kNameMaxLength) + " caracteres");
    }

    out = name;
    return std::nullopt;
}

std::optional<FieldError> checkPrice(const ProductInput& input, Money& out) {
    if (input.priceState == FieldState::Missing) {
        return makeError(kPriceField, ValidationReason::Missing, "Campo requerido");
    }
    if (input.priceState == FieldState::Malformed) {
        return makeError(kPriceField, ValidationReason::WrongType,
                         "El precio debe ser un número o texto decimal");
    }

    DecimalNumber number;
    try {
        number = parseDecimal(input.price);
    } catch (const std::invalid_argument&) {
        return makeError(kPriceField, ValidationReason::InvalidNumber,
                         "El precio no es un número decimal válido");
    }

    if (number.isZero() || number.isNegative()) {
        return makeError(kPriceField, ValidationReason::NotPositive,
                         "El precio debe ser mayor que 0");
    }
    if (number.significantDigits() > kPriceMaxDigits) {
        return makeError(kPriceField, ValidationReason::TooManyDigits,
                         "El precio no debe tener más de " +
                         std::to_string(kPriceMaxDigits) + " dígitos en total");
    }

    // At most 10 digits, so the cents value always fits.
    const Money rounded = number.roundToCents();
    if (rounded.cents() <= 0) {
        return makeError(kPriceField, ValidationReason::NotPositive,
                         "El precio debe ser mayor que 0");
    }

    out = rounded;
    return std::nullopt;
}

std::optional<FieldError> checkCategories(const ProductInput& input,
                                          std::vector<std::string>& out) {
    if (input.categoriesState == FieldState::Missing) {
        return makeError(kCategoriesField, ValidationReason::Missing, "Campo requerido");
    }
    if (input.categoriesState == FieldState::Malformed) {
        return makeError(kCategoriesField, ValidationReason::WrongType,
                         "Las categorías deben ser una lista de textos");
    }

    // Length bounds apply to the raw list, before blank entries are dropped.
    const auto& raw = input.categories;
    if (raw.empty()) {
        return makeError(kCategoriesField, ValidationReason::TooFewItems,
                         "Debe incluir al menos 1 categoría");
    }
    if (raw.size() > catalog::kMaxCategories) {
        return makeError(kCategoriesField, ValidationReason::TooManyItems,
                         "No puede incluir más de " +
                         std::to_string(catalog::kMaxCategories) + " categorías");
    }

    std::vector<std::string> normalized;
    for (const auto& entry : raw) {
        std::string label = toLower(trim(entry));
        if (!label.empty()) {
            normalized.push_back(std::move(label));
        }
    }
    if (normalized.empty()) {
        return makeError(kCategoriesField, ValidationReason::NoValidCategory,
                         "Debe incluir al menos una categoría válida");
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> repeated;
    for (const auto& label : normalized) {
        if (!seen.insert(label).second &&
            std::find(repeated.begin(), repeated.end(), label) == repeated.end()) {
            repeated.push_back(label);
        }
    }
    if (!repeated.empty()) {
        FieldError err = makeError(kCategoriesField, ValidationReason::DuplicateCategory,
                                   "Las categorías no deben repetirse");
        err.values = repeated;
        return err;
    }

    std::vector<std::string> unknown;
    std::copy_if(normalized.begin(), normalized.end(), std::back_inserter(unknown),
                 [](const std::string& label) { return !catalog::isAllowed(label); });
    if (!unknown.empty()) {
        FieldError err = makeError(kCategoriesField, ValidationReason::UnknownCategory,
                                   "Categorías no permitidas: " + joinQuoted(unknown));
        err.values = unknown;
        return err;
    }

    out = std::move(normalized);
    return std::nullopt;
}

} // namespace

const char* reasonCode(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::Missing:           return "missing";
        case ValidationReason::WrongType:         return "type_error";
        case ValidationReason::Blank:             return "string_blank";
        case ValidationReason::TooShort:          return "string_too_short";
        case ValidationReason::TooLong:           return "string_too_long";
        case ValidationReason::InvalidNumber:     return "decimal_parsing";
        case ValidationReason::NotPositive:       return "greater_than";
        case ValidationReason::TooManyDigits:     return "decimal_max_digits";
        case ValidationReason::TooFewItems:       return "too_short";
        case ValidationReason::TooManyItems:      return "too_long";
        case ValidationReason::NoValidCategory:   return "categories_empty";
        case ValidationReason::DuplicateCategory: return "categories_duplicated";
        case ValidationReason::UnknownCategory:   return "categories_unknown";
    }
    return "value_error";
}

ValidationResult validateProduct(const ProductInput& input) {
    ValidationResult result;
    ProductFields fields;

    if (auto err = checkName(input, fields.name)) {
        result.errors.push_back(std::move(*err));
    }
    if (auto err = checkPrice(input, fields.price)) {
        result.errors.push_back(std::move(*err));
    }
    if (auto err = checkCategories(input, fields.categories)) {
        result.errors.push_back(std::move(*err));
    }

    if (result.ok()) {
        result.value = std::move(fields);
    }
    return result;
}

} // namespace coop_catalog
