#pragma once

#include "money.hpp"

#include <string>
#include <vector>

namespace coop_catalog {

/// How a field appeared in the submitted body.
enum class FieldState {
    Missing,     // key absent (or null)
    Present,     // value has the expected shape; see the matching member
    Malformed    // wrong type, e.g. a number where text is expected
};

/// Untrusted product fields as received, before validation (ProductoIn).
struct ProductInput {
    FieldState               nameState       = FieldState::Missing;
    std::string              name;
    FieldState               priceState      = FieldState::Missing;
    std::string              price;          // decimal text, e.g. "5.999"
    FieldState               categoriesState = FieldState::Missing;
    std::vector<std::string> categories;
};

/// Validated, normalized product fields (everything but the id).
struct ProductFields {
    std::string              name;
    Money                    price;
    std::vector<std::string> categories;
};

/// A stored product (ProductoOut).
struct Product {
    std::string              id;          // canonical lowercase UUID
    std::string              name;
    Money                    price;
    std::vector<std::string> categories;
};

inline bool operator==(const ProductFields& a, const ProductFields& b) {
    return a.name == b.name && a.price == b.price && a.categories == b.categories;
}

inline bool operator==(const Product& a, const Product& b) {
    return a.id == b.id && a.name == b.name && a.price == b.price &&
           a.categories == b.categories;
}

inline bool operator!=(const Product& a, const Product& b) {
    return !(a == b);
}

} // namespace coop_catalog
