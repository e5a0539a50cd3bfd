#pragma once

#include "models.hpp"
#include "validation.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace coop_catalog {

/// Extract the ProductoIn fields (nombre, precio, categorias) from a JSON
/// object without judging their content.  Absent or null keys are Missing;
/// values of the wrong JSON type are Malformed.  JSON numbers for precio are
/// kept as their shortest decimal rendering, so 5.999 stays "5.999".
ProductInput parseProductInput(const nlohmann::json& body);

/// Render a product as ProductoOut.  precio is a two-decimal string ("6.00").
nlohmann::json productToJson(const Product& product);

/// Render a list of products as a JSON array.
nlohmann::json productsToJson(const std::vector<Product>& products);

/// {"detail": [{"loc": ["body", field], "msg": ..., "type": ...}, ...]}
/// Unknown and duplicated categories also carry {"ctx": {"values": [...]}}.
nlohmann::json validationErrorsToJson(const std::vector<FieldError>& errors);

/// A body-level error, e.g. unparseable JSON: {"detail": [{"loc": ["body"], ...}]}
nlohmann::json bodyErrorToJson(const std::string& type, const std::string& message);

/// {"detail": message}
nlohmann::json detailMessage(const std::string& message);

} // namespace coop_catalog
