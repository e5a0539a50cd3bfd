#include "mapping.hpp"

namespace coop_catalog {

namespace {

bool isAbsent(const nlohmann::json& body, const char* key) {
    return !body.contains(key) || body[key].is_null();
}

} // namespace

ProductInput parseProductInput(const nlohmann::json& body) {
    ProductInput input;

    // --- nombre ---
    if (!isAbsent(body, "nombre")) {
        const auto& name = body["nombre"];
        if (name.is_string()) {
            input.nameState = FieldState::Present;
            input.name      = name.get<std::string>();
        } else {
            input.nameState = FieldState::Malformed;
        }
    }

    // --- precio ---
    if (!isAbsent(body, "precio")) {
        const auto& price = body["precio"];
        if (price.is_string()) {
            input.priceState = FieldState::Present;
            input.price      = price.get<std::string>();
        } else if (price.is_number()) {
            input.priceState = FieldState::Present;
            input.price      = price.dump();
        } else {
            input.priceState = FieldState::Malformed;
        }
    }

    // --- categorias ---
    if (!isAbsent(body, "categorias")) {
        const auto& categories = body["categorias"];
        input.categoriesState = FieldState::Present;
        if (!categories.is_array()) {
            input.categoriesState = FieldState::Malformed;
        } else {
            for (const auto& entry : categories) {
                if (!entry.is_string()) {
                    input.categoriesState = FieldState::Malformed;
                    input.categories.clear();
                    break;
                }
                input.categories.push_back(entry.get<std::string>());
            }
        }
    }

    return input;
}

nlohmann::json productToJson(const Product& product) {
    return {
        {"id",         product.id},
        {"nombre",     product.name},
        {"precio",     product.price.toString()},
        {"categorias", product.categories}
    };
}

nlohmann::json productsToJson(const std::vector<Product>& products) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : products) {
        out.push_back(productToJson(p));
    }
    return out;
}

nlohmann::json validationErrorsToJson(const std::vector<FieldError>& errors) {
    nlohmann::json detail = nlohmann::json::array();
    for (const auto& err : errors) {
        nlohmann::json entry = {
            {"loc",  nlohmann::json::array({"body", err.field})},
            {"msg",  err.message},
            {"type", reasonCode(err.reason)}
        };
        if (!err.values.empty()) {
            entry["ctx"] = {{"values", err.values}};
        }
        detail.push_back(std::move(entry));
    }
    return {{"detail", detail}};
}

nlohmann::json bodyErrorToJson(const std::string& type, const std::string& message) {
    nlohmann::json entry = {
        {"loc",  nlohmann::json::array({"body"})},
        {"msg",  message},
        {"type", type}
    };
    return {{"detail", nlohmann::json::array({entry})}};
}

nlohmann::json detailMessage(const std::string& message) {
    return {{"detail", message}};
}

} // namespace coop_catalog
