#include "api_router.hpp"
#include "catalog.hpp"
#include "mapping.hpp"
#include "util.hpp"
#include "validation.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace coop_catalog {

namespace {

const std::string kCategoriesPath = "/categorias-permitidas";
const std::string kProductsPath   = "/productos";
const std::string kProductPrefix  = "/productos/";

const char* const kProductNotFound = "Producto no encontrado";

/// Parse and validate a ProductoIn body.  On failure returns the 422
/// response to send; on success fills @p out.
std::optional<ApiRouter::Response> validateBody(const std::string& text,
                                                ProductFields& out) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return ApiRouter::Response{
            422, bodyErrorToJson("json_invalid", "El cuerpo no es JSON válido"), true};
    }

    if (!body.is_object()) {
        return ApiRouter::Response{
            422, bodyErrorToJson("model_attributes_type",
                                 "El cuerpo debe ser un objeto JSON"), true};
    }

    auto result = validateProduct(parseProductInput(body));
    if (!result.ok()) {
        return ApiRouter::Response{422, validationErrorsToJson(result.errors), true};
    }

    out = std::move(*result.value);
    return std::nullopt;
}

} // namespace

ApiRouter::ApiRouter(ProductStore& store, bool verbose)
    : mStore(store)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public entry point
// ---------------------------------------------------------------------------

ApiRouter::Response ApiRouter::handle(const std::string& method,
                                      const std::string& target,
                                      const std::string& body)
{
    // Query strings carry nothing for this API.
    const std::string path = target.substr(0, target.find('?'));

    Response response;
    try {
        response = dispatch(method, path, body);
    } catch (const NotFoundError&) {
        response = notFound(kProductNotFound);
    } catch (const std::exception& e) {
        std::cerr << "[Router] Unhandled error on " << method << " " << target
                  << ": " << e.what() << "\n";
        response = reply(500, detailMessage("Internal Server Error"));
    }

    if (mVerbose) {
        std::cerr << "[Router] " << method << " " << target << " -> "
                  << response.status << "\n";
    }
    return response;
}

ApiRouter::Response ApiRouter::dispatch(const std::string& method,
                                        const std::string& path,
                                        const std::string& body)
{
    if (path == kCategoriesPath) {
        if (method == "GET") return listCategories();
        return methodNotAllowed();
    }

    if (path == kProductsPath) {
        if (method == "GET")  return listProducts();
        if (method == "POST") return createProduct(body);
        return methodNotAllowed();
    }

    if (path.compare(0, kProductPrefix.size(), kProductPrefix) == 0) {
        const std::string segment = path.substr(kProductPrefix.size());
        if (!segment.empty() && segment.find('/') == std::string::npos) {
            if (method != "GET" && method != "PUT" && method != "DELETE") {
                return methodNotAllowed();
            }

            // Malformed ids cannot name a product: same answer as unknown ones.
            const auto id = normalizeUuid(segment);
            if (!id) {
                return notFound(kProductNotFound);
            }

            if (method == "GET") return getProduct(*id);
            if (method == "PUT") return updateProduct(*id, body);
            return deleteProduct(*id);
        }
    }

    return notFound("Not Found");
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

ApiRouter::Response ApiRouter::listCategories() {
    return reply(200, catalog::allowedCategories());
}

ApiRouter::Response ApiRouter::createProduct(const std::string& body) {
    ProductFields fields;
    if (auto failure = validateBody(body, fields)) {
        return *failure;
    }

    const Product created = mStore.insert(fields);
    if (mVerbose) {
        std::cerr << "[Router] Created product " << created.id << "\n";
    }
    return reply(201, productToJson(created));
}

ApiRouter::Response ApiRouter::listProducts() {
    return reply(200, productsToJson(mStore.list()));
}

ApiRouter::Response ApiRouter::getProduct(const std::string& id) {
    return reply(200, productToJson(mStore.get(id)));
}

ApiRouter::Response ApiRouter::updateProduct(const std::string& id,
                                             const std::string& body)
{
    ProductFields fields;
    if (auto failure = validateBody(body, fields)) {
        return *failure;
    }
    return reply(200, productToJson(mStore.replace(id, fields)));
}

ApiRouter::Response ApiRouter::deleteProduct(const std::string& id) {
    mStore.remove(id);
    if (mVerbose) {
        std::cerr << "[Router] Deleted product " << id << "\n";
    }
    return Response{204, nullptr, false};
}

// ---------------------------------------------------------------------------
// Response helpers
// ---------------------------------------------------------------------------

ApiRouter::Response ApiRouter::reply(unsigned int status, nlohmann::json body) {
    return Response{status, std::move(body), true};
}

ApiRouter::Response ApiRouter::notFound(const std::string& message) {
    return reply(404, detailMessage(message));
}

ApiRouter::Response ApiRouter::methodNotAllowed() {
    return reply(405, detailMessage("Method Not Allowed"));
}

} // namespace coop_catalog
