#pragma once

#include "product_store.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace coop_catalog {

/// Maps HTTP method + target onto validation and store operations.
/// Transport-agnostic: takes the raw request pieces and returns a status
/// code with a JSON body, so it can be exercised without sockets.
///
///   GET    /categorias-permitidas
///   POST   /productos
///   GET    /productos
///   GET    /productos/{id}
///   PUT    /productos/{id}
///   DELETE /productos/{id}
class ApiRouter {
public:
    struct Response {
        unsigned int   status  = 200;
        nlohmann::json body;
        bool           hasBody = true;   // false for 204
    };

    explicit ApiRouter(ProductStore& store, bool verbose = false);

    /// Never throws; unexpected failures become a 500 response.
    Response handle(const std::string& method,
                    const std::string& target,
                    const std::string& body);

private:
    ProductStore& mStore;
    bool          mVerbose;

    Response dispatch(const std::string& method,
                      const std::string& path,
                      const std::string& body);

    Response listCategories();
    Response createProduct(const std::string& body);
    Response listProducts();
    Response getProduct(const std::string& id);
    Response updateProduct(const std::string& id, const std::string& body);
    Response deleteProduct(const std::string& id);

    static Response reply(unsigned int status, nlohmann::json body);
    static Response notFound(const std::string& message);
    static Response methodNotAllowed();
};

} // namespace coop_catalog
