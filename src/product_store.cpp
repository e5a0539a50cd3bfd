#include "product_store.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <mutex>

namespace coop_catalog {

namespace {

Product makeProduct(const std::string& id, const ProductFields& fields) {
    Product p;
    p.id         = id;
    p.name       = fields.name;
    p.price      = fields.price;
    p.categories = fields.categories;
    return p;
}

} // namespace

Product ProductStore::insert(const ProductFields& fields) {
    std::unique_lock<std::shared_mutex> lock(mMutex);

    Product product = makeProduct(generateId(), fields);
    mProducts.emplace(product.id, product);
    mOrder.push_back(product.id);
    return product;
}

Product ProductStore::replace(const std::string& id, const ProductFields& fields) {
    std::unique_lock<std::shared_mutex> lock(mMutex);

    auto it = mProducts.find(id);
    if (it == mProducts.end()) {
        throw NotFoundError(id);
    }
    it->second = makeProduct(id, fields);
    return it->second;
}

Product ProductStore::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mMutex);

    auto it = mProducts.find(id);
    if (it == mProducts.end()) {
        throw NotFoundError(id);
    }
    return it->second;
}

std::vector<Product> ProductStore::list() const {
    std::shared_lock<std::shared_mutex> lock(mMutex);

    std::vector<Product> products;
    products.reserve(mOrder.size());
    for (const auto& id : mOrder) {
        products.push_back(mProducts.at(id));
    }
    return products;
}

void ProductStore::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mMutex);

    if (mProducts.erase(id) == 0) {
        throw NotFoundError(id);
    }
    mOrder.erase(std::find(mOrder.begin(), mOrder.end(), id));
}

std::size_t ProductStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    return mProducts.size();
}

std::string ProductStore::generateId() {
    // Regenerate on a clash with a stored id.
    std::string id;
    do {
        id = boost::uuids::to_string(mGenerator());
    } while (mProducts.count(id) != 0);
    return id;
}

} // namespace coop_catalog
