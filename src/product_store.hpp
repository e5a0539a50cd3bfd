#pragma once

#include "models.hpp"

#include <boost/uuid/random_generator.hpp>

#include <cstddef>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace coop_catalog {

/// Thrown when an id does not name a stored product.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& id)
        : std::runtime_error("Product not found: " + id)
        , mId(id) {}

    const std::string& id() const { return mId; }

private:
    std::string mId;
};

/// In-memory, id-keyed product collection shared by all request handlers.
///
/// Mutations take an exclusive lock; reads take a shared lock and return
/// copies, so every call sees a consistent snapshot.  Ids are random
/// 128-bit UUIDs in canonical lowercase form.
class ProductStore {
public:
    ProductStore() = default;

    ProductStore(const ProductStore&)            = delete;
    ProductStore& operator=(const ProductStore&) = delete;

    /// Store @p fields under a freshly generated id.
    Product insert(const ProductFields& fields);

    /// Overwrite the product at @p id; the id itself never changes.
    /// @throws NotFoundError if @p id is absent.
    Product replace(const std::string& id, const ProductFields& fields);

    /// @throws NotFoundError if @p id is absent.
    Product get(const std::string& id) const;

    /// All products, in insertion order.
    std::vector<Product> list() const;

    /// @throws NotFoundError if @p id is absent.
    void remove(const std::string& id);

    std::size_t size() const;

private:
    mutable std::shared_mutex                mMutex;
    std::unordered_map<std::string, Product> mProducts;
    std::vector<std::string>                 mOrder;      // ids by insertion
    boost::uuids::random_generator           mGenerator;  // guarded by mMutex

    /// Caller must hold the exclusive lock.
    std::string generateId();
};

} // namespace coop_catalog
