/// @file test_store.cpp
/// Unit tests for product_store.hpp — identity, lookup and lifecycle.

#include "product_store.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace coop_catalog;

static ProductFields makeFields(const std::string& name,
                                int64_t cents,
                                std::vector<std::string> categories = {"granos"}) {
    ProductFields f;
    f.name       = name;
    f.price      = Money::fromCents(cents);
    f.categories = std::move(categories);
    return f;
}

static const std::string kUnknownId = "00000000-0000-4000-8000-000000000000";

// ============================================================================
// insert / get
// ============================================================================

TEST(ProductStore, FreshStoreIsEmpty) {
    ProductStore store;
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.list().empty());
}

TEST(ProductStore, InsertAssignsCanonicalUuid) {
    ProductStore store;
    auto p = store.insert(makeFields("Arroz", 250));

    auto canonical = normalizeUuid(p.id);
    ASSERT_TRUE(canonical.has_value());
    EXPECT_EQ(*canonical, p.id);
    EXPECT_EQ(p.id[14], '4');   // version 4 (random)
}

TEST(ProductStore, InsertKeepsFields) {
    ProductStore store;
    auto p = store.insert(makeFields("Arroz", 250, {"granos", "ofertas"}));

    EXPECT_EQ(p.name, "Arroz");
    EXPECT_EQ(p.price.toString(), "2.50");
    EXPECT_EQ(p.categories, (std::vector<std::string>{"granos", "ofertas"}));
}

TEST(ProductStore, GetReturnsInsertedValue) {
    ProductStore store;
    auto inserted = store.insert(makeFields("Arroz", 250));

    EXPECT_EQ(store.get(inserted.id), inserted);
}

TEST(ProductStore, IdsArePairwiseDistinct) {
    ProductStore store;
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(store.insert(makeFields("Producto", 100 + i)).id);
    }
    EXPECT_EQ(ids.size(), 1000u);
    EXPECT_EQ(store.size(), 1000u);
}

TEST(ProductStore, IdenticalFieldsGetDistinctIds) {
    ProductStore store;
    auto a = store.insert(makeFields("Arroz", 250));
    auto b = store.insert(makeFields("Arroz", 250));
    EXPECT_NE(a.id, b.id);
}

TEST(ProductStore, GetUnknownIdThrowsNotFound) {
    ProductStore store;
    EXPECT_THROW(store.get(kUnknownId), NotFoundError);
}

TEST(ProductStore, NotFoundCarriesId) {
    ProductStore store;
    try {
        store.get(kUnknownId);
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.id(), kUnknownId);
    }
}

// ============================================================================
// list
// ============================================================================

TEST(ProductStore, ListKeepsInsertionOrder) {
    ProductStore store;
    auto a = store.insert(makeFields("Arroz", 100));
    auto b = store.insert(makeFields("Frijol", 200));
    auto c = store.insert(makeFields("Maiz", 300));

    auto all = store.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], a);
    EXPECT_EQ(all[1], b);
    EXPECT_EQ(all[2], c);
}

TEST(ProductStore, ListSkipsRemovedProducts) {
    ProductStore store;
    auto a = store.insert(makeFields("Arroz", 100));
    auto b = store.insert(makeFields("Frijol", 200));
    auto c = store.insert(makeFields("Maiz", 300));

    store.remove(b.id);

    auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, a.id);
    EXPECT_EQ(all[1].id, c.id);
}

// ============================================================================
// replace
// ============================================================================

TEST(ProductStore, ReplaceOverwritesFieldsAndKeepsId) {
    ProductStore store;
    auto original = store.insert(makeFields("Arroz", 100));

    auto updated = store.replace(original.id, makeFields("Arroz integral", 175, {"organicos"}));

    EXPECT_EQ(updated.id, original.id);
    EXPECT_EQ(updated.name, "Arroz integral");
    EXPECT_EQ(updated.price.toString(), "1.75");
    EXPECT_EQ(store.get(original.id), updated);
    EXPECT_EQ(store.size(), 1u);
}

TEST(ProductStore, ReplaceKeepsListPosition) {
    ProductStore store;
    auto a = store.insert(makeFields("Arroz", 100));
    auto b = store.insert(makeFields("Frijol", 200));

    store.replace(a.id, makeFields("Arroz integral", 175));

    auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, a.id);
    EXPECT_EQ(all[0].name, "Arroz integral");
    EXPECT_EQ(all[1].id, b.id);
}

TEST(ProductStore, ReplaceUnknownIdThrowsAndStoresNothing) {
    ProductStore store;
    EXPECT_THROW(store.replace(kUnknownId, makeFields("Arroz", 100)), NotFoundError);
    EXPECT_EQ(store.size(), 0u);
}

// ============================================================================
// remove
// ============================================================================

TEST(ProductStore, RemoveThenGetThrowsNotFound) {
    ProductStore store;
    auto p = store.insert(makeFields("Arroz", 100));

    store.remove(p.id);

    EXPECT_THROW(store.get(p.id), NotFoundError);
    EXPECT_EQ(store.size(), 0u);
}

TEST(ProductStore, RemoveTwiceThrowsNotFound) {
    ProductStore store;
    auto p = store.insert(makeFields("Arroz", 100));

    store.remove(p.id);
    EXPECT_THROW(store.remove(p.id), NotFoundError);
}

TEST(ProductStore, ReplaceAfterRemoveThrowsNotFound) {
    ProductStore store;
    auto p = store.insert(makeFields("Arroz", 100));

    store.remove(p.id);
    EXPECT_THROW(store.replace(p.id, makeFields("Arroz", 200)), NotFoundError);
}

// ============================================================================
// Concurrent access
// ============================================================================

TEST(ProductStore, ConcurrentInsertsLoseNothing) {
    ProductStore store;
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 250;

    std::vector<std::vector<std::string>> idsPerThread(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store, &idsPerThread, t] {
            for (int i = 0; i < kPerThread; ++i) {
                idsPerThread[t].push_back(store.insert(makeFields("Producto", 100 + i)).id);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<std::string> ids;
    for (const auto& v : idsPerThread) ids.insert(v.begin(), v.end());

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(store.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(store.list().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(ProductStore, ConcurrentReadersSeeWholeValues) {
    ProductStore store;
    auto p = store.insert(makeFields("Version 0", 100, {"granos"}));

    std::thread writer([&store, &p] {
        for (int i = 1; i <= 500; ++i) {
            store.replace(p.id, makeFields("Version " + std::to_string(i), 100 + i, {"granos"}));
        }
    });

    // Every snapshot must pair a name with its own price.
    for (int i = 0; i < 500; ++i) {
        auto seen = store.get(p.id);
        const int version = std::stoi(seen.name.substr(8));
        EXPECT_EQ(seen.price.cents(), 100 + version);
    }
    writer.join();
}
