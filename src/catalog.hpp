#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace coop_catalog {
namespace catalog {

/// Most categories a single product may carry.
constexpr std::size_t kMaxCategories = 10;

/// The allowed category labels, sorted alphabetically.
const std::vector<std::string>& allowedCategories();

/// True if @p label (already normalized) is an allowed category.
bool isAllowed(const std::string& label);

} // namespace catalog
} // namespace coop_catalog
