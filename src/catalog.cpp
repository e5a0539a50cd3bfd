#include "catalog.hpp"

#include <algorithm>

namespace coop_catalog {
namespace catalog {

const std::vector<std::string>& allowedCategories() {
    static const std::vector<std::string> kCategories = [] {
        std::vector<std::string> labels = {
            "granos", "frutas", "hortalizas", "lacteos", "carnes",
            "procesados", "organicos", "ofertas", "semillas", "bebidas"
        };
        std::sort(labels.begin(), labels.end());
        return labels;
    }();
    return kCategories;
}

bool isAllowed(const std::string& label) {
    const auto& labels = allowedCategories();
    return std::binary_search(labels.begin(), labels.end(), label);
}

} // namespace catalog
} // namespace coop_catalog
