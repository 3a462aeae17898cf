#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace govee::lan {

// Model identifiers (sku) known to answer LAN control.
class ModelCatalog {
public:
    ModelCatalog();
    explicit ModelCatalog(std::vector<std::string> models);

    static const std::vector<std::string>& builtinModels();

    bool contains(const std::string& sku) const;
    void add(const std::string& sku);
    std::size_t size() const noexcept { return models_.size(); }

private:
    std::unordered_set<std::string> models_;
};

}  // namespace govee::lan
