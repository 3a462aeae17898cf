#include "govee/lan/ModelCatalog.h"

#include <utility>

namespace govee::lan {

ModelCatalog::ModelCatalog() : ModelCatalog(builtinModels()) {}

ModelCatalog::ModelCatalog(std::vector<std::string> models)
    : models_(std::make_move_iterator(models.begin()), std::make_move_iterator(models.end())) {}

const std::vector<std::string>& ModelCatalog::builtinModels() {
    static const std::vector<std::string> kModels{
        // Light strips
        "H6046", "H6047", "H6051", "H6052", "H6056", "H6059", "H6061", "H6062",
        "H6065", "H6066", "H6067", "H6072", "H6073", "H6076", "H6078", "H6087",
        "H610A", "H610B", "H6117", "H6159", "H615E", "H6163", "H6168", "H6172",
        "H6173", "H618A", "H618C", "H618E", "H618F", "H619A", "H619B", "H619C",
        "H619D", "H619E", "H619Z", "H61A0", "H61A1", "H61A2", "H61A3", "H61A5",
        "H61A8", "H61B2", "H61E1",
        // Outdoor and string lights
        "H7012", "H7013", "H7021", "H7028", "H7041", "H7042", "H7050", "H7051",
        "H7055", "H705A", "H705B", "H7060", "H7061", "H7062", "H7065",
    };
    return kModels;
}

bool ModelCatalog::contains(const std::string& sku) const {
    return models_.count(sku) > 0;
}

void ModelCatalog::add(const std::string& sku) {
    if (!sku.empty()) {
        models_.insert(sku);
    }
}

}  // namespace govee::lan
