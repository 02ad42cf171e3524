#include "gpkgsheet/model.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace gpkgsheet {

DatasetHandle make_dataset_handle(const std::string& path) {
    DatasetHandle h;
    h.path = path;
    h.name = std::filesystem::path(path).stem().string();
    return h;
}

const char* layer_kind_name(LayerKind kind) {
    return kind == LayerKind::Spatial ? "spatial" : "attribute-only";
}

const char* code_list_source_name(CodeListSource source) {
    switch (source) {
        case CodeListSource::CodeTable: return "code_table";
        case CodeListSource::FieldDomain: return "field_domain";
        case CodeListSource::Inferred: return "inferred";
    }
    return "inferred";
}

const Field* Layer::find_field(const std::string& field_name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const Field& f) { return f.name == field_name; });
    return it == fields.end() ? nullptr : &*it;
}

const Layer* DatasetCatalog::find_layer(const std::string& layer_name) const {
    auto it = std::find_if(layers.begin(), layers.end(),
                           [&](const Layer& l) { return l.name == layer_name; });
    return it == layers.end() ? nullptr : &*it;
}

const FieldDomainInfo* DatasetCatalog::find_domain(const std::string& domain_name) const {
    auto it = std::find_if(domains.begin(), domains.end(),
                           [&](const FieldDomainInfo& d) { return d.name == domain_name; });
    return it == domains.end() ? nullptr : &*it;
}

void BoundingBox::add(double lon, double lat) {
    min_lon = std::min(min_lon, lon);
    max_lon = std::max(max_lon, lon);
    min_lat = std::min(min_lat, lat);
    max_lat = std::max(max_lat, lat);
}

void BoundingBox::merge(const BoundingBox& other) {
    if (other.empty()) return;
    add(other.min_lon, other.min_lat);
    add(other.max_lon, other.max_lat);
}

double BoundingBox::diagonal() const {
    if (empty()) return 0.0;
    return std::hypot(max_lon - min_lon, max_lat - min_lat);
}

}  // namespace gpkgsheet
