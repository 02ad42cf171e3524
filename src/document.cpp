#include "gpkgsheet/document.hpp"

#include <algorithm>
#include <filesystem>

#include "cpl_error.h"

using nlohmann::ordered_json;

namespace gpkgsheet {

const Layer* Document::find_layer(const std::string& name) const {
    auto it = std::find_if(layers.begin(), layers.end(), [&](const Layer& l) { return l.name == name; });
    return it == layers.end() ? nullptr : &*it;
}

const GeometryPreview* Document::preview_for(const std::string& layer) const {
    auto it = std::find_if(previews.begin(), previews.end(),
                           [&](const GeometryPreview& p) { return p.layer == layer; });
    return it == previews.end() ? nullptr : &*it;
}

const CodeList* Document::code_list_for(const std::string& layer, const std::string& field) const {
    const FieldRef ref{layer, field};
    for (const CodeList& cl : code_lists) {
        if (std::find(cl.targets.begin(), cl.targets.end(), ref) != cl.targets.end()) return &cl;
    }
    return nullptr;
}

DocumentPtr assemble_document(DatasetCatalog catalog, std::vector<CodeList> code_lists,
                              std::vector<GeometryPreview> previews, const MetadataSource* metadata,
                              const Diagnostics& diag, const std::string& canonical_crs) {
    auto doc = std::make_shared<Document>();
    doc->dataset_name = catalog.name;
    doc->file_name = std::filesystem::path(catalog.path).filename().string();
    doc->driver = catalog.driver;
    doc->canonical_crs = canonical_crs;

    // コード表は通常レイヤとしては出さない（コードリスト経由でのみ見える）
    for (Layer& layer : catalog.layers) {
        if (!layer.is_code_table) doc->layers.push_back(std::move(layer));
    }

    doc->code_lists = std::move(code_lists);

    // プレビューはレイヤの順に揃える。通常レイヤに無いものは捨てる。
    auto layer_pos = [&](const std::string& name) {
        for (std::size_t i = 0; i < doc->layers.size(); i++) {
            if (doc->layers[i].name == name) return i;
        }
        return doc->layers.size();
    };
    previews.erase(std::remove_if(previews.begin(), previews.end(),
                                  [&](const GeometryPreview& p) { return layer_pos(p.layer) == doc->layers.size(); }),
                   previews.end());
    std::stable_sort(previews.begin(), previews.end(), [&](const GeometryPreview& a, const GeometryPreview& b) {
        return layer_pos(a.layer) < layer_pos(b.layer);
    });
    for (const GeometryPreview& p : previews) doc->extent.merge(p.extent);
    doc->previews = std::move(previews);

    if (metadata) {
        if (auto entries = metadata->lookup(doc->dataset_name)) {
            doc->metadata = std::move(*entries);
        } else {
            CPLDebug("GPKGSHEET", "%s: no descriptive metadata entry", doc->dataset_name.c_str());
        }
    }

    doc->issues = diag.issues();
    return doc;
}

namespace {

ordered_json bbox_json(const BoundingBox& b) {
    if (b.empty()) return nullptr;
    return ordered_json::array({b.min_lon, b.min_lat, b.max_lon, b.max_lat});
}

ordered_json field_json(const Document& doc, const Layer& layer, const Field& f) {
    ordered_json j;
    j["name"] = f.name;
    j["type"] = semantic_type_name(f.type);
    j["native_type"] = f.native_type;
    j["nullable"] = f.nullable;
    if (!f.domain_name.empty()) j["domain"] = f.domain_name;

    ordered_json samples = ordered_json::array();
    for (const FieldValue& v : f.samples) samples.push_back(to_display_string(v));
    j["samples"] = samples;

    const CodeList* cl = doc.code_list_for(layer.name, f.name);
    j["code_list"] = cl ? ordered_json(cl->id) : ordered_json(nullptr);
    return j;
}

ordered_json layer_json(const Document& doc, const Layer& layer) {
    ordered_json j;
    j["name"] = layer.name;
    j["kind"] = layer_kind_name(layer.kind);
    if (layer.kind == LayerKind::Spatial) {
        j["geometry_type"] = layer.geometry_type;
        j["geometry_column"] = layer.geometry_column;
        j["crs"] = layer.crs.empty() ? ordered_json(nullptr) : ordered_json(layer.crs);
        j["feature_count"] = layer.feature_count ? ordered_json(*layer.feature_count) : ordered_json(nullptr);
    }
    ordered_json fields = ordered_json::array();
    for (const Field& f : layer.fields) fields.push_back(field_json(doc, layer, f));
    j["fields"] = fields;
    return j;
}

ordered_json code_list_json(const CodeList& cl) {
    ordered_json j;
    j["id"] = cl.id;
    j["source"] = code_list_source_name(cl.source);
    j["source_name"] = cl.source_name.empty() ? ordered_json(nullptr) : ordered_json(cl.source_name);

    ordered_json entries = ordered_json::array();
    for (const CodedValue& v : cl.entries) {
        entries.push_back(ordered_json{{"code", v.code},
                                       {"label", v.label ? ordered_json(*v.label) : ordered_json(nullptr)}});
    }
    j["entries"] = entries;

    ordered_json targets = ordered_json::array();
    for (const FieldRef& t : cl.targets) targets.push_back(ordered_json{{"layer", t.layer}, {"field", t.field}});
    j["targets"] = targets;
    return j;
}

ordered_json preview_json(const GeometryPreview& p) {
    ordered_json features = ordered_json::array();
    for (const PreviewFeature& f : p.features) {
        features.push_back(ordered_json{
            {"type", "Feature"},
            {"id", f.fid},
            {"properties", f.properties},
            {"geometry", f.geometry}
        });
    }

    ordered_json j;
    j["layer"] = p.layer;
    j["crs"] = p.crs;
    j["extent"] = bbox_json(p.extent);
    j["total_features"] = p.total_features;
    j["shown_features"] = p.features.size();
    j["feature_cap"] = p.feature_cap;
    j["tolerance"] = p.tolerance;
    j["source_crs_assumed"] = p.source_crs_assumed;
    j["geojson"] = ordered_json{{"type", "FeatureCollection"}, {"features", features}};
    return j;
}

}  // namespace

ordered_json document_to_json(const Document& doc) {
    ordered_json out;
    out["dataset"] = doc.dataset_name;
    out["file_name"] = doc.file_name;
    out["driver"] = doc.driver;
    out["crs"] = doc.canonical_crs;

    ordered_json metadata = ordered_json::object();
    for (const auto& kv : doc.metadata) metadata[kv.first] = kv.second;
    out["metadata"] = metadata;

    out["extent"] = bbox_json(doc.extent);
    out["layer_count"] = doc.layers.size();

    ordered_json layers = ordered_json::array();
    for (const Layer& l : doc.layers) layers.push_back(layer_json(doc, l));
    out["layers"] = layers;

    ordered_json lists = ordered_json::array();
    for (const CodeList& cl : doc.code_lists) lists.push_back(code_list_json(cl));
    out["code_lists"] = lists;

    ordered_json previews = ordered_json::array();
    for (const GeometryPreview& p : doc.previews) previews.push_back(preview_json(p));
    out["previews"] = previews;

    ordered_json issues = ordered_json::array();
    for (const Issue& i : doc.issues) {
        issues.push_back(ordered_json{{"kind", issue_kind_name(i.kind)},
                                      {"layer", i.layer},
                                      {"field", i.field},
                                      {"message", i.message}});
    }
    out["issues"] = issues;
    return out;
}

}  // namespace gpkgsheet
