#include "gpkgsheet/schema_extractor.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "cpl_conv.h"  // CPLFree
#include "cpl_error.h"
#include "gdal_priv.h"
#include "ogr_spatialref.h"
#include "ogrsf_frmts.h"

namespace gpkgsheet {

namespace {

// UTF-8 の文字数（継続バイト 10xxxxxx を数えない）
std::size_t utf8_length(const char* s) {
    std::size_t n = 0;
    for (; *s; ++s) {
        if ((static_cast<unsigned char>(*s) & 0xC0) != 0x80) n++;
    }
    return n;
}

// OGR のネイティブ型 -> 意味型。写像できないもの（リスト型など）は known=false で text。
SemanticType map_field_type(OGRFieldType type, OGRFieldSubType sub_type, bool& known) {
    known = true;
    switch (type) {
        case OFTInteger:
        case OFTInteger64:
            return sub_type == OFSTBoolean ? SemanticType::Boolean : SemanticType::Integer;
        case OFTReal:
            return SemanticType::Real;
        case OFTString:
            return SemanticType::Text;
        case OFTDate:
        case OFTTime:
        case OFTDateTime:
            return SemanticType::DateTime;
        case OFTBinary:
            return SemanticType::Binary;
        default:
            break;
    }
    known = false;
    return SemanticType::Text;
}

std::string native_type_name(const OGRFieldDefn& defn) {
    std::string s = OGRFieldDefn::GetFieldTypeName(defn.GetType());
    if (defn.GetSubType() != OFSTNone) {
        s += "(";
        s += OGRFieldDefn::GetFieldSubTypeName(defn.GetSubType());
        s += ")";
    }
    return s;
}

std::string describe_crs(const OGRSpatialReference& srs) {
    const char* auth = srs.GetAuthorityName(nullptr);
    const char* code = srs.GetAuthorityCode(nullptr);
    if (auth && code) return std::string(auth) + ":" + code;
    const char* name = srs.GetName();
    return name ? name : "";
}

std::string export_wkt(const OGRSpatialReference& srs) {
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    std::string out = wkt ? wkt : "";
    CPLFree(wkt);
    return out;
}

std::optional<std::string> cell_string(const OGRFeature& f, int index) {
    if (index < 0 || index >= f.GetFieldCount()) return std::nullopt;
    if (!f.IsFieldSetAndNotNull(index)) return std::nullopt;
    return std::string(f.GetFieldAsString(index));
}

// 1レイヤ分を読む。読めなければ nullopt と理由を返す。
std::optional<Layer> read_layer(OGRLayer& ly, const EngineConfig& config, Diagnostics& diag,
                                std::string& reason) {
    Layer layer;
    layer.name = ly.GetName();
    layer.is_code_table = is_code_table_name(layer.name, config.code_table_prefix);

    OGRFeatureDefn* defn = ly.GetLayerDefn();
    if (!defn) {
        reason = "layer definition is not available";
        return std::nullopt;
    }

    // 属性フィールド（宣言順）
    const int field_count = defn->GetFieldCount();
    layer.fields.reserve(static_cast<std::size_t>(field_count) + 1);
    for (int i = 0; i < field_count; i++) {
        Field field;
        const OGRFieldDefn* fdef = defn->GetFieldDefn(i);
        if (!fdef) {
            // 定義すら読めないフィールドも text / サンプル無しで残す
            field.name = "field_" + std::to_string(i + 1);
            field.native_type = "Unknown";
            diag.report(IssueKind::FieldTypeUnknown, layer.name, field.name,
                        "field definition could not be read; reported as text");
            layer.fields.push_back(std::move(field));
            continue;
        }

        field.name = fdef->GetNameRef();
        field.native_type = native_type_name(*fdef);
        field.nullable = fdef->IsNullable() != FALSE;
        field.domain_name = fdef->GetDomainName();

        bool known = true;
        field.type = map_field_type(fdef->GetType(), fdef->GetSubType(), known);
        if (!known) {
            diag.report(IssueKind::FieldTypeUnknown, layer.name, field.name,
                        "native type " + field.native_type + " mapped to text");
        }
        layer.fields.push_back(std::move(field));
    }

    // ジオメトリ列（最初のものだけを見る）
    const OGRGeomFieldDefn* gdef = defn->GetGeomFieldCount() > 0 ? defn->GetGeomFieldDefn(0) : nullptr;
    if (gdef && gdef->GetType() != wkbNone) {
        layer.kind = LayerKind::Spatial;
        layer.geometry_type = OGRGeometryTypeToName(gdef->GetType());
        layer.geometry_column = gdef->GetNameRef();
        if (layer.geometry_column.empty()) layer.geometry_column = "geometry";

        const OGRSpatialReference* srs = gdef->GetSpatialRef();  // layer 所有
        if (srs) {
            layer.crs = describe_crs(*srs);
            layer.crs_wkt = export_wkt(*srs);
        }

        Field gfield;
        gfield.name = layer.geometry_column;
        gfield.type = SemanticType::Geometry;
        gfield.native_type = layer.geometry_type;
        gfield.nullable = gdef->IsNullable() != FALSE;
        layer.fields.push_back(std::move(gfield));
    }

    std::vector<bool> is_text(static_cast<std::size_t>(field_count), false);
    bool any_text = false;
    for (int i = 0; i < field_count; i++) {
        is_text[i] = layer.fields[i].type == SemanticType::Text;
        any_text = any_text || is_text[i];
    }

    const std::size_t k = config.sample_count;
    auto samples_full = [&]() {
        return std::all_of(layer.fields.begin(), layer.fields.begin() + field_count,
                           [&](const Field& f) { return f.samples.size() >= k; });
    };

    CPLErrorReset();
    ly.ResetReading();
    for (OGRFeatureUniquePtr f(ly.GetNextFeature()); f; f.reset(ly.GetNextFeature())) {
        for (int i = 0; i < field_count && i < f->GetFieldCount(); i++) {
            if (!f->IsFieldSetAndNotNull(i)) continue;
            Field& field = layer.fields[i];

            if (field.samples.size() < k) {
                field.samples.push_back(read_field_value(*f, i, field.type));
            }

            if (is_text[i]) {
                const char* s = f->GetFieldAsString(i);
                ValueStats& st = field.stats;
                st.non_null_count++;
                st.max_length = std::max(st.max_length, utf8_length(s));
                if (!st.distinct_overflow) {
                    st.distinct.insert(s);
                    if (st.distinct.size() > config.max_distinct_values) st.distinct_overflow = true;
                }
            }
        }

        if (layer.is_code_table) {
            layer.code_rows.push_back(CodeRow{cell_string(*f, 0), cell_string(*f, 1)});
        } else if (!any_text && samples_full()) {
            // 統計が要らないレイヤはサンプルが揃った時点で打ち切る
            break;
        }
    }

    if (CPLGetLastErrorType() == CE_Failure) {
        reason = CPLGetLastErrorMsg();
        if (reason.empty()) reason = "error while reading features";
        return std::nullopt;
    }

    if (layer.kind == LayerKind::Spatial) {
        layer.feature_count = static_cast<std::int64_t>(ly.GetFeatureCount(TRUE));
    }
    return layer;
}

void read_domains(GDALDataset& ds, DatasetCatalog& catalog) {
    std::vector<std::string> names = ds.GetFieldDomainNames();
    for (const Layer& layer : catalog.layers) {
        for (const Field& f : layer.fields) {
            if (!f.domain_name.empty() &&
                std::find(names.begin(), names.end(), f.domain_name) == names.end()) {
                names.push_back(f.domain_name);
            }
        }
    }

    for (const std::string& name : names) {
        const OGRFieldDomain* domain = ds.GetFieldDomain(name);
        if (!domain || domain->GetDomainType() != OFDT_CODED) continue;

        const auto* coded = static_cast<const OGRCodedFieldDomain*>(domain);
        FieldDomainInfo info;
        info.name = name;
        info.description = domain->GetDescription();
        const OGRCodedValue* enumeration = coded->GetEnumeration();
        for (int i = 0; enumeration && enumeration[i].pszCode != nullptr; ++i) {
            CodedValue v;
            v.code = enumeration[i].pszCode;
            if (enumeration[i].pszValue) v.label = std::string(enumeration[i].pszValue);
            info.values.push_back(std::move(v));
        }
        catalog.domains.push_back(std::move(info));
    }
}

}  // namespace

bool is_code_table_name(const std::string& layer_name, const std::string& prefix) {
    return !prefix.empty() && layer_name.size() > prefix.size() &&
           STARTS_WITH_CI(layer_name.c_str(), prefix.c_str());
}

DatasetCatalog extract_schema(GDALDataset& ds, const DatasetHandle& handle, const EngineConfig& config,
                              Diagnostics& diag) {
    DatasetCatalog catalog;
    catalog.name = handle.name;
    catalog.path = handle.path;
    if (GDALDriver* drv = ds.GetDriver()) catalog.driver = drv->GetDescription();

    std::set<std::string> seen;
    const int layer_count = ds.GetLayerCount();
    for (int i = 0; i < layer_count; i++) {
        OGRLayer* ly = ds.GetLayer(i);
        if (!ly) {
            diag.report(IssueKind::LayerUnreadable, "#" + std::to_string(i), "",
                        "GetLayer() returned null");
            continue;
        }

        const std::string name = ly->GetName();
        if (!seen.insert(name).second) {
            diag.report(IssueKind::LayerUnreadable, name, "", "duplicate layer name; skipped");
            continue;
        }

        std::string reason;
        std::optional<Layer> layer = read_layer(*ly, config, diag, reason);
        if (!layer) {
            diag.report(IssueKind::LayerUnreadable, name, "", reason);
            continue;
        }

        CPLDebug("GPKGSHEET", "%s: layer %s (%s, %d fields%s)", handle.name.c_str(), name.c_str(),
                 layer_kind_name(layer->kind), static_cast<int>(layer->fields.size()),
                 layer->is_code_table ? ", code table" : "");
        catalog.layers.push_back(std::move(*layer));
    }

    read_domains(ds, catalog);
    return catalog;
}

DatasetCatalog extract_schema(const DatasetHandle& handle, const EngineConfig& config, Diagnostics& diag) {
    CPLErrorReset();
    GDALDatasetUniquePtr ds(GDALDataset::Open(handle.path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!ds) {
        std::string reason = CPLGetLastErrorMsg();
        if (reason.empty()) reason = "GDALOpenEx() failed (not a readable vector dataset)";
        throw DatasetUnreadable(handle.name, reason);
    }
    return extract_schema(*ds, handle, config, diag);
}

}  // namespace gpkgsheet
