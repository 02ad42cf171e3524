#ifndef GPKGSHEET_MODEL_HPP
#define GPKGSHEET_MODEL_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "gpkgsheet/value.hpp"

namespace gpkgsheet {

// 呼び出し側が渡すデータセットの指定（エンジンはディレクトリ走査をしない）
struct DatasetHandle {
    std::string path;
    std::string name;  // 拡張子なしのファイル名
};

DatasetHandle make_dataset_handle(const std::string& path);

// text フィールドの値の統計（コードリスト推定用）
struct ValueStats {
    std::size_t non_null_count = 0;
    std::size_t max_length = 0;              // UTF-8 文字数
    std::set<std::string> distinct;          // 上限+1 件まで
    bool distinct_overflow = false;          // 上限を超えたら以降は数えない
};

struct Field {
    std::string name;
    SemanticType type = SemanticType::Text;
    std::string native_type;
    bool nullable = true;
    std::string domain_name;
    std::vector<FieldValue> samples;
    ValueStats stats;
};

enum class LayerKind {
    Spatial,
    AttributeOnly
};

const char* layer_kind_name(LayerKind kind);

// コード表の1行（先頭2列）。ラベル列が無いテーブルでは label は空。
struct CodeRow {
    std::optional<std::string> code;
    std::optional<std::string> label;
};

struct Layer {
    std::string name;
    LayerKind kind = LayerKind::AttributeOnly;
    std::vector<Field> fields;

    // spatial のみ
    std::string geometry_type;
    std::string geometry_column;
    std::string crs;       // "EPSG:25833" など。不明なら空
    std::string crs_wkt;
    std::optional<std::int64_t> feature_count;

    bool is_code_table = false;
    std::vector<CodeRow> code_rows;

    const Field* find_field(const std::string& field_name) const;
};

struct CodedValue {
    std::string code;
    std::optional<std::string> label;
};

// GDAL の coded field domain（GeoPackage では gpkg_data_column_constraints）
struct FieldDomainInfo {
    std::string name;
    std::string description;
    std::vector<CodedValue> values;
};

struct DatasetCatalog {
    std::string name;
    std::string path;
    std::string driver;
    std::vector<Layer> layers;
    std::vector<FieldDomainInfo> domains;

    const Layer* find_layer(const std::string& layer_name) const;
    const FieldDomainInfo* find_domain(const std::string& domain_name) const;
};

enum class CodeListSource {
    CodeTable,
    FieldDomain,
    Inferred
};

const char* code_list_source_name(CodeListSource source);

struct FieldRef {
    std::string layer;
    std::string field;

    bool operator==(const FieldRef& o) const { return layer == o.layer && field == o.field; }
};

struct CodeList {
    std::string id;
    CodeListSource source = CodeListSource::Inferred;
    std::string source_name;
    std::vector<CodedValue> entries;
    std::vector<FieldRef> targets;
};

struct BoundingBox {
    double min_lon = std::numeric_limits<double>::infinity();
    double min_lat = std::numeric_limits<double>::infinity();
    double max_lon = -std::numeric_limits<double>::infinity();
    double max_lat = -std::numeric_limits<double>::infinity();

    bool empty() const { return min_lon > max_lon || min_lat > max_lat; }
    void add(double lon, double lat);
    void merge(const BoundingBox& other);
    double diagonal() const;
};

struct PreviewFeature {
    std::int64_t fid = -1;
    nlohmann::ordered_json geometry;     // GeoJSON geometry（canonical CRS）
    nlohmann::ordered_json properties;   // 属性値の表示文字列（フィールド順）
    bool simplified = false;
};

struct GeometryPreview {
    std::string layer;
    std::string crs;
    BoundingBox extent;          // 簡略化前の座標で計算
    std::int64_t total_features = 0;
    std::size_t feature_cap = 0;
    double tolerance = 0.0;
    bool source_crs_assumed = false;
    std::vector<PreviewFeature> features;
};

}  // namespace gpkgsheet

#endif  // GPKGSHEET_MODEL_HPP
