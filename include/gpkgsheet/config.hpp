#ifndef GPKGSHEET_CONFIG_HPP
#define GPKGSHEET_CONFIG_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace gpkgsheet {

enum class TolerancePolicy {
    FractionOfDiagonal,  // データセット範囲（対角線長）に対する比率
    Absolute             // canonical CRS の単位（度）で固定
};

// エンジンの調整パラメータ。既定値はすべてここで決める。
struct EngineConfig {
    // コード表レイヤの予約プレフィックス
    std::string code_table_prefix = "code_";

    // フィールドごとに保持するサンプル値の数（先頭から k 件、非null）
    std::size_t sample_count = 5;

    // 統計的フォールバック（コードリスト推定）の閾値
    std::size_t max_text_length = 40;        // 値の最大長（UTF-8文字数）
    double max_cardinality_ratio = 0.2;      // distinct / non-null
    std::size_t max_distinct_values = 25;    // distinct の絶対上限
    std::size_t min_distinct_values = 2;     // 1種類しかない値はコードリストとみなさない

    // 簡略化
    TolerancePolicy tolerance_policy = TolerancePolicy::FractionOfDiagonal;
    double tolerance_fraction = 0.001;
    double tolerance_absolute = 0.001;
    bool preserve_topology = true;

    // プレビュー件数の上限（レイヤ単位と、データセット全体での予算）
    std::size_t max_preview_features_per_layer = 500;
    std::size_t max_preview_features_total = 2500;

    // 出力座標の小数桁（元データの精度を出さない）
    int coordinate_precision = 6;

    std::string canonical_crs = "EPSG:4326";

    // 0 = CPU 数に合わせる
    int worker_count = 0;

    // 範囲外の値があれば EnvironmentError
    void validate() const;

    // 実際に使うワーカー数（>= 1）
    int effective_worker_count() const;
};

const char* tolerance_policy_name(TolerancePolicy p);

// JSON オブジェクトに含まれるキーだけ上書きする
void apply_config_json(EngineConfig& config, const nlohmann::json& j);

EngineConfig load_config(const std::string& path);

nlohmann::json config_to_json(const EngineConfig& config);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_CONFIG_HPP
