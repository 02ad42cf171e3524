#ifndef GPKGSHEET_GEOMETRY_PREVIEW_HPP
#define GPKGSHEET_GEOMETRY_PREVIEW_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "gpkgsheet/config.hpp"
#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/geos_util.hpp"
#include "gpkgsheet/model.hpp"
#include "gpkgsheet/reprojector.hpp"

namespace gpkgsheet {

// 総数 total から cap 件を一定間隔で選んだときに、k 番目に選ぶ元のインデックス
std::int64_t strided_index(std::int64_t k, std::int64_t total, std::int64_t cap);

// レイヤあたりのプレビュー上限（データセット全体の予算をレイヤ数で割る）
std::size_t layer_feature_cap(const EngineConfig& config, std::size_t spatial_layer_count);

enum class SimplifyOutcome {
    NotAttempted,  // 点・空・許容誤差 0
    Simplified,
    FellBack       // 簡略化結果が無効だったので元のまま
};

// 簡略化。結果が無効・失敗・空になった場合は元のジオメトリの複製を返す。
GeosGeomPtr simplify_or_original(GEOSContextHandle_t ctx, const GEOSGeometry* geom,
                                 double tolerance, bool preserve_topology, SimplifyOutcome& outcome);

// GeoJSON geometry オブジェクトへ（座標は precision 桁で丸める）
nlohmann::ordered_json geos_to_geojson(GEOSContextHandle_t ctx, const GEOSGeometry* geom, int precision);

// 指定されたレイヤのプレビューを作る。データセットは自前で開き直すので
// コードリスト解決と別スレッドで並行に動かせる。
std::vector<GeometryPreview> build_previews(const DatasetHandle& handle,
                                            const std::vector<std::string>& layer_names,
                                            const EngineConfig& config, Diagnostics& diag);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_GEOMETRY_PREVIEW_HPP
