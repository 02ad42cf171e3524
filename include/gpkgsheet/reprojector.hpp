#ifndef GPKGSHEET_REPROJECTOR_HPP
#define GPKGSHEET_REPROJECTOR_HPP

#include <string>

#include <proj.h>

#include "gpkgsheet/geos_util.hpp"
#include "gpkgsheet/model.hpp"

namespace gpkgsheet {

// 任意の CRS -> canonical CRS（lon,lat 順に正規化）への変換器。
// src が空なら恒等変換（canonical とみなす）。
class Reprojector {
public:
    Reprojector(const std::string& src, const std::string& dst);
    ~Reprojector();

    Reprojector(const Reprojector&) = delete;
    Reprojector& operator=(const Reprojector&) = delete;

    bool is_identity() const { return transform_ == nullptr; }

    // 変換できなければ false（PROJ は HUGE_VAL を返す）
    bool transform(double& x, double& y) const;

private:
    PJ_CONTEXT* ctx_ = nullptr;
    PJ* transform_ = nullptr;
};

// 全座標を変換した新しいジオメトリを作る。extent には変換後の座標を足し込む。
// 変換できない座標があれば nullptr。
GeosGeomPtr reproject_geometry(GEOSContextHandle_t ctx, const GEOSGeometry* geom,
                               const Reprojector& reprojector, BoundingBox& extent);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_REPROJECTOR_HPP
