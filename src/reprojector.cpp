#include "gpkgsheet/reprojector.hpp"

#include <cmath>
#include <vector>

#include "gpkgsheet/errors.hpp"

namespace gpkgsheet {

Reprojector::Reprojector(const std::string& src, const std::string& dst) {
    if (src.empty()) return;  // CRS 不明: canonical とみなす

    ctx_ = proj_context_create();
    if (!ctx_) throw EnvironmentError("Failed to create PROJ context");

    PJ* P = proj_create_crs_to_crs(ctx_, src.c_str(), dst.c_str(), nullptr);
    if (!P) {
        // 候補の変換が無いだけの場合 errno は 0 のままで、文字列は nullptr になる
        const char* err = proj_errno_string(proj_context_errno(ctx_));
        const std::string msg = err ? err : "no transformation found";
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
        throw Error("proj_create_crs_to_crs failed (" + dst + "): " + msg);
    }

    // 軸順を lon,lat（easting,northing）に正規化する
    PJ* N = proj_normalize_for_visualization(ctx_, P);
    proj_destroy(P);
    if (!N) {
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
        throw Error("proj_normalize_for_visualization failed");
    }
    transform_ = N;
}

Reprojector::~Reprojector() {
    if (transform_) proj_destroy(transform_);
    if (ctx_) proj_context_destroy(ctx_);
}

bool Reprojector::transform(double& x, double& y) const {
    if (!transform_) return std::isfinite(x) && std::isfinite(y);

    PJ_COORD c = proj_coord(x, y, 0, 0);
    PJ_COORD out = proj_trans(transform_, PJ_FWD, c);
    if (!std::isfinite(out.xy.x) || !std::isfinite(out.xy.y) || out.xy.x == HUGE_VAL ||
        out.xy.y == HUGE_VAL) {
        return false;
    }
    x = out.xy.x;
    y = out.xy.y;
    return true;
}

namespace {

GEOSCoordSequence* transform_seq(GEOSContextHandle_t ctx, const GEOSCoordSequence* src,
                                 const Reprojector& r, BoundingBox& extent) {
    unsigned int n = 0;
    if (!src || !GEOSCoordSeq_getSize_r(ctx, src, &n)) return nullptr;

    GEOSCoordSequence* out = GEOSCoordSeq_create_r(ctx, n, 2);
    if (!out) return nullptr;

    for (unsigned int i = 0; i < n; i++) {
        double x = 0.0, y = 0.0;
        GEOSCoordSeq_getX_r(ctx, src, i, &x);
        GEOSCoordSeq_getY_r(ctx, src, i, &y);
        if (!r.transform(x, y)) {
            GEOSCoordSeq_destroy_r(ctx, out);
            return nullptr;
        }
        GEOSCoordSeq_setX_r(ctx, out, i, x);
        GEOSCoordSeq_setY_r(ctx, out, i, y);
        extent.add(x, y);
    }
    return out;
}

GeosGeomPtr rebuild(GEOSContextHandle_t ctx, const GEOSGeometry* g, const Reprojector& r,
                    BoundingBox& extent) {
    if (GEOSisEmpty_r(ctx, g) == 1) return make_geos_ptr(ctx, GEOSGeom_clone_r(ctx, g));

    const int type = GEOSGeomTypeId_r(ctx, g);
    switch (type) {
        case GEOS_POINT:
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            GEOSCoordSequence* cs = transform_seq(ctx, GEOSGeom_getCoordSeq_r(ctx, g), r, extent);
            if (!cs) return make_geos_ptr(ctx, nullptr);
            // create 系は座標列の所有権を持っていく
            if (type == GEOS_POINT) return make_geos_ptr(ctx, GEOSGeom_createPoint_r(ctx, cs));
            if (type == GEOS_LINESTRING) return make_geos_ptr(ctx, GEOSGeom_createLineString_r(ctx, cs));
            return make_geos_ptr(ctx, GEOSGeom_createLinearRing_r(ctx, cs));
        }
        case GEOS_POLYGON: {
            GeosGeomPtr shell = rebuild(ctx, GEOSGetExteriorRing_r(ctx, g), r, extent);
            if (!shell) return make_geos_ptr(ctx, nullptr);

            const int nholes = GEOSGetNumInteriorRings_r(ctx, g);
            std::vector<GeosGeomPtr> holes;
            for (int i = 0; i < nholes; i++) {
                GeosGeomPtr h = rebuild(ctx, GEOSGetInteriorRingN_r(ctx, g, i), r, extent);
                if (!h) return make_geos_ptr(ctx, nullptr);
                holes.push_back(std::move(h));
            }
            std::vector<GEOSGeometry*> raw;
            for (auto& h : holes) raw.push_back(h.release());
            return make_geos_ptr(ctx, GEOSGeom_createPolygon_r(ctx, shell.release(), raw.data(),
                                                               static_cast<unsigned int>(raw.size())));
        }
        case GEOS_MULTIPOINT:
        case GEOS_MULTILINESTRING:
        case GEOS_MULTIPOLYGON:
        case GEOS_GEOMETRYCOLLECTION: {
            const int n = GEOSGetNumGeometries_r(ctx, g);
            std::vector<GeosGeomPtr> parts;
            for (int i = 0; i < n; i++) {
                GeosGeomPtr p = rebuild(ctx, GEOSGetGeometryN_r(ctx, g, i), r, extent);
                if (!p) return make_geos_ptr(ctx, nullptr);
                parts.push_back(std::move(p));
            }
            std::vector<GEOSGeometry*> raw;
            for (auto& p : parts) raw.push_back(p.release());
            return make_geos_ptr(ctx, GEOSGeom_createCollection_r(ctx, type, raw.data(),
                                                                  static_cast<unsigned int>(raw.size())));
        }
        default:
            break;
    }
    return make_geos_ptr(ctx, nullptr);
}

}  // namespace

GeosGeomPtr reproject_geometry(GEOSContextHandle_t ctx, const GEOSGeometry* geom,
                               const Reprojector& reprojector, BoundingBox& extent) {
    if (!geom) return make_geos_ptr(ctx, nullptr);
    BoundingBox local;
    GeosGeomPtr out = rebuild(ctx, geom, reprojector, local);
    if (out) extent.merge(local);
    return out;
}

}  // namespace gpkgsheet
