#include "gpkgsheet/geos_util.hpp"

#include <vector>

#include "ogr_geometry.h"

#include "gpkgsheet/errors.hpp"

namespace gpkgsheet {

GeosContext::GeosContext() {
    ctx_ = GEOS_init_r();
    if (!ctx_) throw EnvironmentError("GEOS_init_r failed");
    // userData にこのオブジェクトを渡してエラー文言を拾う
    GEOSContext_setNoticeMessageHandler_r(ctx_, on_notice, this);
    GEOSContext_setErrorMessageHandler_r(ctx_, on_error, this);
}

GeosContext::~GeosContext() {
    if (ctx_) GEOS_finish_r(ctx_);
}

void GeosContext::on_notice(const char* /*msg*/, void* /*userdata*/) {}

void GeosContext::on_error(const char* msg, void* userdata) {
    auto* self = static_cast<GeosContext*>(userdata);
    if (self && msg) self->last_error_ = msg;
}

GeosGeomPtr geos_from_ogr(GEOSContextHandle_t ctx, const OGRGeometry& geom) {
    // 曲線は線形化、Z/M は落として 2D にする
    std::unique_ptr<OGRGeometry> work(geom.hasCurveGeometry() ? geom.getLinearGeometry() : geom.clone());
    if (!work) return make_geos_ptr(ctx, nullptr);
    work->flattenTo2D();

    std::vector<unsigned char> wkb(work->WkbSize());
    if (work->exportToWkb(wkbNDR, wkb.data()) != OGRERR_NONE) return make_geos_ptr(ctx, nullptr);

    GEOSWKBReader* rdr = GEOSWKBReader_create_r(ctx);
    if (!rdr) return make_geos_ptr(ctx, nullptr);
    GEOSGeometry* g = GEOSWKBReader_read_r(ctx, rdr, wkb.data(), wkb.size());
    GEOSWKBReader_destroy_r(ctx, rdr);
    return make_geos_ptr(ctx, g);
}

GeosGeomPtr geos_from_wkt(GEOSContextHandle_t ctx, const std::string& wkt) {
    GEOSWKTReader* rdr = GEOSWKTReader_create_r(ctx);
    if (!rdr) return make_geos_ptr(ctx, nullptr);
    GEOSGeometry* g = GEOSWKTReader_read_r(ctx, rdr, wkt.c_str());
    GEOSWKTReader_destroy_r(ctx, rdr);
    return make_geos_ptr(ctx, g);
}

std::string geos_to_wkt(GEOSContextHandle_t ctx, const GEOSGeometry* g) {
    if (!g) return "";
    GEOSWKTWriter* w = GEOSWKTWriter_create_r(ctx);
    if (!w) return "";
    GEOSWKTWriter_setRoundingPrecision_r(ctx, w, 10);
    char* s = GEOSWKTWriter_write_r(ctx, w, g);
    GEOSWKTWriter_destroy_r(ctx, w);
    std::string out = s ? std::string(s) : "";
    GEOSFree_r(ctx, s);
    return out;
}

std::uint64_t geos_vertex_count(GEOSContextHandle_t ctx, const GEOSGeometry* g) {
    if (!g) return 0;
    const int n = GEOSGetNumCoordinates_r(ctx, g);
    return n > 0 ? static_cast<std::uint64_t>(n) : 0;
}

bool geos_is_valid(GEOSContextHandle_t ctx, const GEOSGeometry* g) {
    return g && GEOSisValid_r(ctx, g) == 1;
}

}  // namespace gpkgsheet
