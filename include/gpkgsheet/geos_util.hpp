#ifndef GPKGSHEET_GEOS_UTIL_HPP
#define GPKGSHEET_GEOS_UTIL_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <geos_c.h>

class OGRGeometry;

namespace gpkgsheet {

// GEOS の再入可能 API 用コンテキスト。スレッドごとに1つ持つ。
class GeosContext {
public:
    GeosContext();
    ~GeosContext();

    GeosContext(const GeosContext&) = delete;
    GeosContext& operator=(const GeosContext&) = delete;

    GEOSContextHandle_t get() const { return ctx_; }

    // 直近のエラーメッセージ（ハンドラで拾ったもの）
    const std::string& last_error() const { return last_error_; }

private:
    static void on_notice(const char* msg, void* userdata);
    static void on_error(const char* msg, void* userdata);

    GEOSContextHandle_t ctx_ = nullptr;
    std::string last_error_;
};

struct GeosGeomDeleter {
    GEOSContextHandle_t ctx = nullptr;
    void operator()(GEOSGeometry* g) const {
        if (g) GEOSGeom_destroy_r(ctx, g);
    }
};

using GeosGeomPtr = std::unique_ptr<GEOSGeometry, GeosGeomDeleter>;

inline GeosGeomPtr make_geos_ptr(GEOSContextHandle_t ctx, GEOSGeometry* g) {
    return GeosGeomPtr(g, GeosGeomDeleter{ctx});
}

// OGR -> GEOS（WKB 経由）。曲線は線形化してから渡す。失敗時は nullptr。
GeosGeomPtr geos_from_ogr(GEOSContextHandle_t ctx, const OGRGeometry& geom);

GeosGeomPtr geos_from_wkt(GEOSContextHandle_t ctx, const std::string& wkt);

std::string geos_to_wkt(GEOSContextHandle_t ctx, const GEOSGeometry* g);

std::uint64_t geos_vertex_count(GEOSContextHandle_t ctx, const GEOSGeometry* g);

bool geos_is_valid(GEOSContextHandle_t ctx, const GEOSGeometry* g);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_GEOS_UTIL_HPP
