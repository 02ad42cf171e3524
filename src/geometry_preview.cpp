#include "gpkgsheet/geometry_preview.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "cpl_conv.h"  // CPLFree
#include "cpl_error.h"
#include "gdal_priv.h"
#include "ogr_spatialref.h"
#include "ogrsf_frmts.h"

using json = nlohmann::ordered_json;

namespace gpkgsheet {

std::int64_t strided_index(std::int64_t k, std::int64_t total, std::int64_t cap) {
    if (cap <= 0 || total <= cap) return k;
    // floor(k * N / cap): 先頭から一定間隔、ちょうど cap 件
    return (k * total) / cap;
}

std::size_t layer_feature_cap(const EngineConfig& config, std::size_t spatial_layer_count) {
    const std::size_t per_layer = std::max<std::size_t>(1, config.max_preview_features_per_layer);
    if (spatial_layer_count == 0) return per_layer;
    const std::size_t share = std::max<std::size_t>(1, config.max_preview_features_total / spatial_layer_count);
    return std::min(per_layer, share);
}

GeosGeomPtr simplify_or_original(GEOSContextHandle_t ctx, const GEOSGeometry* geom, double tolerance,
                                 bool preserve_topology, SimplifyOutcome& outcome) {
    outcome = SimplifyOutcome::NotAttempted;
    if (!geom) return make_geos_ptr(ctx, nullptr);

    const int type = GEOSGeomTypeId_r(ctx, geom);
    if (tolerance <= 0.0 || type == GEOS_POINT || type == GEOS_MULTIPOINT || GEOSisEmpty_r(ctx, geom) == 1) {
        return make_geos_ptr(ctx, GEOSGeom_clone_r(ctx, geom));
    }

    GeosGeomPtr s = make_geos_ptr(ctx, preserve_topology ? GEOSTopologyPreserveSimplify_r(ctx, geom, tolerance)
                                                         : GEOSSimplify_r(ctx, geom, tolerance));

    // 失敗・無効・消えてしまった場合は元に戻す
    if (!s || !geos_is_valid(ctx, s.get()) || GEOSisEmpty_r(ctx, s.get()) == 1) {
        outcome = SimplifyOutcome::FellBack;
        return make_geos_ptr(ctx, GEOSGeom_clone_r(ctx, geom));
    }
    outcome = SimplifyOutcome::Simplified;
    return s;
}

namespace {

double round_to(double v, int precision) {
    const double f = std::pow(10.0, precision);
    return std::round(v * f) / f;
}

json coords_to_json(GEOSContextHandle_t ctx, const GEOSCoordSequence* cs, int precision) {
    json coords = json::array();
    unsigned int n = 0;
    if (!cs || !GEOSCoordSeq_getSize_r(ctx, cs, &n)) return coords;

    coords.get_ref<json::array_t&>().reserve(n);
    for (unsigned int i = 0; i < n; i++) {
        double x = 0.0, y = 0.0;
        GEOSCoordSeq_getX_r(ctx, cs, i, &x);
        GEOSCoordSeq_getY_r(ctx, cs, i, &y);
        coords.push_back(json::array({round_to(x, precision), round_to(y, precision)}));
    }
    return coords;
}

// GeoJSON の "coordinates" 部分（GeometryCollection 以外）
json coordinates_of(GEOSContextHandle_t ctx, const GEOSGeometry* g, int precision) {
    const int type = GEOSGeomTypeId_r(ctx, g);
    switch (type) {
        case GEOS_POINT: {
            if (GEOSisEmpty_r(ctx, g) == 1) return json::array();
            json c = coords_to_json(ctx, GEOSGeom_getCoordSeq_r(ctx, g), precision);
            return c.empty() ? json::array() : c[0];
        }
        case GEOS_LINESTRING:
        case GEOS_LINEARRING:
            return coords_to_json(ctx, GEOSGeom_getCoordSeq_r(ctx, g), precision);
        case GEOS_POLYGON: {
            json rings = json::array();
            if (GEOSisEmpty_r(ctx, g) == 1) return rings;
            rings.push_back(coordinates_of(ctx, GEOSGetExteriorRing_r(ctx, g), precision));
            const int holes = GEOSGetNumInteriorRings_r(ctx, g);
            for (int i = 0; i < holes; i++) {
                rings.push_back(coordinates_of(ctx, GEOSGetInteriorRingN_r(ctx, g, i), precision));
            }
            return rings;
        }
        default: {
            json parts = json::array();
            const int n = GEOSGetNumGeometries_r(ctx, g);
            for (int i = 0; i < n; i++) {
                parts.push_back(coordinates_of(ctx, GEOSGetGeometryN_r(ctx, g, i), precision));
            }
            return parts;
        }
    }
}

const char* geojson_type_name(int geos_type) {
    switch (geos_type) {
        case GEOS_POINT: return "Point";
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: return "LineString";
        case GEOS_POLYGON: return "Polygon";
        case GEOS_MULTIPOINT: return "MultiPoint";
        case GEOS_MULTILINESTRING: return "MultiLineString";
        case GEOS_MULTIPOLYGON: return "MultiPolygon";
        default: return "GeometryCollection";
    }
}

std::string layer_crs_wkt(OGRLayer& ly) {
    const OGRSpatialReference* srs = ly.GetSpatialRef();  // layer 所有
    if (!srs) return "";
    char* wkt = nullptr;
    srs->exportToWkt(&wkt);
    std::string out = wkt ? wkt : "";
    CPLFree(wkt);
    return out;
}

json feature_properties(const OGRFeature& f) {
    json props = json::object();
    for (int i = 0; i < f.GetFieldCount(); i++) {
        const OGRFieldDefn* defn = f.GetFieldDefnRef(i);
        if (!defn) continue;
        if (f.IsFieldSetAndNotNull(i)) {
            props[defn->GetNameRef()] = f.GetFieldAsString(i);
        } else {
            props[defn->GetNameRef()] = nullptr;
        }
    }
    return props;
}

constexpr std::size_t kSampleFidCount = 5;

// 地物単位の問題はレイヤーごと・種類ごとに 1 件へまとめる
struct FeatureIssueTally {
    std::size_t count = 0;
    std::vector<std::int64_t> sample_fids;
    std::string first_detail;

    void add(std::int64_t fid, const std::string& detail) {
        if (count == 0) first_detail = detail;
        if (sample_fids.size() < kSampleFidCount) sample_fids.push_back(fid);
        count++;
    }

    void flush(Diagnostics& diag, IssueKind kind, const std::string& layer, const std::string& what) const {
        if (count == 0) return;
        std::string msg = std::to_string(count) + (count == 1 ? " feature " : " features ") + what + " (fid ";
        for (std::size_t i = 0; i < sample_fids.size(); i++) {
            if (i > 0) msg += ", ";
            msg += std::to_string(sample_fids[i]);
        }
        if (count > sample_fids.size()) msg += ", ...";
        msg += ")";
        if (!first_detail.empty()) msg += ": " + first_detail;
        diag.report(kind, layer, "", msg);
    }
};

struct PendingFeature {
    PreviewFeature feature;
    GeosGeomPtr geometry;  // canonical CRS、簡略化前
};

struct PendingLayer {
    GeometryPreview preview;
    std::vector<PendingFeature> items;
};

}  // namespace

json geos_to_geojson(GEOSContextHandle_t ctx, const GEOSGeometry* geom, int precision) {
    if (!geom) return nullptr;
    const int type = GEOSGeomTypeId_r(ctx, geom);
    if (type == GEOS_GEOMETRYCOLLECTION) {
        json geometries = json::array();
        const int n = GEOSGetNumGeometries_r(ctx, geom);
        for (int i = 0; i < n; i++) {
            geometries.push_back(geos_to_geojson(ctx, GEOSGetGeometryN_r(ctx, geom, i), precision));
        }
        return json{{"type", "GeometryCollection"}, {"geometries", geometries}};
    }
    return json{{"type", geojson_type_name(type)}, {"coordinates", coordinates_of(ctx, geom, precision)}};
}

std::vector<GeometryPreview> build_previews(const DatasetHandle& handle,
                                            const std::vector<std::string>& layer_names,
                                            const EngineConfig& config, Diagnostics& diag) {
    std::vector<GeometryPreview> out;
    if (layer_names.empty()) return out;

    // コードリスト解決と並行に動くので専用のハンドルを開く
    GDALDatasetUniquePtr ds(GDALDataset::Open(handle.path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!ds) throw DatasetUnreadable(handle.name, "failed to reopen for geometry preview");

    GeosContext geos;
    GEOSContextHandle_t ctx = geos.get();
    const std::int64_t cap = static_cast<std::int64_t>(layer_feature_cap(config, layer_names.size()));

    std::vector<PendingLayer> pending;
    BoundingBox dataset_extent;

    // ---- 1パス目: 読み込み・再投影・範囲・間引き ----
    for (const std::string& name : layer_names) {
        OGRLayer* ly = ds->GetLayerByName(name.c_str());
        if (!ly) {
            diag.report(IssueKind::LayerUnreadable, name, "", "layer not found for preview");
            continue;
        }

        const std::string src_wkt = layer_crs_wkt(*ly);
        std::unique_ptr<Reprojector> reprojector;
        try {
            reprojector = std::make_unique<Reprojector>(src_wkt, config.canonical_crs);
        } catch (const Error& e) {
            // 変換経路の無い CRS（ローカル座標系など）はレイヤー単位で諦める
            diag.report(IssueKind::GeometryUnprojectable, name, "", e.what());
            continue;
        }

        PendingLayer pl;
        pl.preview.layer = name;
        pl.preview.crs = config.canonical_crs;
        pl.preview.source_crs_assumed = src_wkt.empty();
        pl.preview.feature_cap = static_cast<std::size_t>(cap);
        if (pl.preview.source_crs_assumed) {
            CPLDebug("GPKGSHEET", "%s: layer %s has no CRS; assuming %s", handle.name.c_str(), name.c_str(),
                     config.canonical_crs.c_str());
        }

        const std::int64_t total = static_cast<std::int64_t>(ly->GetFeatureCount(TRUE));
        pl.preview.total_features = total;

        std::int64_t k = 0;
        std::int64_t next = strided_index(0, total, cap);
        std::int64_t index = 0;
        FeatureIssueTally unprojectable;

        CPLErrorReset();
        ly->ResetReading();
        for (OGRFeatureUniquePtr f(ly->GetNextFeature()); f; f.reset(ly->GetNextFeature()), index++) {
            const bool selected = (k < cap && index == next);
            if (selected) {
                k++;
                next = strided_index(k, total, cap);
            }

            GeosGeomPtr projected = make_geos_ptr(ctx, nullptr);
            if (const OGRGeometry* g = f->GetGeometryRef()) {
                GeosGeomPtr native = geos_from_ogr(ctx, *g);
                if (!native) {
                    CPLDebug("GPKGSHEET", "%s: %s feature " CPL_FRMT_GIB ": GEOS could not read geometry: %s",
                             handle.name.c_str(), name.c_str(), f->GetFID(), geos.last_error().c_str());
                    unprojectable.add(f->GetFID(), "GEOS could not read geometry: " + geos.last_error());
                    continue;
                }
                projected = reproject_geometry(ctx, native.get(), *reprojector, pl.preview.extent);
                if (!projected) {
                    CPLDebug("GPKGSHEET", "%s: %s feature " CPL_FRMT_GIB " could not be reprojected",
                             handle.name.c_str(), name.c_str(), f->GetFID());
                    unprojectable.add(f->GetFID(), "");
                    continue;
                }
            }

            if (!selected) continue;
            PendingFeature pf;
            pf.feature.fid = static_cast<std::int64_t>(f->GetFID());
            pf.feature.properties = feature_properties(*f);
            pf.geometry = std::move(projected);
            pl.items.push_back(std::move(pf));
        }

        if (CPLGetLastErrorType() == CE_Failure) {
            diag.report(IssueKind::LayerUnreadable, name, "",
                        std::string("error while reading features for preview: ") + CPLGetLastErrorMsg());
            continue;
        }

        unprojectable.flush(diag, IssueKind::GeometryUnprojectable, name,
                            "could not be converted to " + config.canonical_crs);
        dataset_extent.merge(pl.preview.extent);
        pending.push_back(std::move(pl));
    }

    // ---- 許容誤差（データセット全体の範囲から決める）----
    double tolerance = config.tolerance_absolute;
    if (config.tolerance_policy == TolerancePolicy::FractionOfDiagonal) {
        tolerance = config.tolerance_fraction * dataset_extent.diagonal();
    }

    // ---- 2パス目: 簡略化と GeoJSON 化 ----
    for (PendingLayer& pl : pending) {
        pl.preview.tolerance = tolerance;
        FeatureIssueTally fell_back;
        for (PendingFeature& pf : pl.items) {
            if (pf.geometry) {
                SimplifyOutcome outcome = SimplifyOutcome::NotAttempted;
                GeosGeomPtr s = simplify_or_original(ctx, pf.geometry.get(), tolerance, config.preserve_topology,
                                                     outcome);
                if (outcome == SimplifyOutcome::FellBack) fell_back.add(pf.feature.fid, "");
                pf.feature.simplified = (outcome == SimplifyOutcome::Simplified);
                pf.feature.geometry = geos_to_geojson(ctx, s ? s.get() : pf.geometry.get(),
                                                      config.coordinate_precision);
            } else {
                pf.feature.geometry = nullptr;
            }
            pl.preview.features.push_back(std::move(pf.feature));
        }
        fell_back.flush(diag, IssueKind::GeometryInvalidAfterSimplification, pl.preview.layer,
                        "kept their original geometry, simplification at tolerance " + std::to_string(tolerance) +
                            " was invalid or empty");

        CPLDebug("GPKGSHEET", "%s: preview %s: %d of %lld features, tolerance %g", handle.name.c_str(),
                 pl.preview.layer.c_str(), static_cast<int>(pl.preview.features.size()),
                 static_cast<long long>(pl.preview.total_features), tolerance);
        out.push_back(std::move(pl.preview));
    }
    return out;
}

}  // namespace gpkgsheet
