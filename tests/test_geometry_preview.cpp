#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/geometry_preview.hpp"
#include "gpkgsheet/reprojector.hpp"

#include "test_support.hpp"

using namespace gpkgsheet;
using gpkgsheet::test::TempGpkg;

namespace {

// 10000 点のレイヤ（EPSG:3857）
void build_points(TempGpkg& gpkg, int n) {
    OGRLayer* ly = gpkg.add_layer("stops", {{"kind", OFTString}}, wkbPoint, 3857);
    gpkg.begin();
    for (int i = 0; i < n; i++) {
        const double x = 1000.0 * (i % 100);
        const double y = 1000.0 * (i / 100);
        gpkg.add_row(ly, {std::string(i % 2 ? "bus" : "tram")},
                     "POINT (" + std::to_string(x) + " " + std::to_string(y) + ")");
    }
    gpkg.commit();
}

std::vector<std::int64_t> fids_of(const GeometryPreview& p) {
    std::vector<std::int64_t> out;
    for (const PreviewFeature& f : p.features) out.push_back(f.fid);
    return out;
}

}  // namespace

TEST(GeometryPreview, StridedIndex) {
    EXPECT_EQ(strided_index(3, 10, 20), 3);
    EXPECT_EQ(strided_index(0, 10000, 500), 0);
    EXPECT_EQ(strided_index(1, 10000, 500), 20);
    EXPECT_EQ(strided_index(499, 10000, 500), 9980);

    std::int64_t prev = -1;
    for (std::int64_t k = 0; k < 7; k++) {
        const std::int64_t i = strided_index(k, 10, 7);
        EXPECT_GT(i, prev);
        EXPECT_LT(i, 10);
        prev = i;
    }
}

TEST(GeometryPreview, LayerCapSharesTotalBudget) {
    EngineConfig config;
    EXPECT_EQ(layer_feature_cap(config, 1), 500u);
    EXPECT_EQ(layer_feature_cap(config, 5), 500u);
    EXPECT_EQ(layer_feature_cap(config, 10), 250u);
    EXPECT_EQ(layer_feature_cap(config, 10000), 1u);
}

TEST(GeometryPreview, KnownPointReprojection) {
    const Reprojector r("EPSG:3857", "EPSG:4326");
    ASSERT_FALSE(r.is_identity());

    double x = 1113194.9079327357, y = 5621521.486192066;
    ASSERT_TRUE(r.transform(x, y));
    EXPECT_NEAR(x, 10.0, 1e-6);
    EXPECT_NEAR(y, 45.0, 1e-6);

    x = 15550408.912046732;
    y = 4257980.732184108;
    ASSERT_TRUE(r.transform(x, y));
    EXPECT_NEAR(x, 139.6917, 1e-6);
    EXPECT_NEAR(y, 35.6895, 1e-6);
}

TEST(GeometryPreview, EmptySourceIsIdentity) {
    const Reprojector r("", "EPSG:4326");
    EXPECT_TRUE(r.is_identity());
    double x = 12.5, y = -3.25;
    ASSERT_TRUE(r.transform(x, y));
    EXPECT_EQ(x, 12.5);
    EXPECT_EQ(y, -3.25);
}

TEST(GeometryPreview, CrsWithoutTransformationThrows) {
    // ローカル座標系から地理座標系への変換経路は無い
    const std::string local =
        "LOCAL_CS[\"site grid\",LOCAL_DATUM[\"site\",0],UNIT[\"metre\",1],"
        "AXIS[\"Easting\",EAST],AXIS[\"Northing\",NORTH]]";
    EXPECT_THROW((Reprojector(local, "EPSG:4326")), Error);
    EXPECT_THROW((Reprojector("not a crs", "EPSG:4326")), Error);
}

TEST(GeometryPreview, ReprojectGeometryTracksExtent) {
    GeosContext geos;
    GeosGeomPtr g = geos_from_wkt(geos.get(), "LINESTRING (0 0, 1113194.9079327357 5621521.486192066)");
    ASSERT_TRUE(g);

    const Reprojector r("EPSG:3857", "EPSG:4326");
    BoundingBox extent;
    GeosGeomPtr out = reproject_geometry(geos.get(), g.get(), r, extent);
    ASSERT_TRUE(out);
    EXPECT_NEAR(extent.min_lon, 0.0, 1e-9);
    EXPECT_NEAR(extent.max_lon, 10.0, 1e-6);
    EXPECT_NEAR(extent.max_lat, 45.0, 1e-6);
    EXPECT_EQ(geos_vertex_count(geos.get(), out.get()), 2u);
}

TEST(GeometryPreview, SimplifiedIsValidOrOriginal) {
    GeosContext geos;
    GEOSContextHandle_t ctx = geos.get();

    const std::vector<std::string> inputs = {
        "POLYGON ((0 0, 5 0.01, 10 0, 10.01 5, 10 10, 5 9.99, 0 10, 0.01 5, 0 0))",
        "LINESTRING (0 0, 1 0.001, 2 0, 3 0.001, 4 0)",
        // 自己交差（入力から無効）
        "POLYGON ((0 0, 10 10, 10 0, 0 10, 0 0))",
        "MULTIPOLYGON (((0 0, 1 0, 1 1, 0 1, 0 0)), ((2 2, 3 2, 3 3, 2 3, 2 2)))",
        "POLYGON ((0 0, 0.5 0, 0.5 0.5, 0 0.5, 0 0))"};

    for (const std::string& wkt : inputs) {
        for (bool preserve : {true, false}) {
            GeosGeomPtr g = geos_from_wkt(ctx, wkt);
            ASSERT_TRUE(g) << wkt;
            SimplifyOutcome outcome = SimplifyOutcome::NotAttempted;
            GeosGeomPtr s = simplify_or_original(ctx, g.get(), 1.0, preserve, outcome);
            ASSERT_TRUE(s) << wkt;

            const bool identical = GEOSEqualsExact_r(ctx, s.get(), g.get(), 0.0) == 1;
            EXPECT_TRUE(geos_is_valid(ctx, s.get()) || identical) << wkt;
            if (outcome == SimplifyOutcome::FellBack) EXPECT_TRUE(identical) << wkt;
            if (outcome == SimplifyOutcome::Simplified) {
                EXPECT_LE(geos_vertex_count(ctx, s.get()), geos_vertex_count(ctx, g.get())) << wkt;
            }
        }
    }
}

TEST(GeometryPreview, CollapsedSimplificationFallsBack) {
    GeosContext geos;
    GEOSContextHandle_t ctx = geos.get();

    // 許容誤差より小さいポリゴンは Douglas-Peucker で空になる
    GeosGeomPtr g = geos_from_wkt(ctx, "POLYGON ((0 0, 0.5 0, 0.5 0.5, 0 0.5, 0 0))");
    ASSERT_TRUE(g);
    SimplifyOutcome outcome = SimplifyOutcome::NotAttempted;
    GeosGeomPtr s = simplify_or_original(ctx, g.get(), 1.0, false, outcome);
    ASSERT_TRUE(s);
    EXPECT_EQ(outcome, SimplifyOutcome::FellBack);
    EXPECT_EQ(GEOSEqualsExact_r(ctx, s.get(), g.get(), 0.0), 1);
}

TEST(GeometryPreview, FallbackIsReportedOncePerLayer) {
    TempGpkg gpkg("preview_fallback");
    OGRLayer* ly = gpkg.add_layer("plots", {{"name", OFTString}}, wkbPolygon, 4326);
    gpkg.begin();
    for (int i = 0; i < 3; i++) {
        const std::string x0 = std::to_string(10 * i);
        const std::string x1 = std::to_string(10 * i) + ".5";
        gpkg.add_row(ly, {std::string("plot ") + std::to_string(i)},
                     "POLYGON ((" + x0 + " 40, " + x1 + " 40, " + x1 + " 40.5, " + x0 + " 40.5, " + x0 + " 40))");
    }
    gpkg.commit();
    gpkg.close();

    EngineConfig config;
    config.tolerance_policy = TolerancePolicy::Absolute;
    config.tolerance_absolute = 1.0;
    config.preserve_topology = false;

    Diagnostics diag;
    const auto previews = build_previews(gpkg.handle(), {"plots"}, config, diag);

    ASSERT_EQ(previews.size(), 1u);
    ASSERT_EQ(previews[0].features.size(), 3u);
    for (const PreviewFeature& f : previews[0].features) {
        EXPECT_FALSE(f.simplified);
        // 元の 5 頂点のリングがそのまま残る
        EXPECT_EQ(f.geometry["type"], "Polygon");
        EXPECT_EQ(f.geometry["coordinates"][0].size(), 5u);
    }

    ASSERT_EQ(diag.count(IssueKind::GeometryInvalidAfterSimplification), 1u);
    const auto issues = diag.issues();
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].layer, "plots");
    EXPECT_NE(issues[0].message.find("3 features"), std::string::npos) << issues[0].message;
}

TEST(GeometryPreview, PointsAreNotSimplified) {
    GeosContext geos;
    GeosGeomPtr g = geos_from_wkt(geos.get(), "POINT (1 2)");
    SimplifyOutcome outcome = SimplifyOutcome::Simplified;
    GeosGeomPtr s = simplify_or_original(geos.get(), g.get(), 10.0, true, outcome);
    EXPECT_EQ(outcome, SimplifyOutcome::NotAttempted);
    EXPECT_EQ(geos_to_wkt(geos.get(), s.get()), geos_to_wkt(geos.get(), g.get()));
}

TEST(GeometryPreview, GeoJsonRoundsCoordinates) {
    GeosContext geos;
    GeosGeomPtr p = geos_from_wkt(geos.get(), "POINT (1.23456789 2.5)");
    const auto j = geos_to_geojson(geos.get(), p.get(), 6);
    EXPECT_EQ(j["type"], "Point");
    EXPECT_DOUBLE_EQ(j["coordinates"][0].get<double>(), 1.234568);
    EXPECT_DOUBLE_EQ(j["coordinates"][1].get<double>(), 2.5);

    GeosGeomPtr poly = geos_from_wkt(geos.get(), "POLYGON ((0 0, 1 0, 1 1, 0 0), (0.2 0.1, 0.3 0.1, 0.3 0.2, 0.2 0.1))");
    const auto k = geos_to_geojson(geos.get(), poly.get(), 6);
    EXPECT_EQ(k["type"], "Polygon");
    ASSERT_EQ(k["coordinates"].size(), 2u);
    EXPECT_EQ(k["coordinates"][0].size(), 4u);

    GeosGeomPtr gc = geos_from_wkt(geos.get(), "GEOMETRYCOLLECTION (POINT (0 0), LINESTRING (0 0, 1 1))");
    const auto m = geos_to_geojson(geos.get(), gc.get(), 6);
    EXPECT_EQ(m["type"], "GeometryCollection");
    ASSERT_EQ(m["geometries"].size(), 2u);
    EXPECT_EQ(m["geometries"][1]["type"], "LineString");
}

TEST(GeometryPreview, CapsLargeLayerReproducibly) {
    TempGpkg gpkg("preview_cap");
    build_points(gpkg, 10000);
    gpkg.close();

    const EngineConfig config;
    Diagnostics diag;
    const auto first = build_previews(gpkg.handle(), {"stops"}, config, diag);
    const auto second = build_previews(gpkg.handle(), {"stops"}, config, diag);

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    const GeometryPreview& p = first[0];
    EXPECT_EQ(p.total_features, 10000);
    EXPECT_EQ(p.feature_cap, 500u);
    ASSERT_EQ(p.features.size(), 500u);
    EXPECT_EQ(fids_of(p), fids_of(second[0]));
    EXPECT_EQ(p.crs, "EPSG:4326");
    EXPECT_FALSE(p.source_crs_assumed);

    // 範囲は全件（間引き前）から
    ASSERT_FALSE(p.extent.empty());
    EXPECT_NEAR(p.extent.min_lon, 0.0, 1e-9);
    EXPECT_GT(p.extent.max_lon, 0.88);
    EXPECT_GT(p.extent.max_lat, 0.88);

    EXPECT_EQ(p.features[0].geometry["type"], "Point");
    EXPECT_TRUE(p.features[0].properties.contains("kind"));
    EXPECT_EQ(diag.total(), 0u);
}

TEST(GeometryPreview, SmallLayerKeepsEverything) {
    TempGpkg gpkg("preview_small");
    build_points(gpkg, 12);
    gpkg.close();

    Diagnostics diag;
    const auto previews = build_previews(gpkg.handle(), {"stops"}, EngineConfig(), diag);
    ASSERT_EQ(previews.size(), 1u);
    EXPECT_EQ(previews[0].features.size(), 12u);
}

TEST(GeometryPreview, MissingCrsIsAssumedCanonical) {
    TempGpkg gpkg("preview_nocrs");
    OGRLayer* ly = gpkg.add_layer("sketch", {}, wkbLineString, 0);
    gpkg.add_row(ly, {}, "LINESTRING (10 50, 11 51)");
    gpkg.close();

    Diagnostics diag;
    const auto previews = build_previews(gpkg.handle(), {"sketch", "nonexistent"}, EngineConfig(), diag);

    ASSERT_EQ(previews.size(), 1u);
    EXPECT_TRUE(previews[0].source_crs_assumed);
    EXPECT_NEAR(previews[0].extent.min_lon, 10.0, 1e-9);
    EXPECT_NEAR(previews[0].extent.max_lat, 51.0, 1e-9);
    EXPECT_EQ(diag.count(IssueKind::LayerUnreadable), 1u);
}
