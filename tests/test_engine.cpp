#include <gtest/gtest.h>

#include "gpkgsheet/engine.hpp"
#include "gpkgsheet/errors.hpp"

#include "test_support.hpp"

using namespace gpkgsheet;
using gpkgsheet::test::TempGpkg;

namespace {

// 区画（EPSG:3857）、土地利用は推定、地域区分はコード表
void build_zoning(TempGpkg& gpkg) {
    OGRLayer* parcels = gpkg.add_layer("parcels",
                                       {{"parcel_no", OFTString}, {"landuse", OFTString}, {"region_type", OFTString}},
                                       wkbPolygon, 3857);
    static const char* const kLanduse[] = {"housing", "retail", "park"};
    gpkg.begin();
    for (int i = 0; i < 50; i++) {
        const double x = 100.0 * i;
        gpkg.add_row(parcels,
                     {std::string("P-") + std::to_string(i), std::string(kLanduse[i % 3]),
                      std::string(i % 2 ? "R1" : "R2")},
                     "POLYGON ((" + std::to_string(x) + " 0, " + std::to_string(x + 50) + " 0, " +
                         std::to_string(x + 50) + " 50, " + std::to_string(x) + " 50, " + std::to_string(x) +
                         " 0))");
    }
    gpkg.commit();

    OGRLayer* code = gpkg.add_layer("code_region_type", {{"code", OFTString}, {"label", OFTString}});
    gpkg.add_row(code, {std::string("R1"), std::string("Urban")});
    gpkg.add_row(code, {std::string("R2"), std::string("Rural")});
    gpkg.add_row(code, {std::string("R1"), std::string("Urban again")});

    OGRLayer* owners = gpkg.add_layer("owners", {{"name", OFTString}});
    gpkg.add_row(owners, {std::string("City")});
    gpkg.close();
}

}  // namespace

TEST(Engine, ProfilesDatasetEndToEnd) {
    TempGpkg gpkg("zoning");
    build_zoning(gpkg);

    const JsonMetadataSource meta(nlohmann::ordered_json{{"zoning", {{"title", "Zoning plan"}}}});
    const ProfileEngine engine(EngineConfig(), &meta);
    const DocumentPtr doc = engine.profile(gpkg.handle());

    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(doc->dataset_name, "zoning");
    ASSERT_EQ(doc->layers.size(), 2u);
    EXPECT_EQ(doc->layers[0].name, "parcels");
    EXPECT_EQ(doc->layers[1].name, "owners");

    const CodeList* region = doc->code_list_for("parcels", "region_type");
    ASSERT_NE(region, nullptr);
    EXPECT_EQ(region->source, CodeListSource::CodeTable);
    ASSERT_EQ(region->entries.size(), 2u);
    EXPECT_EQ(*region->entries[0].label, "Urban");

    const CodeList* landuse = doc->code_list_for("parcels", "landuse");
    ASSERT_NE(landuse, nullptr);
    EXPECT_EQ(landuse->source, CodeListSource::Inferred);
    EXPECT_EQ(landuse->entries.size(), 3u);

    EXPECT_EQ(doc->code_list_for("parcels", "parcel_no"), nullptr);

    const GeometryPreview* p = doc->preview_for("parcels");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->features.size(), 50u);
    EXPECT_FALSE(doc->extent.empty());
    EXPECT_LT(doc->extent.max_lon, 0.1);

    ASSERT_EQ(doc->metadata.size(), 1u);
    EXPECT_EQ(doc->metadata[0].second, "Zoning plan");
}

TEST(Engine, UnreadableDatasetThrows) {
    const ProfileEngine engine{EngineConfig()};
    EXPECT_THROW(engine.profile(make_dataset_handle("/vsimem/gpkgsheet_tests/absent.gpkg")), DatasetUnreadable);
}

TEST(Engine, ProfileAllSkipsUnreadable) {
    TempGpkg a("batch_a");
    build_zoning(a);
    TempGpkg b("batch_b");
    build_zoning(b);

    EngineConfig config;
    config.worker_count = 2;
    const ProfileEngine engine(config);
    const auto results = engine.profile_all(
        {a.handle(), make_dataset_handle("/vsimem/gpkgsheet_tests/absent.gpkg"), b.handle()});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].document->dataset_name, "batch_a");
    EXPECT_FALSE(results[1].ok());
    EXPECT_FALSE(results[1].error.empty());
    EXPECT_EQ(results[1].handle.name, "absent");
    EXPECT_TRUE(results[2].ok());
    EXPECT_EQ(results[2].document->dataset_name, "batch_b");
}

TEST(Engine, ProfileAllEnvironmentErrors) {
    const ProfileEngine engine{EngineConfig()};
    EXPECT_THROW(engine.profile_all({}), EnvironmentError);
    EXPECT_THROW(engine.profile_all({make_dataset_handle("/vsimem/gpkgsheet_tests/absent.gpkg")}),
                 EnvironmentError);
}

TEST(Engine, InvalidConfigRejected) {
    EngineConfig config;
    config.coordinate_precision = -1;
    EXPECT_THROW(ProfileEngine{config}, EnvironmentError);
}
