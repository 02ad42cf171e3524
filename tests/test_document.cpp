#include <gtest/gtest.h>

#include "gpkgsheet/document.hpp"

#include "test_support.hpp"

using namespace gpkgsheet;
using gpkgsheet::test::attribute_layer;
using gpkgsheet::test::code_table;
using gpkgsheet::test::text_field;
using nlohmann::ordered_json;

namespace {

DatasetCatalog sample_catalog() {
    DatasetCatalog cat;
    cat.name = "zoning";
    cat.path = "/data/zoning.gpkg";
    cat.driver = "GPKG";

    Layer parcels = attribute_layer("parcels", {text_field("zone", {"A", "B", "A"})});
    parcels.kind = LayerKind::Spatial;
    parcels.geometry_type = "Polygon";
    parcels.geometry_column = "geom";
    parcels.crs = "EPSG:25833";
    parcels.feature_count = 3;
    cat.layers.push_back(parcels);
    cat.layers.push_back(code_table("code_zone", {{std::string("A"), std::string("Residential")}}));
    cat.layers.push_back(attribute_layer("owners", {text_field("owner", {"x"})}));
    return cat;
}

GeometryPreview preview(const std::string& layer, double lon, double lat) {
    GeometryPreview p;
    p.layer = layer;
    p.crs = "EPSG:4326";
    p.extent.add(lon, lat);
    p.extent.add(lon + 1.0, lat + 1.0);
    PreviewFeature f;
    f.fid = 7;
    f.geometry = ordered_json{{"type", "Point"}, {"coordinates", {lon, lat}}};
    f.properties = ordered_json{{"zone", "A"}};
    p.features.push_back(f);
    return p;
}

}  // namespace

TEST(Document, ExcludesCodeTablesAndKeepsOrder) {
    CodeList cl;
    cl.id = "code_zone";
    cl.source = CodeListSource::CodeTable;
    cl.entries = {{"A", std::string("Residential")}};
    cl.targets = {{"parcels", "zone"}};

    Diagnostics diag;
    const DocumentPtr doc = assemble_document(sample_catalog(), {cl}, {}, nullptr, diag, "EPSG:4326");

    ASSERT_EQ(doc->layers.size(), 2u);
    EXPECT_EQ(doc->layers[0].name, "parcels");
    EXPECT_EQ(doc->layers[1].name, "owners");
    EXPECT_EQ(doc->find_layer("code_zone"), nullptr);
    EXPECT_EQ(doc->file_name, "zoning.gpkg");
    EXPECT_TRUE(doc->metadata.empty());
    EXPECT_TRUE(doc->extent.empty());

    const CodeList* bound = doc->code_list_for("parcels", "zone");
    ASSERT_NE(bound, nullptr);
    EXPECT_EQ(bound->id, "code_zone");
    EXPECT_EQ(doc->code_list_for("owners", "owner"), nullptr);
}

TEST(Document, PreviewsFollowLayerOrder) {
    Diagnostics diag;
    std::vector<GeometryPreview> previews = {preview("owners", 20.0, 50.0), preview("ghost", 0.0, 0.0),
                                             preview("parcels", 10.0, 40.0)};
    const DocumentPtr doc = assemble_document(sample_catalog(), {}, previews, nullptr, diag, "EPSG:4326");

    ASSERT_EQ(doc->previews.size(), 2u);
    EXPECT_EQ(doc->previews[0].layer, "parcels");
    EXPECT_EQ(doc->previews[1].layer, "owners");
    EXPECT_NE(doc->preview_for("owners"), nullptr);
    EXPECT_EQ(doc->preview_for("ghost"), nullptr);

    EXPECT_DOUBLE_EQ(doc->extent.min_lon, 10.0);
    EXPECT_DOUBLE_EQ(doc->extent.max_lat, 51.0);
}

TEST(Document, CarriesMetadataAndIssues) {
    const JsonMetadataSource meta(ordered_json{{"zoning", {{"title", "Zoning plan"}, {"year", 2023}}}});
    Diagnostics diag;
    diag.report(IssueKind::LayerUnreadable, "broken", "", "test");

    const DocumentPtr doc = assemble_document(sample_catalog(), {}, {}, &meta, diag, "EPSG:4326");
    ASSERT_EQ(doc->metadata.size(), 2u);
    EXPECT_EQ(doc->metadata[0].first, "title");
    EXPECT_EQ(doc->metadata[1].second, "2023");
    ASSERT_EQ(doc->issues.size(), 1u);
    EXPECT_EQ(doc->issues[0].layer, "broken");

    // 該当なしは空
    const JsonMetadataSource other(ordered_json{{"elsewhere", {{"title", "x"}}}});
    const DocumentPtr doc2 = assemble_document(sample_catalog(), {}, {}, &other, diag, "EPSG:4326");
    EXPECT_TRUE(doc2->metadata.empty());
}

TEST(Document, JsonShape) {
    CodeList cl;
    cl.id = "code_zone";
    cl.source = CodeListSource::CodeTable;
    cl.source_name = "code_zone";
    cl.entries = {{"A", std::string("Residential")}, {"B", std::nullopt}};
    cl.targets = {{"parcels", "zone"}};

    Diagnostics diag;
    const DocumentPtr doc = assemble_document(sample_catalog(), {cl}, {preview("parcels", 10.0, 40.0)}, nullptr,
                                              diag, "EPSG:4326");
    const ordered_json j = document_to_json(*doc);

    EXPECT_EQ(j["dataset"], "zoning");
    EXPECT_EQ(j["crs"], "EPSG:4326");
    EXPECT_EQ(j["layer_count"], 2);
    EXPECT_TRUE(j["metadata"].is_object());
    EXPECT_TRUE(j["metadata"].empty());
    ASSERT_EQ(j["extent"].size(), 4u);

    const ordered_json& parcels = j["layers"][0];
    EXPECT_EQ(parcels["kind"], "spatial");
    EXPECT_EQ(parcels["crs"], "EPSG:25833");
    EXPECT_EQ(parcels["fields"][0]["code_list"], "code_zone");
    EXPECT_EQ(parcels["fields"][0]["samples"].size(), 3u);
    EXPECT_TRUE(j["layers"][1]["fields"][0]["code_list"].is_null());
    EXPECT_FALSE(j["layers"][1].contains("geometry_type"));

    EXPECT_EQ(j["code_lists"][0]["source"], "code_table");
    EXPECT_TRUE(j["code_lists"][0]["entries"][1]["label"].is_null());

    const ordered_json& fc = j["previews"][0]["geojson"];
    EXPECT_EQ(fc["type"], "FeatureCollection");
    EXPECT_EQ(fc["features"][0]["id"], 7);
    EXPECT_EQ(fc["features"][0]["properties"]["zone"], "A");
    EXPECT_TRUE(j["issues"].empty());

    // キーの順序は固定
    auto it = j.begin();
    EXPECT_EQ(it.key(), "dataset");
}
