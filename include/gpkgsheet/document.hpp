#ifndef GPKGSHEET_DOCUMENT_HPP
#define GPKGSHEET_DOCUMENT_HPP

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/metadata_source.hpp"
#include "gpkgsheet/model.hpp"

namespace gpkgsheet {

// 1データセット分の出力。組み立て後は変更しない（shared_ptr<const Document> で渡す）。
struct Document {
    std::string dataset_name;
    std::string file_name;
    std::string driver;
    std::string canonical_crs;

    std::vector<Layer> layers;           // コード表を除いた通常レイヤ（元の順序）
    std::vector<CodeList> code_lists;
    std::vector<GeometryPreview> previews;
    BoundingBox extent;                  // 全プレビューの範囲の和

    MetadataEntries metadata;            // 無ければ空
    std::vector<Issue> issues;

    const Layer* find_layer(const std::string& name) const;
    const GeometryPreview* preview_for(const std::string& layer) const;
    const CodeList* code_list_for(const std::string& layer, const std::string& field) const;
};

using DocumentPtr = std::shared_ptr<const Document>;

DocumentPtr assemble_document(DatasetCatalog catalog, std::vector<CodeList> code_lists,
                              std::vector<GeometryPreview> previews,
                              const MetadataSource* metadata, const Diagnostics& diag,
                              const std::string& canonical_crs);

// プレゼン層への受け渡し形式
nlohmann::ordered_json document_to_json(const Document& doc);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_DOCUMENT_HPP
