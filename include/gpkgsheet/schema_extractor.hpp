#ifndef GPKGSHEET_SCHEMA_EXTRACTOR_HPP
#define GPKGSHEET_SCHEMA_EXTRACTOR_HPP

#include "gpkgsheet/config.hpp"
#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/model.hpp"

class GDALDataset;

namespace gpkgsheet {

// データセットを開き、レイヤ・フィールド・サンプル値・コード表の行を読み出す。
// 開けない場合は DatasetUnreadable を投げる。レイヤ単位の失敗は diag に記録してスキップ。
DatasetCatalog extract_schema(const DatasetHandle& handle, const EngineConfig& config,
                              Diagnostics& diag);

// 既に開いている GDALDataset から読む版（テスト・内部用）
DatasetCatalog extract_schema(GDALDataset& dataset, const DatasetHandle& handle,
                              const EngineConfig& config, Diagnostics& diag);

bool is_code_table_name(const std::string& layer_name, const std::string& prefix);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_SCHEMA_EXTRACTOR_HPP
