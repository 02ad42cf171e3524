#ifndef GPKGSHEET_ENGINE_HPP
#define GPKGSHEET_ENGINE_HPP

#include <string>
#include <vector>

#include "gpkgsheet/config.hpp"
#include "gpkgsheet/document.hpp"
#include "gpkgsheet/metadata_source.hpp"
#include "gpkgsheet/model.hpp"

namespace gpkgsheet {

struct DatasetResult {
    DatasetHandle handle;
    DocumentPtr document;   // 失敗時は nullptr
    std::string error;

    bool ok() const { return document != nullptr; }
};

class ProfileEngine {
public:
    // metadata は nullptr 可（全データセットが空のメタデータになる）
    explicit ProfileEngine(EngineConfig config, const MetadataSource* metadata = nullptr);

    const EngineConfig& config() const { return config_; }

    // 1データセットのパイプライン。開けなければ DatasetUnreadable。
    DocumentPtr profile(const DatasetHandle& handle) const;

    // ワーカープールで並列に処理する。結果は入力の順序で返す。
    // 入力が空、または1つも開けなかった場合は EnvironmentError。
    std::vector<DatasetResult> profile_all(const std::vector<DatasetHandle>& handles) const;

private:
    EngineConfig config_;
    const MetadataSource* metadata_;
};

// GDALAllRegister を一度だけ呼ぶ
void ensure_gdal_registered();

}  // namespace gpkgsheet

#endif  // GPKGSHEET_ENGINE_HPP
