#ifndef GPKGSHEET_METADATA_SOURCE_HPP
#define GPKGSHEET_METADATA_SOURCE_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace gpkgsheet {

// 記述メタデータ（タイトル・概要・作成者など）。キーの順序を保つ。
using MetadataEntries = std::vector<std::pair<std::string, std::string>>;

class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    // 該当が無ければ std::nullopt（エラーではない）
    virtual std::optional<MetadataEntries> lookup(const std::string& dataset_name) const = 0;
};

// JSON から読むメタデータ。次の2形式を受け付ける:
//   { "<dataset>": { "title": "...", ... }, ... }
//   [ { "dataset": "<dataset>", "title": "...", ... }, ... ]   (表計算のエクスポート形式)
// null は捨て、文字列以外のスカラーは文字列化する。
class JsonMetadataSource : public MetadataSource {
public:
    explicit JsonMetadataSource(const nlohmann::ordered_json& j,
                                const std::string& key_column = "dataset");

    static JsonMetadataSource from_file(const std::string& path,
                                        const std::string& key_column = "dataset");

    std::optional<MetadataEntries> lookup(const std::string& dataset_name) const override;

    std::size_t size() const { return entries_.size(); }

private:
    std::map<std::string, MetadataEntries> entries_;
};

}  // namespace gpkgsheet

#endif  // GPKGSHEET_METADATA_SOURCE_HPP
