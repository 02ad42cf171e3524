#include "gpkgsheet/metadata_source.hpp"

#include <fstream>

#include "gpkgsheet/errors.hpp"

using nlohmann::ordered_json;

namespace gpkgsheet {

namespace {

// スカラーを表示文字列に。null は nullopt（行から落とす）
std::optional<std::string> scalar_text(const ordered_json& v) {
    if (v.is_null()) return std::nullopt;
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

MetadataEntries record_entries(const ordered_json& record, const std::string& skip_key) {
    MetadataEntries out;
    for (auto it = record.begin(); it != record.end(); ++it) {
        if (it.key() == skip_key) continue;
        if (auto s = scalar_text(it.value())) out.emplace_back(it.key(), *s);
    }
    return out;
}

}  // namespace

JsonMetadataSource::JsonMetadataSource(const ordered_json& j, const std::string& key_column) {
    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_object()) {
                throw EnvironmentError("Metadata for '" + it.key() + "' must be an object");
            }
            entries_.emplace(it.key(), record_entries(it.value(), ""));
        }
    } else if (j.is_array()) {
        for (const auto& record : j) {
            if (!record.is_object()) throw EnvironmentError("Metadata records must be objects");
            auto key = record.find(key_column);
            if (key == record.end() || key->is_null()) continue;  // キー列が空の行は使わない
            const std::optional<std::string> name = scalar_text(*key);
            // 同じデータセットが複数行あれば先の行を使う
            entries_.emplace(*name, record_entries(record, key_column));
        }
    } else {
        throw EnvironmentError("Metadata must be a JSON object or array");
    }
}

JsonMetadataSource JsonMetadataSource::from_file(const std::string& path, const std::string& key_column) {
    std::ifstream ifs(path);
    if (!ifs) throw EnvironmentError("Failed to open metadata file: " + path);
    ordered_json j;
    try {
        ifs >> j;
    } catch (const ordered_json::exception& e) {
        throw EnvironmentError("Failed to parse metadata file " + path + ": " + e.what());
    }
    return JsonMetadataSource(j, key_column);
}

std::optional<MetadataEntries> JsonMetadataSource::lookup(const std::string& dataset_name) const {
    auto it = entries_.find(dataset_name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

}  // namespace gpkgsheet
