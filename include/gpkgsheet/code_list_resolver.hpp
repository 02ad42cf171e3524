#ifndef GPKGSHEET_CODE_LIST_RESOLVER_HPP
#define GPKGSHEET_CODE_LIST_RESOLVER_HPP

#include <string>
#include <vector>

#include "gpkgsheet/config.hpp"
#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/model.hpp"

namespace gpkgsheet {

// コード表名とフィールドの一致の強さ（強い順）
enum class NameMatch {
    None,
    Variant,    // 単数/複数形、_type_code/_code/_id などの接尾辞違い
    Exact,      // code_<field>
    Qualified   // code_<layer>_<field>
};

// stripped: プレフィックスを除いたコード表名
NameMatch match_code_table_name(const std::string& stripped, const std::string& layer_name,
                                const std::string& field_name);

// 1段目（宣言済みドメイン・命名規約）→ 2段目（統計的推定）の順でコードリストを決める。
//
// 命名規約で同じ強さの候補が複数ある場合は、プレフィックス除去後の名前が短いもの、
// さらに同じならコード表名の辞書順で先のものを採用し、CodeListAmbiguousBinding を記録する。
std::vector<CodeList> resolve_code_lists(const DatasetCatalog& catalog, const EngineConfig& config,
                                         Diagnostics& diag);

// 2段目の判定のみ（単体テスト用に公開）
bool qualifies_as_inferred_code_list(const Field& field, const EngineConfig& config);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_CODE_LIST_RESOLVER_HPP
