#include "gpkgsheet/code_list_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>

#include "cpl_error.h"

namespace gpkgsheet {

namespace {

std::string to_lower_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// a と b が単数形/複数形の関係か（region/regions, class/classes, category/categories）
bool plural_pair(const std::string& a, const std::string& b) {
    auto one_way = [](const std::string& sing, const std::string& plur) {
        if (plur == sing + "s" || plur == sing + "es") return true;
        return ends_with(sing, "y") && plur == sing.substr(0, sing.size() - 1) + "ies";
    };
    return one_way(a, b) || one_way(b, a);
}

// 位置キー（ソース Layer / Field の出現順で並べる）
struct Position {
    int layer = 0;
    int field = -1;

    bool operator<(const Position& o) const {
        return layer != o.layer ? layer < o.layer : field < o.field;
    }
};

struct CodeTableInfo {
    std::size_t list_index = 0;
    std::string name;
    std::string stripped;  // 小文字
};

std::vector<CodedValue> code_table_entries(const Layer& table) {
    std::vector<CodedValue> out;
    std::set<std::string> seen;
    for (const CodeRow& row : table.code_rows) {
        if (!row.code) continue;
        if (!seen.insert(*row.code).second) continue;  // 先に出たラベルを優先
        out.push_back(CodedValue{*row.code, row.label});
    }
    return out;
}

}  // namespace

NameMatch match_code_table_name(const std::string& stripped, const std::string& layer_name,
                                const std::string& field_name) {
    const std::string s = to_lower_ascii(stripped);
    const std::string f = to_lower_ascii(field_name);
    if (s.empty() || f.empty()) return NameMatch::None;

    if (s == to_lower_ascii(layer_name) + "_" + f) return NameMatch::Qualified;
    if (s == f) return NameMatch::Exact;

    if (plural_pair(s, f)) return NameMatch::Variant;
    static const char* const kSuffixes[] = {"_type_code", "_code", "_cd", "_id"};
    for (const char* suffix : kSuffixes) {
        if (!ends_with(f, suffix)) continue;
        const std::string base = f.substr(0, f.size() - std::char_traits<char>::length(suffix));
        if (base == s || plural_pair(base, s)) return NameMatch::Variant;
    }
    return NameMatch::None;
}

bool qualifies_as_inferred_code_list(const Field& field, const EngineConfig& config) {
    const ValueStats& st = field.stats;
    if (field.type != SemanticType::Text) return false;
    if (st.non_null_count == 0 || st.distinct_overflow) return false;

    const std::size_t distinct = st.distinct.size();
    if (distinct < config.min_distinct_values || distinct > config.max_distinct_values) return false;
    if (st.max_length > config.max_text_length) return false;

    const double ratio = static_cast<double>(distinct) / static_cast<double>(st.non_null_count);
    return ratio <= config.max_cardinality_ratio;
}

std::vector<CodeList> resolve_code_lists(const DatasetCatalog& catalog, const EngineConfig& config,
                                         Diagnostics& diag) {
    std::vector<CodeList> lists;
    std::vector<Position> positions;

    // ---- コード表（命名規約）----
    std::vector<CodeTableInfo> tables;
    for (std::size_t li = 0; li < catalog.layers.size(); li++) {
        const Layer& layer = catalog.layers[li];
        if (!layer.is_code_table) continue;

        CodeList cl;
        cl.id = layer.name;
        cl.source = CodeListSource::CodeTable;
        cl.source_name = layer.name;
        cl.entries = code_table_entries(layer);
        lists.push_back(std::move(cl));
        positions.push_back(Position{static_cast<int>(li), -1});

        tables.push_back(CodeTableInfo{lists.size() - 1, layer.name,
                                       to_lower_ascii(layer.name.substr(config.code_table_prefix.size()))});
    }

    std::map<std::string, std::size_t> domain_lists;  // domain 名 -> lists の添字
    std::set<std::pair<std::size_t, std::size_t>> bound;

    // ---- 1段目: 宣言済みドメイン、次に命名規約 ----
    for (std::size_t li = 0; li < catalog.layers.size(); li++) {
        const Layer& layer = catalog.layers[li];
        if (layer.is_code_table) continue;

        for (std::size_t fi = 0; fi < layer.fields.size(); fi++) {
            const Field& field = layer.fields[fi];
            if (field.type == SemanticType::Geometry) continue;
            const FieldRef ref{layer.name, field.name};

            if (!field.domain_name.empty()) {
                if (const FieldDomainInfo* domain = catalog.find_domain(field.domain_name)) {
                    auto it = domain_lists.find(domain->name);
                    if (it == domain_lists.end()) {
                        CodeList cl;
                        cl.id = domain->name;
                        cl.source = CodeListSource::FieldDomain;
                        cl.source_name = domain->name;
                        cl.entries = domain->values;
                        lists.push_back(std::move(cl));
                        positions.push_back(Position{static_cast<int>(li), static_cast<int>(fi)});
                        it = domain_lists.emplace(domain->name, lists.size() - 1).first;
                    }
                    lists[it->second].targets.push_back(ref);
                    bound.emplace(li, fi);
                    continue;
                }
            }

            NameMatch best = NameMatch::None;
            std::vector<const CodeTableInfo*> candidates;
            for (const CodeTableInfo& t : tables) {
                const NameMatch m = match_code_table_name(t.stripped, layer.name, field.name);
                if (m == NameMatch::None || m < best) continue;
                if (m > best) {
                    best = m;
                    candidates.clear();
                }
                candidates.push_back(&t);
            }
            if (candidates.empty()) continue;

            // 同点: プレフィックス除去後の名前が短い方、次にコード表名の辞書順
            std::sort(candidates.begin(), candidates.end(),
                      [](const CodeTableInfo* a, const CodeTableInfo* b) {
                          if (a->stripped.size() != b->stripped.size()) {
                              return a->stripped.size() < b->stripped.size();
                          }
                          return a->name < b->name;
                      });
            const CodeTableInfo* winner = candidates.front();
            if (candidates.size() > 1) {
                std::string others;
                for (std::size_t i = 1; i < candidates.size(); i++) {
                    if (!others.empty()) others += ", ";
                    others += candidates[i]->name;
                }
                diag.report(IssueKind::CodeListAmbiguousBinding, layer.name, field.name,
                            "bound to " + winner->name + " over " + others +
                                " (shortest stripped name, then lexicographic order)");
            }

            lists[winner->list_index].targets.push_back(ref);
            bound.emplace(li, fi);
        }
    }

    // ---- 2段目: 統計的推定 ----
    for (std::size_t li = 0; li < catalog.layers.size(); li++) {
        const Layer& layer = catalog.layers[li];
        if (layer.is_code_table) continue;

        for (std::size_t fi = 0; fi < layer.fields.size(); fi++) {
            if (bound.count({li, fi})) continue;
            const Field& field = layer.fields[fi];
            if (!qualifies_as_inferred_code_list(field, config)) continue;

            CodeList cl;
            cl.id = layer.name + "." + field.name;
            cl.source = CodeListSource::Inferred;
            for (const std::string& v : field.stats.distinct) {  // std::set なので昇順
                cl.entries.push_back(CodedValue{v, std::nullopt});
            }
            cl.targets.push_back(FieldRef{layer.name, field.name});
            lists.push_back(std::move(cl));
            positions.push_back(Position{static_cast<int>(li), static_cast<int>(fi)});

            CPLDebug("GPKGSHEET", "%s: inferred code list for %s.%s (%d values)", catalog.name.c_str(),
                     layer.name.c_str(), field.name.c_str(), static_cast<int>(field.stats.distinct.size()));
        }
    }

    std::vector<std::size_t> order(lists.size());
    for (std::size_t i = 0; i < order.size(); i++) order[i] = i;
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return positions[a] < positions[b]; });

    std::vector<CodeList> sorted;
    sorted.reserve(lists.size());
    for (std::size_t i : order) sorted.push_back(std::move(lists[i]));
    return sorted;
}

}  // namespace gpkgsheet
