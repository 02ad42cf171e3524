#ifndef GPKGSHEET_ERRORS_HPP
#define GPKGSHEET_ERRORS_HPP

#include <array>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace gpkgsheet {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// データセット全体を読めない（そのデータセットだけスキップして続行）
class DatasetUnreadable : public Error {
public:
    DatasetUnreadable(const std::string& dataset, const std::string& reason)
        : Error("Dataset '" + dataset + "' is unreadable: " + reason), dataset_(dataset) {}

    const std::string& dataset() const { return dataset_; }

private:
    std::string dataset_;
};

// 設定・環境のエラー（実行全体が続けられない）
class EnvironmentError : public Error {
public:
    using Error::Error;
};

// 回復可能な事象。実行は止めないが、検出品質を監査できるよう必ず記録する。
// データセット単位の失敗は DatasetUnreadable 例外で扱うのでここには無い。
enum class IssueKind {
    LayerUnreadable,
    FieldTypeUnknown,
    GeometryInvalidAfterSimplification,
    GeometryUnprojectable,
    CodeListAmbiguousBinding
};

constexpr std::size_t kIssueKindCount = 5;

const char* issue_kind_name(IssueKind kind);

struct Issue {
    IssueKind kind = IssueKind::LayerUnreadable;
    std::string layer;
    std::string field;
    std::string message;
};

// 1データセット分の事象記録。プレビュー構築は別スレッドから書くので mutex で守る。
class Diagnostics {
public:
    Diagnostics() = default;
    Diagnostics(const Diagnostics& other);
    Diagnostics& operator=(const Diagnostics& other);

    // 記録と同時に CPLError / CPLDebug でログにも流す
    void report(IssueKind kind, const std::string& layer, const std::string& field,
                const std::string& message);

    std::size_t count(IssueKind kind) const;
    std::size_t total() const;
    std::vector<Issue> issues() const;

private:
    mutable std::mutex mutex_;
    std::vector<Issue> issues_;
    std::array<std::size_t, kIssueKindCount> counts_{};
};

}  // namespace gpkgsheet

#endif  // GPKGSHEET_ERRORS_HPP
