#include "gpkgsheet/errors.hpp"

#include "cpl_error.h"

namespace gpkgsheet {

const char* issue_kind_name(IssueKind kind) {
    switch (kind) {
        case IssueKind::LayerUnreadable: return "LayerUnreadable";
        case IssueKind::FieldTypeUnknown: return "FieldTypeUnknown";
        case IssueKind::GeometryInvalidAfterSimplification: return "GeometryInvalidAfterSimplification";
        case IssueKind::GeometryUnprojectable: return "GeometryUnprojectable";
        case IssueKind::CodeListAmbiguousBinding: return "CodeListAmbiguousBinding";
    }
    return "Unknown";
}

Diagnostics::Diagnostics(const Diagnostics& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    issues_ = other.issues_;
    counts_ = other.counts_;
}

Diagnostics& Diagnostics::operator=(const Diagnostics& other) {
    if (this == &other) return *this;
    std::vector<Issue> issues;
    std::array<std::size_t, kIssueKindCount> counts{};
    {
        std::lock_guard<std::mutex> lock(other.mutex_);
        issues = other.issues_;
        counts = other.counts_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    issues_ = std::move(issues);
    counts_ = counts;
    return *this;
}

void Diagnostics::report(IssueKind kind, const std::string& layer, const std::string& field,
                         const std::string& message) {
    std::string where = layer;
    if (!field.empty()) where += "." + field;

    // 型不明は text に落とすだけなので debug、それ以外は warning として出す
    if (kind == IssueKind::FieldTypeUnknown) {
        CPLDebug("GPKGSHEET", "%s [%s]: %s", issue_kind_name(kind), where.c_str(), message.c_str());
    } else {
        CPLError(CE_Warning, CPLE_AppDefined, "%s [%s]: %s", issue_kind_name(kind), where.c_str(),
                 message.c_str());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    issues_.push_back(Issue{kind, layer, field, message});
    counts_[static_cast<std::size_t>(kind)]++;
}

std::size_t Diagnostics::count(IssueKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<std::size_t>(kind)];
}

std::size_t Diagnostics::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issues_.size();
}

std::vector<Issue> Diagnostics::issues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issues_;
}

}  // namespace gpkgsheet
