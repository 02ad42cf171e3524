#include "gpkgsheet/engine.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <utility>

#include "cpl_error.h"
#include "cpl_worker_thread_pool.h"
#include "gdal_priv.h"

#include "gpkgsheet/code_list_resolver.hpp"
#include "gpkgsheet/errors.hpp"
#include "gpkgsheet/geometry_preview.hpp"
#include "gpkgsheet/schema_extractor.hpp"

namespace gpkgsheet {

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, [] { GDALAllRegister(); });
}

ProfileEngine::ProfileEngine(EngineConfig config, const MetadataSource* metadata)
    : config_(std::move(config)), metadata_(metadata) {
    config_.validate();
    ensure_gdal_registered();
}

DocumentPtr ProfileEngine::profile(const DatasetHandle& handle) const {
    Diagnostics diag;

    // ---- スキーマ抽出（開けなければ DatasetUnreadable）----
    DatasetCatalog catalog = extract_schema(handle, config_, diag);

    std::vector<std::string> spatial_layers;
    for (const Layer& l : catalog.layers) {
        if (!l.is_code_table && l.kind == LayerKind::Spatial) spatial_layers.push_back(l.name);
    }

    // ---- プレビュー（別スレッド）とコードリスト解決を並行に ----
    auto preview_task = std::async(std::launch::async, [this, &handle, &spatial_layers, &diag] {
        return build_previews(handle, spatial_layers, config_, diag);
    });
    std::vector<CodeList> code_lists = resolve_code_lists(catalog, config_, diag);
    std::vector<GeometryPreview> previews = preview_task.get();

    CPLDebug("GPKGSHEET", "%s: %d layers, %d code lists, %d previews, %d issues", handle.name.c_str(),
             static_cast<int>(catalog.layers.size()), static_cast<int>(code_lists.size()),
             static_cast<int>(previews.size()), static_cast<int>(diag.total()));

    return assemble_document(std::move(catalog), std::move(code_lists), std::move(previews), metadata_, diag,
                             config_.canonical_crs);
}

std::vector<DatasetResult> ProfileEngine::profile_all(const std::vector<DatasetHandle>& handles) const {
    if (handles.empty()) throw EnvironmentError("No datasets to profile");

    std::vector<DatasetResult> results(handles.size());

    auto run_one = [this, &handles, &results](std::size_t i) {
        DatasetResult& r = results[i];
        r.handle = handles[i];
        try {
            r.document = profile(handles[i]);
        } catch (const DatasetUnreadable& e) {
            r.error = e.what();
            CPLError(CE_Failure, CPLE_OpenFailed, "Skipping %s: %s", e.dataset().c_str(), e.what());
        } catch (const std::exception& e) {
            r.error = e.what();
            CPLError(CE_Failure, CPLE_AppDefined, "Dataset '%s' failed: %s", handles[i].name.c_str(), e.what());
        }
    };

    const int workers = std::min(config_.effective_worker_count(), static_cast<int>(handles.size()));
    if (workers <= 1) {
        for (std::size_t i = 0; i < handles.size(); i++) run_one(i);
    } else {
        // データセット間に共有状態は無い。results は添字ごとに別の要素に書く。
        CPLWorkerThreadPool pool(workers);
        for (std::size_t i = 0; i < handles.size(); i++) {
            pool.SubmitJob([&run_one, i] { run_one(i); });
        }
        pool.WaitCompletion();
    }

    const bool any_ok = std::any_of(results.begin(), results.end(), [](const DatasetResult& r) { return r.ok(); });
    if (!any_ok) {
        throw EnvironmentError("None of the " + std::to_string(handles.size()) + " dataset(s) could be profiled");
    }
    return results;
}

}  // namespace gpkgsheet
