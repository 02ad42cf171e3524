#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cpl_conv.h"
#include "cpl_error.h"

#include "gpkgsheet/config.hpp"
#include "gpkgsheet/engine.hpp"
#include "gpkgsheet/metadata_source.hpp"

namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: gpkgsheet <file.gpkg>... [--metadata <json>] [--config <json>] [--out-dir <dir>]\n"
    "                 [--workers <n>] [--prefix <code_table_prefix>] [--compact] [--debug]\n";

static void die(const std::string& msg, int code = 2) {
    std::cerr << msg << "\n";
    std::exit(code);
}

struct Args {
    std::vector<std::string> inputs;
    std::string metadataPath;
    std::string configPath;
    std::string outDir;           // 空なら stdout
    int workers = -1;             // -1 = 設定ファイル/既定値に任せる
    std::string prefix;
    bool compact = false;
    bool debug = false;
};

static Args parse_args(int argc, char** argv) {
    Args a;
    if (argc < 2) {
        std::cerr << kUsage;
        std::exit(2);
    }

    for (int i = 1; i < argc; i++) {
        std::string k = argv[i];
        auto need = [&](const char* name) -> std::string {
            if (i + 1 >= argc) die(std::string("Missing value for ") + name);
            return std::string(argv[++i]);
        };

        if (k == "--metadata") a.metadataPath = need("--metadata");
        else if (k == "--config") a.configPath = need("--config");
        else if (k == "--out-dir") a.outDir = need("--out-dir");
        else if (k == "--workers") {
            const std::string v = need("--workers");
            try {
                a.workers = std::stoi(v);
            } catch (const std::exception&) {
                die("Invalid value for --workers: " + v);
            }
            if (a.workers < 1) die("--workers must be >= 1");
        }
        else if (k == "--prefix") a.prefix = need("--prefix");
        else if (k == "--compact") a.compact = true;
        else if (k == "--debug") a.debug = true;
        else if (k == "--help") {
            std::cout << kUsage;
            std::exit(0);
        } else if (!k.empty() && k[0] == '-') {
            die("Unknown option: " + k);
        } else {
            a.inputs.push_back(k);
        }
    }

    if (a.inputs.empty()) die("No input datasets given");
    return a;
}

int main(int argc, char** argv) {
    const Args args = parse_args(argc, argv);

    if (args.debug) CPLSetConfigOption("CPL_DEBUG", "ON");

    try {
        gpkgsheet::EngineConfig config;
        if (!args.configPath.empty()) config = gpkgsheet::load_config(args.configPath);
        if (args.workers > 0) config.worker_count = args.workers;
        if (!args.prefix.empty()) config.code_table_prefix = args.prefix;

        std::unique_ptr<gpkgsheet::JsonMetadataSource> metadata;
        if (!args.metadataPath.empty()) {
            metadata = std::make_unique<gpkgsheet::JsonMetadataSource>(
                gpkgsheet::JsonMetadataSource::from_file(args.metadataPath));
        }

        std::vector<gpkgsheet::DatasetHandle> handles;
        for (const std::string& p : args.inputs) handles.push_back(gpkgsheet::make_dataset_handle(p));

        if (!args.outDir.empty()) {
            std::error_code ec;
            fs::create_directories(args.outDir, ec);
            if (ec) die("Failed to create output directory: " + args.outDir + " (" + ec.message() + ")", 1);
        }

        gpkgsheet::ProfileEngine engine(config, metadata.get());
        const auto results = engine.profile_all(handles);

        const int indent = args.compact ? -1 : 2;
        int okCount = 0;
        std::size_t issueCount = 0;
        nlohmann::ordered_json combined = nlohmann::ordered_json::array();

        for (const auto& r : results) {
            if (!r.ok()) {
                std::cerr << "[skip] " << r.handle.path << ": " << r.error << "\n";
                continue;
            }
            okCount++;
            issueCount += r.document->issues.size();
            const auto j = gpkgsheet::document_to_json(*r.document);

            if (args.outDir.empty()) {
                combined.push_back(j);
                continue;
            }
            const fs::path out = fs::path(args.outDir) / (r.handle.name + ".json");
            std::ofstream ofs(out);
            if (!ofs) die("Failed to open output: " + out.string(), 1);
            ofs << j.dump(indent) << "\n";
            if (!ofs) die("Failed to write output: " + out.string(), 1);
        }

        if (args.outDir.empty()) {
            // 1件なら配列に包まない
            if (combined.size() == 1) std::cout << combined[0].dump(indent) << "\n";
            else std::cout << combined.dump(indent) << "\n";
        }

        std::cerr << "datasets: " << okCount << "/" << results.size() << " profiled, issues: " << issueCount
                  << "\n";
    } catch (const std::exception& e) {
        die(std::string("Error: ") + e.what(), 1);
    }
    return 0;
}
