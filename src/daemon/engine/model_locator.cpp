#include "engine/model_locator.hpp"

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

ModelLocator::ModelLocator(fs::path models_dir, std::vector<fs::path> binary_candidates)
    : models_dir_(std::move(models_dir)), binary_candidates_(std::move(binary_candidates)) {}

const std::vector<CatalogEntry>& ModelLocator::catalog() {
    static const std::vector<CatalogEntry> entries = {
        {"local-fast", "English CPU (Fast)", "126 MB", "sherpa-onnx-nemo-parakeet-tdt_ctc-110m-en-int8"},
        {"local-balanced", "English CPU (Balanced)", "624 MB", "sherpa-onnx-nemo-parakeet-ctc-0.6b-en-int8"},
        {"local-accurate", "English CPU (Accurate)", "1.1 GB", "sherpa-onnx-nemo-parakeet-tdt_ctc-1.1b-en-int8"},
    };
    return entries;
}

std::vector<fs::path> ModelLocator::default_binary_candidates(const fs::path& data_dir) {
    std::vector<fs::path> candidates;
    if (!data_dir.empty()) {
        candidates.push_back(data_dir / "sherpa-onnx-bin" / kBinaryName);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return candidates;

    std::string_view rest(path_env);
    while (!rest.empty()) {
        auto sep = rest.find(':');
        auto dir = rest.substr(0, sep);
        if (!dir.empty()) candidates.push_back(fs::path(dir) / kBinaryName);
        if (sep == std::string_view::npos) break;
        rest.remove_prefix(sep + 1);
    }
    return candidates;
}

std::optional<fs::path> ModelLocator::find_binary() const {
    for (const auto& candidate : binary_candidates_) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<LocalModel> ModelLocator::downloaded() const {
    std::vector<LocalModel> models;
    for (const auto& entry : catalog()) {
        if (auto model = probe(entry)) models.push_back(std::move(*model));
    }
    return models;
}

std::optional<LocalModel> ModelLocator::find(const std::string& id) const {
    auto it = std::ranges::find(catalog(), id, &CatalogEntry::id);
    if (it == catalog().end()) return std::nullopt;
    return probe(*it);
}

bool ModelLocator::is_known(const std::string& id) const {
    return std::ranges::find(catalog(), id, &CatalogEntry::id) != catalog().end();
}

std::optional<LocalModel> ModelLocator::probe(const CatalogEntry& entry) const {
    auto dir = models_dir_ / entry.directory;
    std::error_code ec;

    auto tokens = dir / "tokens.txt";
    if (!fs::is_regular_file(tokens, ec)) return std::nullopt;

    for (const char* name : {"model.int8.onnx", "model.onnx"}) {
        auto model = dir / name;
        if (fs::is_regular_file(model, ec)) {
            return LocalModel{.id = entry.id, .label = entry.label,
                              .model_file = model, .tokens_file = tokens};
        }
    }
    return std::nullopt;
}
