#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct CatalogEntry {
    std::string id;
    std::string label;
    std::string detail;     // download size shown next to the label
    std::string directory;  // subdirectory of the models dir
};

struct LocalModel {
    std::string id;
    std::string label;
    std::filesystem::path model_file;
    std::filesystem::path tokens_file;
};

// Finds the sherpa-onnx binary and the downloaded model directories. Only
// looks at the filesystem; nothing is spawned.
class ModelLocator {
public:
    static constexpr const char* kBinaryName = "sherpa-onnx-offline";

    ModelLocator(std::filesystem::path models_dir, std::vector<std::filesystem::path> binary_candidates);

    static const std::vector<CatalogEntry>& catalog();

    // The default search order: <data dir>/sherpa-onnx-bin, then every PATH entry.
    static std::vector<std::filesystem::path> default_binary_candidates(const std::filesystem::path& data_dir);

    std::optional<std::filesystem::path> find_binary() const;

    // Catalog models whose directory holds tokens.txt and an .onnx model,
    // in catalog order.
    std::vector<LocalModel> downloaded() const;
    std::optional<LocalModel> find(const std::string& id) const;
    bool is_known(const std::string& id) const;

    const std::filesystem::path& models_dir() const { return models_dir_; }

private:
    std::optional<LocalModel> probe(const CatalogEntry& entry) const;

    std::filesystem::path models_dir_;
    std::vector<std::filesystem::path> binary_candidates_;
};
