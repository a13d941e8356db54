#pragma once

#include "errors.h"
#include "image_format.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace imgopt::core {

constexpr const char* k_manifest_filename = "manifest.json";

struct VariantRecord {
    ImageFormat format = ImageFormat::WebP;
    int size = 0; // configured target width
    std::string path;
    int width = 0;
    int height = 0;
    std::uintmax_t bytes = 0;
};

struct ManifestEntry {
    std::string original;
    int width = 0;
    int height = 0;
    std::vector<VariantRecord> variants;
};

struct PictureSource {
    std::string srcset;
    std::string type;
};

// Table of originals and their variants, shared by the batch, debounce and
// request paths. Entries are replaced whole; readers get copies.
class ManifestStore {
public:
    // False when the file is missing or unreadable; the store is then empty.
    // kind tells NotFound from ManifestCorrupt.
    bool load(const std::filesystem::path& path, std::string& error, ErrorKind* kind = nullptr);
    bool save(const std::filesystem::path& path, std::string& error) const;

    void upsert_entry(const std::string& original_path, ManifestEntry entry);
    bool erase(const std::string& original_path);
    std::optional<ManifestEntry> find(const std::string& original_path) const;
    std::map<std::string, ManifestEntry> snapshot() const;
    void clear();
    size_t size() const;

    void set_generated_at(std::string timestamp);
    std::string generated_at() const;

    // Throws nlohmann::json::type_error when a key or path is not valid UTF-8.
    std::string to_json() const;
    bool from_json(const std::string& text, std::string& error);

private:
    mutable std::shared_mutex mutex_;
    std::string generated_at_;
    std::map<std::string, ManifestEntry> images_;
};

// ISO-8601 UTC with milliseconds, e.g. "2026-10-19T08:15:02.123Z".
std::string current_timestamp();

// "a/b-320w.webp 320w, a/b-640w.webp 640w"; prefix is prepended to each path.
std::string build_srcset(const ManifestEntry& entry, ImageFormat format, const std::string& prefix = {});

// Smallest variant at least target_width wide, else the widest one.
std::optional<VariantRecord> optimal_variant(const ManifestEntry& entry, int target_width, ImageFormat format);

std::vector<PictureSource> picture_sources(const ManifestEntry& entry, const std::string& prefix = {});

} // namespace imgopt::core
