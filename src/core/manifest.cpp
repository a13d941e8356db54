#include "manifest.h"

#include "file_utils.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <nlohmann/json.hpp>

namespace imgopt::core {

using json = nlohmann::json;

namespace {

json variant_to_json(const VariantRecord& v) {
    return json{
        {"format", format_name(v.format)},
        {"size", v.size},
        {"path", v.path},
        {"width", v.width},
        {"height", v.height},
        {"bytes", v.bytes},
    };
}

bool variant_from_json(const json& j, VariantRecord& out) {
    if (!j.is_object()) {
        return false;
    }
    const auto format = j.find("format");
    const auto path = j.find("path");
    const auto width = j.find("width");
    if (format == j.end() || !format->is_string() || path == j.end() || !path->is_string() ||
        width == j.end() || !width->is_number_integer()) {
        return false;
    }
    std::string error;
    if (!parse_image_format(format->get<std::string>(), out.format, error)) {
        return false;
    }
    out.path = path->get<std::string>();
    out.width = width->get<int>();
    out.size = j.value("size", out.width);
    out.height = j.value("height", 0);
    out.bytes = j.value("bytes", std::uintmax_t{0});
    return !out.path.empty() && out.width > 0;
}

bool entry_from_json(const std::string& key, const json& j, ManifestEntry& out) {
    if (!j.is_object()) {
        return false;
    }
    out.original = j.value("original", key);
    out.width = j.value("width", 0);
    out.height = j.value("height", 0);
    out.variants.clear();
    const auto variants = j.find("variants");
    if (variants == j.end() || !variants->is_array()) {
        return false;
    }
    for (const auto& item : *variants) {
        VariantRecord record;
        if (variant_from_json(item, record)) {
            out.variants.push_back(std::move(record));
        }
    }
    return true;
}

std::vector<VariantRecord> variants_of_format(const ManifestEntry& entry, ImageFormat format) {
    std::vector<VariantRecord> matching;
    for (const auto& v : entry.variants) {
        if (v.format == format) {
            matching.push_back(v);
        }
    }
    return matching;
}

} // namespace

std::string current_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return out.str();
}

bool ManifestStore::load(const std::filesystem::path& path, std::string& error, ErrorKind* kind) {
    clear();
    std::ifstream in(path);
    if (!in) {
        error = "manifest not found: " + path.string();
        if (kind != nullptr) {
            *kind = ErrorKind::NotFound;
        }
        return false;
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (!from_json(content.str(), error)) {
        clear();
        error = "corrupt manifest " + path.string() + ": " + error;
        if (kind != nullptr) {
            *kind = ErrorKind::ManifestCorrupt;
        }
        return false;
    }
    if (kind != nullptr) {
        *kind = ErrorKind::None;
    }
    return true;
}

bool ManifestStore::save(const std::filesystem::path& path, std::string& error) const {
    std::string text;
    try {
        text = to_json();
    } catch (const json::type_error& e) {
        error = "failed to serialize manifest " + path.string() + ": " + e.what();
        return false;
    }
    return write_file_atomic(path, text, error);
}

std::string ManifestStore::to_json() const {
    std::shared_lock lock(mutex_);
    json images = json::object();
    for (const auto& [key, entry] : images_) {
        json variants = json::array();
        for (const auto& v : entry.variants) {
            variants.push_back(variant_to_json(v));
        }
        images[key] = json{
            {"original", entry.original},
            {"width", entry.width},
            {"height", entry.height},
            {"variants", std::move(variants)},
        };
    }
    json root{
        {"generatedAt", generated_at_},
        {"images", std::move(images)},
    };
    return root.dump(2) + "\n";
}

bool ManifestStore::from_json(const std::string& text, std::string& error) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }
    if (!root.is_object()) {
        error = "root is not an object";
        return false;
    }
    const auto images = root.find("images");
    if (images == root.end() || !images->is_object()) {
        error = "missing images table";
        return false;
    }

    std::map<std::string, ManifestEntry> parsed;
    for (const auto& [key, value] : images->items()) {
        ManifestEntry entry;
        try {
            if (entry_from_json(key, value, entry)) {
                parsed.emplace(key, std::move(entry));
            }
        } catch (const json::type_error&) {
            // wrongly typed field: the entry is dropped and regenerated later
            continue;
        }
    }

    std::unique_lock lock(mutex_);
    const auto generated = root.find("generatedAt");
    generated_at_ = (generated != root.end() && generated->is_string()) ? generated->get<std::string>() : std::string();
    images_ = std::move(parsed);
    return true;
}

void ManifestStore::upsert_entry(const std::string& original_path, ManifestEntry entry) {
    std::unique_lock lock(mutex_);
    images_[original_path] = std::move(entry);
}

bool ManifestStore::erase(const std::string& original_path) {
    std::unique_lock lock(mutex_);
    return images_.erase(original_path) > 0;
}

std::optional<ManifestEntry> ManifestStore::find(const std::string& original_path) const {
    std::shared_lock lock(mutex_);
    const auto it = images_.find(original_path);
    if (it == images_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, ManifestEntry> ManifestStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return images_;
}

void ManifestStore::clear() {
    std::unique_lock lock(mutex_);
    images_.clear();
}

size_t ManifestStore::size() const {
    std::shared_lock lock(mutex_);
    return images_.size();
}

void ManifestStore::set_generated_at(std::string timestamp) {
    std::unique_lock lock(mutex_);
    generated_at_ = std::move(timestamp);
}

std::string ManifestStore::generated_at() const {
    std::shared_lock lock(mutex_);
    return generated_at_;
}

std::string build_srcset(const ManifestEntry& entry, ImageFormat format, const std::string& prefix) {
    std::string result;
    for (const auto& v : variants_of_format(entry, format)) {
        if (!result.empty()) {
            result += ", ";
        }
        result += prefix + v.path + " " + std::to_string(v.width) + "w";
    }
    return result;
}

std::optional<VariantRecord> optimal_variant(const ManifestEntry& entry, int target_width, ImageFormat format) {
    std::vector<VariantRecord> matching = variants_of_format(entry, format);
    if (matching.empty()) {
        return std::nullopt;
    }
    std::ranges::stable_sort(matching, {}, &VariantRecord::width);
    const auto it = std::ranges::find_if(matching, [target_width](const VariantRecord& v) {
        return v.width >= target_width;
    });
    if (it != matching.end()) {
        return *it;
    }
    return matching.back();
}

std::vector<PictureSource> picture_sources(const ManifestEntry& entry, const std::string& prefix) {
    std::vector<ImageFormat> formats;
    for (const auto& v : entry.variants) {
        if (std::ranges::find(formats, v.format) == formats.end()) {
            formats.push_back(v.format);
        }
    }
    std::vector<PictureSource> sources;
    for (ImageFormat format : formats) {
        sources.push_back(PictureSource{build_srcset(entry, format, prefix), format_mime_type(format)});
    }
    return sources;
}

} // namespace imgopt::core
