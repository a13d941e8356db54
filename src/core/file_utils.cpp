#include "file_utils.h"

#include "path_resolver.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace imgopt::core {

namespace {

fs::path temporary_sibling(const fs::path& path) {
    const size_t thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    std::ostringstream suffix;
    suffix << ".tmp." << std::hex << thread_hash << "." << ticks;
    fs::path tmp = path;
    tmp += suffix.str();
    return tmp;
}

bool commit_temporary(const fs::path& tmp, const fs::path& path, std::string& error) {
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(path, ec);
        ec.clear();
        fs::rename(tmp, path, ec);
        if (ec) {
            error = "failed to rename '" + tmp.string() + "' to '" + path.string() + "': " + ec.message();
            fs::remove(tmp, ec);
            return false;
        }
    }
    return true;
}

template <typename Bytes>
bool write_bytes_atomic(const fs::path& path, const Bytes& bytes, std::string& error) {
    if (path.has_parent_path() && !ensure_directory(path.parent_path(), error)) {
        return false;
    }
    const fs::path tmp = temporary_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "failed to open '" + tmp.string() + "' for writing";
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            error = "failed to write '" + tmp.string() + "'";
            std::error_code ec;
            fs::remove(tmp, ec);
            return false;
        }
    }
    return commit_temporary(tmp, path, error);
}

} // namespace

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool ensure_directory(const fs::path& dir, std::string& error) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        error = "failed to create directory '" + dir.string() + "': " + ec.message();
        return false;
    }
    return true;
}

bool write_file_atomic(const fs::path& path, const std::vector<unsigned char>& bytes, std::string& error) {
    return write_bytes_atomic(path, bytes, error);
}

bool write_file_atomic(const fs::path& path, const std::string& text, std::string& error) {
    return write_bytes_atomic(path, text, error);
}

bool read_file_bytes(const fs::path& path, std::vector<unsigned char>& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "failed to read '" + path.string() + "'";
        return false;
    }
    return true;
}

bool copy_file_atomic(const fs::path& from, const fs::path& to, std::string& error) {
    if (to.has_parent_path() && !ensure_directory(to.parent_path(), error)) {
        return false;
    }
    const fs::path tmp = temporary_sibling(to);
    std::error_code ec;
    fs::copy_file(from, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "failed to copy '" + from.string() + "': " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return commit_temporary(tmp, to, error);
}

bool last_write_ticks(const fs::path& path, long long& out) {
    std::error_code ec;
    fs::file_time_type mtime = fs::last_write_time(path, ec);
    if (ec) {
        return false;
    }
    out = mtime.time_since_epoch().count();
    return true;
}

std::uintmax_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

std::string to_relative_posix(const fs::path& path, const fs::path& root) {
    return path.lexically_relative(root).generic_string();
}

bool discover_images(const fs::path& root,
                     std::vector<std::string>& out,
                     std::string& error,
                     std::vector<std::string>* rejected) {
    out.clear();
    if (rejected != nullptr) {
        rejected->clear();
    }
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        error = "failed to scan '" + root.string() + "': " + ec.message();
        return false;
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "failed to scan '" + root.string() + "': " + ec.message();
            return false;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (!is_supported_image(it->path().filename().string())) {
            continue;
        }
        std::string relative = to_relative_posix(it->path(), root);
        if (!is_valid_utf8(relative)) {
            if (rejected != nullptr) {
                rejected->push_back(std::move(relative));
            }
            continue;
        }
        out.push_back(std::move(relative));
    }
    std::ranges::sort(out);
    if (rejected != nullptr) {
        std::ranges::sort(*rejected);
    }
    return true;
}

} // namespace imgopt::core
