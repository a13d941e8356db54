#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace imgopt::core {

// One mutex per original path. Entries live as long as the table, which is
// bounded by the number of originals seen.
class PathLocks {
public:
    std::unique_lock<std::mutex> lock(const std::string& key) {
        std::mutex* m = nullptr;
        {
            std::scoped_lock guard(table_mutex_);
            auto& slot = table_[key];
            if (!slot) {
                slot = std::make_unique<std::mutex>();
            }
            m = slot.get();
        }
        return std::unique_lock<std::mutex>(*m);
    }

private:
    std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> table_;
};

} // namespace imgopt::core
