#include "objcache/core/persistence/SnapshotStore.hpp"
#include "objcache/core/logging/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <utility>

namespace objcache {
namespace core {
namespace persistence {

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(std::string directory, std::string prefix, std::string bucketName, size_t fileCount)
    : directory_(std::move(directory))
    , prefix_(std::move(prefix))
    , bucketName_(std::move(bucketName))
    , fileCount_(std::max<size_t>(fileCount, 1)) {}

bool SnapshotStore::ensureDirectory() const {
    try {
        fs::path dirPath(directory_);
        if (!fs::exists(dirPath)) {
            fs::create_directories(dirPath);
            logging::getLogger()->info("SnapshotStore: created directory {}", directory_);
        }
        return fs::is_directory(dirPath);
    } catch (const fs::filesystem_error& e) {
        logging::getLogger()->error("SnapshotStore: cannot create directory {}: {}", directory_, e.what());
        return false;
    }
}

std::string SnapshotStore::slotPath(size_t slot) const {
    fs::path path(directory_);
    path /= prefix_ + "." + bucketName_ + "." + std::to_string(slot) + ".ocsnap";
    return path.string();
}

std::string SnapshotStore::nextSavePath() const {
    std::string oldestPath = slotPath(0);
    fs::file_time_type oldestTime = fs::file_time_type::max();
    for (size_t slot = 0; slot < fileCount_; ++slot) {
        std::string path = slotPath(slot);
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (ec) {
            // Файла нет (или недоступен), пишем сюда
            return path;
        }
        if (mtime < oldestTime) {
            oldestTime = mtime;
            oldestPath = path;
        }
    }
    return oldestPath;
}

std::vector<std::string> SnapshotStore::existingNewestFirst() const {
    std::vector<std::pair<fs::file_time_type, std::string>> found;
    for (size_t slot = 0; slot < fileCount_; ++slot) {
        std::string path = slotPath(slot);
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (!ec) {
            found.emplace_back(mtime, path);
        }
    }
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return a.first > b.first;
    });
    std::vector<std::string> result;
    result.reserve(found.size());
    for (auto& item : found) {
        result.push_back(std::move(item.second));
    }
    return result;
}

} // namespace persistence
} // namespace core
} // namespace objcache
