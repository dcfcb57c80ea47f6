#pragma once

#include <string>
#include <vector>

namespace objcache {
namespace core {
namespace persistence {

// SnapshotStore — ротация файлов снапшотов одного бакета:
// <dir>/<prefix>.<bucket>.<slot>.ocsnap, slot в [0, fileCount)
class SnapshotStore {
public:
    SnapshotStore(std::string directory, std::string prefix, std::string bucketName, size_t fileCount);

    bool ensureDirectory() const; // Создать каталог при необходимости
    std::string slotPath(size_t slot) const;
    // Слот для следующей записи: первый отсутствующий, иначе самый старый по mtime
    std::string nextSavePath() const;
    // Существующие файлы, от новых к старым
    std::vector<std::string> existingNewestFirst() const;
    size_t fileCount() const { return fileCount_; }
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    std::string prefix_;
    std::string bucketName_;
    size_t fileCount_;
};

} // namespace persistence
} // namespace core
} // namespace objcache
