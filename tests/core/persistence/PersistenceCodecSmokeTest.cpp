#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>
#include <vector>
#include "objcache/core/cache/SegmentedMap.hpp"
#include "objcache/core/persistence/PersistenceCodec.hpp"
#include "objcache/core/persistence/SnapshotStore.hpp"

using namespace objcache::core::persistence;
using objcache::core::cache::CacheConfig;
using objcache::core::cache::Segment;
using objcache::core::cache::SegmentedMap;

namespace {

const std::string TEST_DIR = "./objcache_test/persistence";

CacheConfig smallConfig() {
    CacheConfig config;
    config.capacityBytes = 4096;
    return config;
}

Bytes readAll(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void writeAll(const std::string& path, const Bytes& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void putU64At(Bytes& data, size_t offset, uint64_t value) {
    for (int i = 0; i < 8; ++i) data[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
}

// Бакет с тремя прочитанными записями (одна горячая) и одной непрочитанной
void fillBucket(SegmentedMap& bucket) {
    bucket.set("alpha", Bytes(100, 'a'));
    bucket.set("beta", Bytes(200, 'b'));
    bucket.set("gamma", Bytes(50, 'g'));
    bucket.set("unread", Bytes(10, 'u'));
    bucket.get("alpha");
    bucket.get("beta");
    bucket.get("gamma");
    bucket.get("gamma");
    bucket.get("gamma");
}

std::string savedSnapshot(const std::string& name, bool compress = false) {
    SegmentedMap bucket(smallConfig());
    fillBucket(bucket);
    PersistenceCodec codec(compress);
    const std::string path = TEST_DIR + "/" + name;
    auto result = codec.save(bucket, path);
    assert(result.ok());
    assert(result.entries == 3);
    return path;
}

void expectRejected(const std::string& path, SnapshotStatus expected) {
    SegmentedMap target(smallConfig());
    target.set("existing", Bytes(5, 'e'));
    PersistenceCodec codec;
    auto result = codec.load(target, path, 1);
    assert(result.status == expected);
    assert(result.entries == 0);
    // Бакет не тронут
    assert(target.size() == 1);
    assert(target.contains("existing"));
}

} // namespace

void smokeTestPersistenceCodec() {
    std::cout << "Testing PersistenceCodec save/load...\n";

    const std::string path = savedSnapshot("basic.ocsnap");
    for (const auto& item : std::filesystem::directory_iterator(TEST_DIR)) {
        assert(item.path().extension() == ".ocsnap");
    }

    SegmentedMap target(smallConfig());
    PersistenceCodec codec;
    auto result = codec.load(target, path, 1);
    assert(result.ok());
    assert(result.entries == 3);
    assert(target.size() == 3);
    assert(!target.contains("unread"));

    auto alpha = target.get("alpha");
    assert(alpha && *alpha == Bytes(100, 'a'));
    auto beta = target.get("beta");
    assert(beta && *beta == Bytes(200, 'b'));

    std::cout << "[OK] PersistenceCodec smoke test\n";
}

void testWarmReload() {
    std::cout << "Testing PersistenceCodec warm reload...\n";

    const std::string path = savedSnapshot("warm.ocsnap");
    SegmentedMap target(smallConfig());
    PersistenceCodec codec;
    assert(codec.load(target, path, 1).ok());
    // gamma прочитана трижды и остаётся горячей, остальные в Probation
    assert(target.segmentOf("gamma") == Segment::Protected);
    assert(target.frequencyOf("gamma") == 3u);
    assert(target.segmentOf("alpha") == Segment::Probation);
    assert(target.segmentOf("beta") == Segment::Probation);
    assert(target.bytes() == 350);

    // Повторная загрузка не дублирует и не перезаписывает ключи
    auto again = codec.load(target, path, 1);
    assert(again.ok());
    assert(again.entries == 0);
    assert(target.size() == 3);

    std::cout << "[OK] PersistenceCodec warm reload test\n";
}

void testCorruptSnapshots() {
    std::cout << "Testing PersistenceCodec corruption handling...\n";

    const std::string path = savedSnapshot("corrupt.ocsnap");
    const Bytes original = readAll(path);

    Bytes flipped = original;
    flipped[PersistenceCodec::HEADER_SIZE + 5] ^= 0xFF;
    writeAll(path, flipped);
    expectRejected(path, SnapshotStatus::Corrupt);

    writeAll(path, Bytes(original.begin(), original.begin() + original.size() / 2));
    expectRejected(path, SnapshotStatus::Corrupt);

    writeAll(path, Bytes(original.begin(), original.begin() + 10));
    expectRejected(path, SnapshotStatus::Corrupt);

    Bytes badMagic = original;
    badMagic[0] = 'X';
    writeAll(path, badMagic);
    expectRejected(path, SnapshotStatus::Corrupt);

    Bytes future = original;
    future[PersistenceCodec::MAGIC_SIZE] = 2;
    writeAll(path, future);
    expectRejected(path, SnapshotStatus::VersionMismatch);

    // Счётчик записей вне контрольной суммы: больше или меньше реального, всё равно отказ
    Bytes tooMany = original;
    putU64At(tooMany, PersistenceCodec::MAGIC_SIZE + 5, 4);
    writeAll(path, tooMany);
    expectRejected(path, SnapshotStatus::Corrupt);

    Bytes tooFew = original;
    putU64At(tooFew, PersistenceCodec::MAGIC_SIZE + 5, 2);
    writeAll(path, tooFew);
    expectRejected(path, SnapshotStatus::Corrupt);

    Bytes absurd = original;
    putU64At(absurd, PersistenceCodec::MAGIC_SIZE + 5, UINT64_MAX);
    writeAll(path, absurd);
    expectRejected(path, SnapshotStatus::Corrupt);

    Bytes trailing = original;
    trailing.push_back(0);
    writeAll(path, trailing);
    expectRejected(path, SnapshotStatus::Corrupt);

    std::cout << "[OK] PersistenceCodec corruption test\n";
}

void testCompressedSnapshot() {
    std::cout << "Testing PersistenceCodec compressed snapshot...\n";

    const std::string plain = savedSnapshot("plain.ocsnap");
    const std::string packed = savedSnapshot("packed.ocsnap", true);
    assert(std::filesystem::file_size(packed) < std::filesystem::file_size(plain));

    PersistenceCodec codec;
    SnapshotHeader header;
    auto inspected = codec.inspect(packed, header);
    assert(inspected.ok());
    assert(header.version == PersistenceCodec::FORMAT_VERSION);
    assert(header.compressed);
    assert(header.entryCount == 3);

    // Флаг сжатия в заголовке: читатель без сжатия загружает такой файл
    SegmentedMap target(smallConfig());
    auto loaded = codec.load(target, packed, 1);
    assert(loaded.ok());
    assert(loaded.entries == 3);
    auto beta = target.get("beta");
    assert(beta && *beta == Bytes(200, 'b'));

    std::cout << "[OK] PersistenceCodec compressed snapshot test\n";
}

void testIoErrors() {
    std::cout << "Testing PersistenceCodec I/O errors...\n";

    PersistenceCodec codec;
    SegmentedMap bucket(smallConfig());
    auto missing = codec.load(bucket, TEST_DIR + "/absent.ocsnap", 1);
    assert(missing.status == SnapshotStatus::NotFound);

    fillBucket(bucket);
    auto unwritable = codec.save(bucket, TEST_DIR + "/no/such/dir/x.ocsnap");
    assert(unwritable.status == SnapshotStatus::IoError);
    assert(std::string(statusName(unwritable.status)) == "io_error");

    // Пустой снапшот валиден
    SegmentedMap empty(smallConfig());
    auto emptySaved = codec.save(empty, TEST_DIR + "/empty.ocsnap");
    assert(emptySaved.ok() && emptySaved.entries == 0);
    SnapshotHeader header;
    assert(codec.inspect(emptySaved.path, header).ok());
    assert(header.entryCount == 0);

    std::cout << "[OK] PersistenceCodec I/O error test\n";
}

void testSnapshotStoreRotation() {
    std::cout << "Testing SnapshotStore rotation...\n";

    const std::string dir = TEST_DIR + "/rotation";
    SnapshotStore store(dir, "objcache", "bucket0", 3);
    assert(store.ensureDirectory());
    assert(store.existingNewestFirst().empty());
    assert(store.slotPath(1) == (std::filesystem::path(dir) / "objcache.bucket0.1.ocsnap").string());
    assert(store.nextSavePath() == store.slotPath(0));

    writeAll(store.slotPath(0), Bytes{1});
    writeAll(store.slotPath(1), Bytes{2});
    assert(store.nextSavePath() == store.slotPath(2));
    writeAll(store.slotPath(2), Bytes{3});

    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(store.slotPath(0), now - std::chrono::hours(1));
    std::filesystem::last_write_time(store.slotPath(1), now - std::chrono::hours(3));
    std::filesystem::last_write_time(store.slotPath(2), now - std::chrono::hours(2));

    assert(store.nextSavePath() == store.slotPath(1));
    auto ordered = store.existingNewestFirst();
    assert(ordered.size() == 3);
    assert(ordered[0] == store.slotPath(0));
    assert(ordered[1] == store.slotPath(2));
    assert(ordered[2] == store.slotPath(1));

    std::cout << "[OK] SnapshotStore rotation test\n";
}

void testRegionAboveCompressionLimit() {
    std::cout << "Testing PersistenceCodec compression limit...\n";

    SegmentedMap bucket(smallConfig());
    fillBucket(bucket);

    // Область записей больше предела пишется несжатой и читается тем же кодеком
    PersistenceCodec capped(true, 64);
    const std::string path = TEST_DIR + "/capped.ocsnap";
    auto saved = capped.save(bucket, path);
    assert(saved.ok() && saved.entries == 3);
    SnapshotHeader header;
    assert(capped.inspect(path, header).ok());
    assert(!header.compressed);

    SegmentedMap target(smallConfig());
    auto loaded = capped.load(target, path, 1);
    assert(loaded.ok() && loaded.entries == 3);

    // Сжатая область выше предела читателя отвергается целиком
    const std::string packed = savedSnapshot("over-limit.ocsnap", true);
    SegmentedMap untouched(smallConfig());
    auto rejected = capped.load(untouched, packed, 1);
    assert(rejected.status == SnapshotStatus::Corrupt);
    assert(untouched.size() == 0);

    // В пределах лимита сжатие работает как обычно
    PersistenceCodec roomy(true, 1024 * 1024);
    auto image = roomy.encode(bucket.snapshot());
    std::vector<objcache::core::cache::SnapshotRecord> records;
    assert(roomy.decode(image, records, &header).ok());
    assert(header.compressed);
    assert(records.size() == 4);

    std::cout << "[OK] PersistenceCodec compression limit test\n";
}

void testConcurrentSavesToOnePath() {
    std::cout << "Testing PersistenceCodec concurrent saves...\n";

    SegmentedMap bucket(smallConfig());
    fillBucket(bucket);
    PersistenceCodec codec;
    const std::string path = TEST_DIR + "/shared.ocsnap";

    for (int round = 0; round < 10; ++round) {
        bool ok[2] = {false, false};
        std::vector<std::thread> savers;
        for (int t = 0; t < 2; ++t) {
            savers.emplace_back([&, t]() { ok[t] = codec.save(bucket, path).ok(); });
        }
        for (auto& saver : savers) saver.join();
        assert(ok[0] && ok[1]);

        SegmentedMap target(smallConfig());
        auto loaded = codec.load(target, path, 1);
        assert(loaded.ok() && loaded.entries == 3);
    }
    for (const auto& item : std::filesystem::directory_iterator(TEST_DIR)) {
        assert(item.path().extension() != ".tmp");
        assert(item.path().string().find(".tmp.") == std::string::npos);
    }

    std::cout << "[OK] PersistenceCodec concurrent saves test\n";
}

int main() {
    try {
        std::filesystem::remove_all(TEST_DIR);
        std::filesystem::create_directories(TEST_DIR);
        smokeTestPersistenceCodec();
        testWarmReload();
        testCorruptSnapshots();
        testCompressedSnapshot();
        testIoErrors();
        testSnapshotStoreRotation();
        testRegionAboveCompressionLimit();
        testConcurrentSavesToOnePath();
        std::cout << "All PersistenceCodec tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
