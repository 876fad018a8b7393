#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "application/ChangeDetector.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "infrastructure/WatchStateStore.hpp"

namespace fs = std::filesystem;
using namespace vaultbreakdown;
using application::ChangeDetector;
using infrastructure::WatchStateStore;

namespace {

const std::string kRoot = "test_change_detector_root";

// Repository that can be told to fail its writes.
class FlakyRepository : public domain::WatchStateRepository {
public:
    bool failProcessed = false;
    bool failLastRun = false;
    int processedWrites = 0;

    domain::WatchState load() override { return {}; }

    domain::Status saveLastRunTime(std::chrono::system_clock::time_point) override {
        if (failLastRun) return domain::Status::Fail(domain::ErrorKind::Persistence, "read-only state dir");
        return domain::Status::Ok();
    }

    domain::Status saveProcessedItems(const std::set<std::string>&) override {
        ++processedWrites;
        if (failProcessed) return domain::Status::Fail(domain::ErrorKind::Persistence, "read-only state dir");
        return domain::Status::Ok();
    }
};

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void SetAge(const fs::path& path, std::chrono::hours age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

std::string StateDir() { return kRoot + "/state"; }
std::string WatchDir() { return kRoot + "/Clippings"; }

void Reset() {
    fs::remove_all(kRoot);
    fs::create_directories(WatchDir());
    fs::create_directories(StateDir());
}

void TestFirstScan() {
    std::cout << "[Test] First scan returns new markdown children only..." << std::endl;
    Reset();
    WriteFile(fs::path(WatchDir()) / "b.md", "# B");
    WriteFile(fs::path(WatchDir()) / "a.md", "# A");
    WriteFile(fs::path(WatchDir()) / "notes.txt", "ignored");
    WriteFile(fs::path(WatchDir()) / "nested" / "c.md", "ignored");
    fs::create_directories(fs::path(WatchDir()) / "folder.md");

    const auto scanTime = std::chrono::system_clock::now();
    auto store = std::make_shared<WatchStateStore>(StateDir());
    ChangeDetector detector(store, [scanTime] { return scanTime; });
    assert(detector.lastRunTime() == std::chrono::system_clock::time_point{});

    auto items = detector.scan(WatchDir());
    assert(items.ok());
    assert(items->size() == 2);
    assert(fs::path((*items)[0]).filename() == "a.md");
    assert(fs::path((*items)[1]).filename() == "b.md");
    assert(fs::path((*items)[0]).is_absolute());
    assert(detector.lastRunTime() == scanTime);

    // Scanning does not mark anything.
    assert(detector.shouldProcess((*items)[0]));
    assert(detector.processedCount() == 0);

    auto reloaded = store->load();
    auto drift = reloaded.lastRunTime - scanTime;
    assert(drift <= std::chrono::seconds(1) && drift >= -std::chrono::seconds(1));
    std::cout << "[PASS] First scan." << std::endl;
}

void TestOlderItemsAreSkipped() {
    std::cout << "[Test] Items older than the last run are skipped..." << std::endl;
    Reset();
    const auto old = fs::path(WatchDir()) / "old.md";
    WriteFile(old, "# Old");
    SetAge(old, std::chrono::hours(3));

    auto store = std::make_shared<WatchStateStore>(StateDir());
    const auto now = std::chrono::system_clock::now();
    assert(store->saveLastRunTime(now - std::chrono::hours(1)).ok());

    ChangeDetector detector(store, [now] { return now; });
    auto items = detector.scan(WatchDir());
    assert(items.ok());
    assert(items->empty());

    // A file created after the last run is picked up.
    WriteFile(fs::path(WatchDir()) / "new.md", "# New");
    assert(store->saveLastRunTime(now - std::chrono::hours(1)).ok());
    ChangeDetector fresh(store, [now] { return now + std::chrono::hours(1); });
    auto second = fresh.scan(WatchDir());
    assert(second.ok());
    assert(second->size() == 1);
    assert(fs::path(second->front()).filename() == "new.md");
    std::cout << "[PASS] Older items skipped." << std::endl;
}

void TestIdempotence() {
    std::cout << "[Test] Processed items are never returned again..." << std::endl;
    Reset();
    const auto item = fs::path(WatchDir()) / "article.md";
    WriteFile(item, "# Article");

    auto store = std::make_shared<WatchStateStore>(StateDir());
    ChangeDetector detector(store);
    assert(detector.shouldProcess(item.string()));
    assert(detector.markProcessed(item.string()).ok());

    assert(!detector.shouldProcess(item.string()));
    const std::string indirect = WatchDir() + "/../Clippings/article.md";
    assert(!detector.shouldProcess(indirect));
    assert(!detector.shouldProcess(fs::absolute(item).string()));

    // A newer mtime does not resurrect it.
    fs::last_write_time(item, fs::file_time_type::clock::now() + std::chrono::hours(1));
    ChangeDetector restarted(std::make_shared<WatchStateStore>(StateDir()));
    assert(restarted.processedCount() == 1);
    assert(!restarted.shouldProcess(item.string()));
    auto items = restarted.scan(WatchDir());
    assert(items.ok());
    assert(items->empty());

    // Marking twice keeps a single entry.
    assert(restarted.markProcessed(item.string()).ok());
    assert(restarted.processedCount() == 1);
    std::cout << "[PASS] Idempotence." << std::endl;
}

void TestCorruptStateIsTolerated() {
    std::cout << "[Test] Corrupt state files mean never run..." << std::endl;
    Reset();
    WriteFile(fs::path(StateDir()) / WatchStateStore::kProcessedFile, "{not json at all");
    WriteFile(fs::path(StateDir()) / WatchStateStore::kLastRunFile, "yesterday-ish");
    const auto item = fs::path(WatchDir()) / "article.md";
    WriteFile(item, "# Article");
    SetAge(item, std::chrono::hours(48));

    auto store = std::make_shared<WatchStateStore>(StateDir());
    auto state = store->load();
    assert(state.processedItems.empty());
    assert(state.lastRunTime == std::chrono::system_clock::time_point{});

    ChangeDetector detector(store);
    auto items = detector.scan(WatchDir());
    assert(items.ok());
    assert(items->size() == 1);
    assert(detector.markProcessed(items->front()).ok());

    auto reloaded = store->load();
    assert(reloaded.processedItems.size() == 1);
    assert(reloaded.processedItems.count(items->front()) == 1);
    assert(reloaded.lastRunTime != std::chrono::system_clock::time_point{});

    // Accepted alternative timestamp spellings.
    assert(infrastructure::TimeUtils::ParseIso8601("2024-05-01T10:00:00Z").has_value());
    assert(infrastructure::TimeUtils::ParseIso8601("2024-05-01T10:00:00.123456+00:00").has_value());
    assert(infrastructure::TimeUtils::ParseIso8601("2024-05-01T10:00:00+00:00") ==
           infrastructure::TimeUtils::ParseIso8601("2024-05-01T10:00:00Z"));
    std::cout << "[PASS] Corrupt state tolerated." << std::endl;
}

void TestPersistenceFailures() {
    std::cout << "[Test] Persistence failures are reported..." << std::endl;
    Reset();
    auto repo = std::make_shared<FlakyRepository>();
    ChangeDetector detector(repo);

    repo->failProcessed = true;
    auto marked = detector.markProcessed(WatchDir() + "/x.md");
    assert(!marked.ok());
    assert(marked.error().kind == domain::ErrorKind::Persistence);
    assert(detector.shouldProcess(WatchDir() + "/x.md"));
    assert(detector.processedCount() == 0);

    repo->failLastRun = true;
    auto scanned = detector.scan(WatchDir());
    assert(!scanned.ok());
    assert(scanned.error().kind == domain::ErrorKind::Persistence);

    auto missing = detector.scan(kRoot + "/does-not-exist");
    assert(!missing.ok());
    assert(missing.error().kind == domain::ErrorKind::Access);
    std::cout << "[PASS] Persistence failures." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChangeDetector Test..." << std::endl;
    TestFirstScan();
    TestOlderItemsAreSkipped();
    TestIdempotence();
    TestCorruptStateIsTolerated();
    TestPersistenceFailures();
    fs::remove_all(kRoot);
    std::cout << "[PASS] ChangeDetector Test." << std::endl;
    return 0;
}
