#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/inotify.h>

#include "application/BoundedChannel.hpp"
#include "application/ChangeDetector.hpp"
#include "application/WatchService.hpp"
#include "infrastructure/InotifyWatcher.hpp"
#include "infrastructure/WatchStateStore.hpp"

namespace fs = std::filesystem;
using namespace vaultbreakdown;
using application::ChangeDetector;
using application::RunReport;
using application::RunState;
using application::WatchService;

namespace {

const std::string kVault = "test_watch_vault";

class FailingRepository : public domain::WatchStateRepository {
public:
    domain::WatchState load() override { return {}; }
    domain::Status saveLastRunTime(std::chrono::system_clock::time_point) override {
        return domain::Status::Ok();
    }
    domain::Status saveProcessedItems(const std::set<std::string>&) override {
        return domain::Status::Fail(domain::ErrorKind::Persistence, "disk gone");
    }
};

// Records runs; items whose name contains "bad" fail.
struct RunRecorder {
    std::mutex mutex;
    std::vector<std::string> runs;

    WatchService::RunFunction fn() {
        return [this](const std::string& item) {
            std::lock_guard<std::mutex> lock(mutex);
            runs.push_back(fs::path(item).filename().string());
            RunReport report;
            report.item = item;
            report.stepCount = 2;
            if (item.find("bad") != std::string::npos) {
                report.state = RunState::Failed;
                report.error = domain::Error{domain::ErrorKind::ToolExecution, "write failed"};
            } else {
                report.state = RunState::Completed;
                report.stepsCompleted = 2;
            }
            return report;
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return runs.size();
    }
};

application::AppConfig Config() {
    application::AppConfig config;
    config.vaultPath = kVault;
    config.stateDir = kVault + "/.state";
    config.channelCapacity = 4;
    return config;
}

std::string Touch(const std::string& relative) {
    fs::path path = fs::path(kVault) / relative;
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "# Title\nbody\n";
    return path.string();
}

void WaitForRuns(RunRecorder& recorder, size_t expected) {
    for (int i = 0; i < 100 && recorder.count() < expected; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void Reset() {
    fs::remove_all(kVault);
    fs::create_directories(kVault + "/Clippings");
}

void TestChannel() {
    std::cout << "[Test] Bounded channel drains after close..." << std::endl;
    application::BoundedChannel<int> channel(2);
    assert(channel.push(1));
    assert(channel.push(2));
    assert(!channel.tryPush(3));

    std::thread producer([&channel] { assert(channel.push(3)); });
    assert(*channel.pop() == 1);
    producer.join();
    channel.close();
    assert(!channel.push(4));
    assert(*channel.pop() == 2);
    assert(*channel.pop() == 3);
    assert(!channel.pop().has_value());
    std::cout << "[PASS] Channel." << std::endl;
}

void TestFilter() {
    std::cout << "[Test] Only .md files directly in the watched directory qualify..." << std::endl;
    Reset();
    const std::string watched = kVault + "/Clippings";
    const std::string good = Touch("Clippings/article.md");
    Touch("Clippings/notes.txt");
    Touch("Clippings/nested/deep.md");
    Touch("Elsewhere/other.md");
    fs::create_directories(kVault + "/Clippings/folder.md");

    assert(WatchService::IsQualifying(good, watched));
    assert(WatchService::IsQualifying(watched + "/./article.md", watched));
    assert(WatchService::IsQualifying(fs::absolute(good).string(), watched));
    assert(!WatchService::IsQualifying(watched + "/notes.txt", watched));
    assert(!WatchService::IsQualifying(watched + "/nested/deep.md", watched));
    assert(!WatchService::IsQualifying(kVault + "/Elsewhere/other.md", watched));
    assert(!WatchService::IsQualifying(watched + "/folder.md", watched));
    assert(!WatchService::IsQualifying(watched + "/missing.md", watched));
    std::cout << "[PASS] Filter." << std::endl;
}

void TestConsumerMarksOnlyCompletedRuns() {
    std::cout << "[Test] Consumer runs items in order and marks completed ones..." << std::endl;
    Reset();
    const std::string first = Touch("Clippings/first.md");
    const std::string bad = Touch("Clippings/bad.md");
    const std::string second = Touch("Clippings/second.md");
    Touch("Clippings/ignored.txt");

    auto detector = std::make_shared<ChangeDetector>(
        std::make_shared<infrastructure::WatchStateStore>(Config().stateDir));
    RunRecorder recorder;
    WatchService service(Config(), detector, recorder.fn());

    std::thread consumer([&service] { assert(service.runConsumer().ok()); });
    assert(service.enqueue(first));
    assert(service.enqueue(bad));
    assert(!service.enqueue(kVault + "/Clippings/ignored.txt"));
    assert(service.enqueue(second));
    WaitForRuns(recorder, 3);
    service.shutdown();
    consumer.join();

    assert(recorder.runs == std::vector<std::string>({"first.md", "bad.md", "second.md"}));
    assert(service.completedRuns() == 2);
    assert(service.failedRuns() == 1);
    assert(!detector->shouldProcess(first));
    assert(!detector->shouldProcess(second));
    assert(detector->shouldProcess(bad));

    // Processed items are refused at the door and skipped if queued twice.
    WatchService again(Config(), detector, recorder.fn());
    assert(!again.enqueue(first));
    assert(again.processItem(first).ok());
    assert(recorder.count() == 3);

    // A fresh detector over the same state still knows them.
    ChangeDetector reloaded(std::make_shared<infrastructure::WatchStateStore>(Config().stateDir));
    assert(!reloaded.shouldProcess(first));
    assert(reloaded.shouldProcess(bad));
    std::cout << "[PASS] Consumer marks completed runs." << std::endl;
}

void TestPersistenceErrorStopsConsumer() {
    std::cout << "[Test] Persistence failure stops the consumer..." << std::endl;
    Reset();
    const std::string a = Touch("Clippings/a.md");
    const std::string b = Touch("Clippings/b.md");

    auto detector = std::make_shared<ChangeDetector>(std::make_shared<FailingRepository>());
    RunRecorder recorder;
    WatchService service(Config(), detector, recorder.fn());
    assert(service.enqueue(a));
    assert(service.enqueue(b));

    auto status = service.runConsumer();
    assert(!status.ok());
    assert(status.error().kind == domain::ErrorKind::Persistence);
    assert(recorder.count() == 1);
    assert(detector->shouldProcess(a));
    assert(!service.enqueue(b));
    std::cout << "[PASS] Persistence failure." << std::endl;
}

void TestShutdownDropsQueuedItems() {
    std::cout << "[Test] Shutdown drops queued items instead of running them..." << std::endl;
    Reset();
    auto config = Config();
    config.channelCapacity = 8;
    std::vector<std::string> items;
    for (int i = 0; i < 5; ++i) {
        items.push_back(Touch("Clippings/queued-" + std::to_string(i) + ".md"));
    }

    auto detector = std::make_shared<ChangeDetector>(
        std::make_shared<infrastructure::WatchStateStore>(config.stateDir));
    RunRecorder recorder;
    WatchService service(config, detector, recorder.fn());
    for (const auto& item : items) assert(service.enqueue(item));

    assert(service.shutdown() == 5);
    assert(service.runConsumer().ok());
    assert(recorder.count() == 0);
    assert(!service.enqueue(items[0]));

    // Still unmarked, so the next start picks them up.
    for (const auto& item : items) assert(detector->shouldProcess(item));
    auto pending = detector->scan(service.watchDir());
    assert(pending.ok());
    assert(pending->size() == 5);
    std::cout << "[PASS] Shutdown drops queue." << std::endl;
}

void TestFailedItemRunsOncePerSession() {
    std::cout << "[Test] A failed item queued twice runs once..." << std::endl;
    Reset();
    const std::string bad = Touch("Clippings/bad.md");

    auto detector = std::make_shared<ChangeDetector>(
        std::make_shared<infrastructure::WatchStateStore>(Config().stateDir));
    RunRecorder recorder;
    WatchService service(Config(), detector, recorder.fn());

    // Watcher event and catch-up scan both queue the same path.
    assert(service.enqueue(bad));
    assert(service.enqueue(kVault + "/Clippings/./bad.md"));
    std::thread consumer([&service] { assert(service.runConsumer().ok()); });
    WaitForRuns(recorder, 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    service.shutdown();
    consumer.join();

    assert(recorder.count() == 1);
    assert(service.failedRuns() == 1);
    assert(detector->shouldProcess(bad));

    // A new session tries it again.
    WatchService restarted(Config(), detector, recorder.fn());
    assert(restarted.processItem(bad).ok());
    assert(recorder.count() == 2);
    std::cout << "[PASS] Failed item once per session." << std::endl;
}

void TestCatchUpAndScanOnce() {
    std::cout << "[Test] Catch-up and one-shot scans..." << std::endl;
    Reset();
    Touch("Clippings/one.md");
    Touch("Clippings/two.md");
    Touch("Clippings/bad-three.md");

    // Scan start a minute ahead so the files are unambiguously older than the last run.
    const auto scanTime = std::chrono::system_clock::now() + std::chrono::minutes(1);
    auto detector = std::make_shared<ChangeDetector>(
        std::make_shared<infrastructure::WatchStateStore>(Config().stateDir), [scanTime] { return scanTime; });
    RunRecorder recorder;
    WatchService service(Config(), detector, recorder.fn());

    assert(service.scanOnce().ok());
    assert(recorder.count() == 3);
    assert(service.completedRuns() == 2);
    assert(detector->processedCount() == 2);

    // Nothing new since the scan: catch-up queues nothing.
    WatchService watcher(Config(), detector, recorder.fn());
    assert(watcher.catchUp().ok());
    watcher.shutdown();
    assert(watcher.runConsumer().ok());
    assert(recorder.count() == 3);
    std::cout << "[PASS] Catch-up and scan." << std::endl;
}

void TestInotifyEvents() {
    std::cout << "[Test] Creation events are reported once the file is closed..." << std::endl;
    infrastructure::InotifyWatcher watcher("/vault/Clippings");
    assert(!watcher.handleEvent(IN_CREATE, "a.md").has_value());
    auto closed = watcher.handleEvent(IN_CLOSE_WRITE, "a.md");
    assert(closed && *closed == "/vault/Clippings/a.md");
    // Rewriting an existing file is not a creation.
    assert(!watcher.handleEvent(IN_CLOSE_WRITE, "a.md").has_value());
    auto moved = watcher.handleEvent(IN_MOVED_TO, "b.md");
    assert(moved && *moved == "/vault/Clippings/b.md");
    auto dir = watcher.handleEvent(IN_CREATE | IN_ISDIR, "sub");
    assert(dir && *dir == "/vault/Clippings/sub");
    assert(!watcher.handleEvent(IN_CREATE, "").has_value());
    std::cout << "[PASS] Event handling." << std::endl;
}

void TestWatcherEndToEnd() {
    std::cout << "[Test] Watcher feeds the consumer..." << std::endl;
    Reset();
    auto detector = std::make_shared<ChangeDetector>(
        std::make_shared<infrastructure::WatchStateStore>(Config().stateDir));
    RunRecorder recorder;
    WatchService service(Config(), detector, recorder.fn());

    infrastructure::InotifyWatcher watcher(service.watchDir(), 50);
    auto started = watcher.start([&service](const std::string& path) { service.enqueue(path); });
    assert(started.ok());
    std::thread consumer([&service] { assert(service.runConsumer().ok()); });

    Touch("Clippings/live.md");
    Touch("Clippings/live.txt");
    fs::create_directories(kVault + "/Clippings/subdir");
    Touch("Elsewhere/moved.md");
    fs::rename(kVault + "/Elsewhere/moved.md", kVault + "/Clippings/moved.md");

    WaitForRuns(recorder, 2);
    watcher.stop();
    service.shutdown();
    consumer.join();

    assert(recorder.count() == 2);
    assert(recorder.runs[0] == "live.md");
    assert(recorder.runs[1] == "moved.md");
    assert(detector->processedCount() == 2);
    std::cout << "[PASS] Watcher end to end." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WatchService Test..." << std::endl;
    TestChannel();
    TestFilter();
    TestConsumerMarksOnlyCompletedRuns();
    TestPersistenceErrorStopsConsumer();
    TestShutdownDropsQueuedItems();
    TestFailedItemRunsOncePerSession();
    TestCatchUpAndScanOnce();
    TestInotifyEvents();
    TestWatcherEndToEnd();
    fs::remove_all(kVault);
    std::cout << "[PASS] WatchService Test." << std::endl;
    return 0;
}
