// Download coordinator scenarios with a gated transfer client (run via CTest).
#include "TestSupport.hpp"

#include "core/downloader/DownloadCoordinator.hpp"

#include <atomic>
#include <stdexcept>

namespace {

using namespace courier::testing;
using namespace std::chrono_literals;

CoordinatorSettings settingsFor(const TempDir &dir, int maxConcurrent) {
    CoordinatorSettings settings;
    settings.downloadDirectory = dir.path();
    settings.maxConcurrent = maxConcurrent;
    settings.maxRetries = 1;
    settings.progressThrottle = 0ms;
    // Keep timer-driven removal out of the way; tests prune explicitly
    settings.cleanupDelay = std::chrono::hours(1);
    settings.staleAfter = 30s;
    settings.sweepInterval = std::chrono::hours(1);
    return settings;
}

DownloadRequest request(const std::string &location, std::int64_t messageId,
                        const std::string &name = "") {
    DownloadRequest r;
    r.source.location = location;
    r.surface = SurfaceRef{"chat", messageId};
    r.filename = name.empty() ? location + ".bin" : name;
    return r;
}

size_t queuedPosition(const SubmitResult &result) {
    auto *queued = std::get_if<AdmissionQueued>(&result.admission);
    return queued ? queued->position : 0;
}

// Surface whose progress renders are slow, so a transfer can finish while
// one is still being delivered
class SlowProgressSurface : public RecordingSurface {
public:
    RenderStatus render(const SurfaceRef &ref, const std::string &text) override {
        if (text.find("Progress:") != std::string::npos) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_progressStarted = true;
            }
            m_condition.notify_all();
            std::this_thread::sleep_for(300ms);
        }
        return RecordingSurface::render(ref, text);
    }

    bool waitProgressStarted(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, timeout, [this] { return m_progressStarted; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_progressStarted{false};
};

// Reports half the file, then finishes as soon as a progress render is under way
class HalfwayTransferClient : public TransferClient {
public:
    explicit HalfwayTransferClient(SlowProgressSurface &surface) : m_surface(surface) {}

    std::string transfer(const TransferSource &, const std::string &destinationPath,
                         const TransferProgressCallback &onProgress,
                         const CancellationToken &) override {
        writeFile(destinationPath, "0123456789");
        onProgress(5, 10);
        progressRendered = m_surface.waitProgressStarted(5s);
        return destinationPath;
    }

    std::atomic<bool> progressRendered{false};

private:
    SlowProgressSurface &m_surface;
};

void test_cancel_running_promotes_queued(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto clock = std::make_shared<ManualClock>();
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, clock);

    auto a = coordinator.submit(request("A", 1));
    auto b = coordinator.submit(request("B", 2));
    auto c = coordinator.submit(request("C", 3));

    t.check(!a.isQueued(), "first request should start immediately");
    t.check(queuedPosition(b) == 1, "second request should be queued at position 1");
    t.check(queuedPosition(c) == 2, "third request should be queued at position 2");
    t.check(a.taskId.size() == 8, "task ids should have 8 characters");

    t.check(client.waitStarted("A"), "A should start transferring");
    const std::string partialA = client.destination("A");
    t.check(fs::exists(partialA), "A should have a partial file");

    auto result = coordinator.cancel(a.taskId);
    t.check(result.success, "cancelling a running task should succeed");
    t.check(!result.wasQueued, "A was running, not queued");
    t.check(result.filename == "A.bin", "cancel result should name the file");

    t.check(client.waitStarted("B"), "B should be promoted into the freed slot");
    t.check(!client.hasStarted("C"), "C should still wait");
    t.check(!fs::exists(partialA), "A's partial file should be removed");
    t.check(!coordinator.isTracked(a.taskId), "cancelled task should leave the registry");

    t.checkContains(surface.last(SurfaceRef{"chat", 3}), "Position: #1",
                    "C should be told it moved to position 1");
    t.check(eventually([&] { return surface.last(SurfaceRef{"chat", 1}).find("cancelled") != std::string::npos; }),
            "A's surface should show the cancellation");

    auto stats = coordinator.stats();
    t.check(stats.active == 1 && stats.queued == 1, "one running and one queued after promotion");

    coordinator.shutdown();
}

void test_cancel_queued_leaves_files_alone(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto clock = std::make_shared<ManualClock>();
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, clock);

    std::mutex catalogMutex;
    std::vector<std::pair<std::string, std::uint64_t>> catalog;
    coordinator.setCompletionCallback([&](const std::string &id, const std::string &, std::uint64_t size) {
        std::lock_guard<std::mutex> lock(catalogMutex);
        catalog.emplace_back(id, size);
    });

    auto a = coordinator.submit(request("A", 1));
    auto b = coordinator.submit(request("B", 2));
    t.check(client.waitStarted("A"), "A should start");

    auto result = coordinator.cancel(b.taskId);
    t.check(result.success && result.wasQueued, "queued task should be removed from the queue");
    t.check(coordinator.listQueued().empty(), "queue should be empty after the cancel");
    t.check(fs::exists(client.destination("A")), "running task's file should be untouched");
    t.check(!coordinator.statusOf(b.taskId).has_value(), "cancelled queued task should be unknown");

    client.release("A");
    t.check(coordinator.waitUntilIdle(5s), "coordinator should become idle");
    t.check(coordinator.statusOf(a.taskId) == std::optional<DownloadStatus>(DownloadStatus::Completed),
            "A should complete");
    t.check(!client.hasStarted("B"), "cancelled queued task should never start");

    const std::string path = coordinator.destinationOf(a.taskId);
    t.check(readFile(path) == "complete:A", "A's file should hold the transferred data");
    // The slot is released before the completion is announced
    t.check(eventually([&] {
                std::lock_guard<std::mutex> lock(catalogMutex);
                return !catalog.empty();
            }),
            "completion handler should run");
    t.checkContains(surface.last(SurfaceRef{"chat", 1}), "Download Complete", "completion should be rendered");

    {
        std::lock_guard<std::mutex> lock(catalogMutex);
        t.check(catalog.size() == 1 && catalog[0].first == a.taskId, "completion handler should see A");
        t.check(catalog.size() == 1 && catalog[0].second == 10, "completion handler should get the size");
    }

    auto again = coordinator.cancel(a.taskId);
    t.check(!again.success, "finished tasks cannot be cancelled");
    t.check(fs::exists(path), "refused cancel should keep the file");
}

void test_cancel_unknown_id(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    DownloadCoordinator coordinator(settingsFor(dir, 2), client, surface, std::make_shared<ManualClock>());

    auto result = coordinator.cancel("nope0000");
    t.check(!result.success, "unknown id cannot be cancelled");
    t.check(result.message == "No download found with ID: nope0000", "not-found message");
    t.check(coordinator.stats().tracked == 0, "nothing should change");
}

void test_fifo_promotion_and_positions(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, std::make_shared<ManualClock>());

    auto a = coordinator.submit(request("A", 1));
    auto b = coordinator.submit(request("B", 2));
    auto c = coordinator.submit(request("C", 3));
    auto d = coordinator.submit(request("D", 4));

    auto queued = coordinator.listQueued();
    t.check(queued.size() == 3, "three requests should be queued");
    if (queued.size() == 3) {
        t.check(queued[0].taskId == b.taskId && queued[0].position == 1, "B is first in line");
        t.check(queued[1].taskId == c.taskId && queued[1].position == 2, "C is second");
        t.check(queued[2].taskId == d.taskId && queued[2].position == 3, "D is third");
    }

    t.check(client.waitStarted("A"), "A should start");
    client.release("A");
    t.check(client.waitStarted("B"), "B should follow A");

    queued = coordinator.listQueued();
    t.check(queued.size() == 2 && queued[0].taskId == c.taskId && queued[0].position == 1,
            "C should move to position 1");
    t.checkContains(surface.last(SurfaceRef{"chat", 4}), "Position: #2", "D should move to position 2");

    client.release("B");
    t.check(client.waitStarted("C"), "C should follow B");
    client.release("C");
    t.check(client.waitStarted("D"), "D should follow C");
    client.release("D");

    t.check(coordinator.waitUntilIdle(5s), "all downloads should finish");
    auto order = client.started();
    t.check(order == std::vector<std::string>({"A", "B", "C", "D"}), "promotion should be FIFO");
}

void test_prune_after_stale_age(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto clock = std::make_shared<ManualClock>();
    DownloadCoordinator coordinator(settingsFor(dir, 2), client, surface, clock);

    auto a = coordinator.submit(request("A", 1));
    client.release("A");
    t.check(coordinator.waitUntilIdle(5s), "A should finish");
    t.check(coordinator.isTracked(a.taskId), "finished task stays tracked for a while");

    t.check(coordinator.pruneCompleted() == 0, "fresh completion should not be pruned");
    clock->advance(29s);
    t.check(coordinator.pruneCompleted() == 0, "29 s is not stale yet");
    clock->advance(2s);
    t.check(coordinator.pruneCompleted() == 1, "31 s old completion should be pruned");
    t.check(!coordinator.isTracked(a.taskId), "pruned task leaves the registry");
    t.check(coordinator.stats().tracked == 0, "registry should be empty");
}

void test_failure_frees_slot(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, std::make_shared<ManualClock>());

    client.fail("A", [] { throw PermanentTransferError("HTTP 404"); });
    auto a = coordinator.submit(request("A", 1));
    coordinator.submit(request("B", 2));

    client.release("A");
    t.check(client.waitStarted("B"), "failure should free the slot for B");
    t.check(coordinator.statusOf(a.taskId) == std::optional<DownloadStatus>(DownloadStatus::Failed),
            "A should be failed");
    t.checkContains(surface.last(SurfaceRef{"chat", 1}), "Download failed: HTTP 404",
                    "failure reason should be rendered");

    client.release("B");
    t.check(coordinator.waitUntilIdle(5s), "B should finish");
}

void test_same_name_gets_unique_destination(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto clock = std::make_shared<ManualClock>();
    DownloadCoordinator coordinator(settingsFor(dir, 2), client, surface, clock);

    coordinator.submit(request("X", 1, "same.bin"));
    coordinator.submit(request("Y", 2, "same.bin"));
    t.check(client.waitStarted("X") && client.waitStarted("Y"), "both should start");

    const fs::path x = client.destination("X");
    const fs::path y = client.destination("Y");
    t.check(x != y, "concurrent tasks should not share a destination");
    t.check(x.filename() == "same.bin" || y.filename() == "same.bin", "one keeps the plain name");
    t.check(x.filename() == "same (1).bin" || y.filename() == "same (1).bin", "the other gets a counter");

    const std::string folder = courier::utils::StringUtils::formatDate(clock->wallNow(), "%Y%m%d");
    t.check(x.parent_path() == dir.path() / folder, "files land in the dated folder");

    auto active = coordinator.listActive();
    t.check(active.size() == 2, "both tasks should be listed as active");
    t.check(eventually([&] {
                auto now = coordinator.listActive();
                for (const auto &[id, info] : now) {
                    if (info.downloaded != 7) return false;
                }
                return now.size() == 2;
            }),
            "active list should report bytes done");

    client.release("X");
    client.release("Y");
    t.check(coordinator.waitUntilIdle(5s), "both should finish");
}

void test_shutdown_cancels_everything(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, std::make_shared<ManualClock>());

    coordinator.submit(request("A", 1));
    coordinator.submit(request("B", 2));
    t.check(client.waitStarted("A"), "A should start");
    const std::string partial = client.destination("A");

    coordinator.shutdown();
    t.check(!fs::exists(partial), "shutdown should remove partial files");
    t.check(!client.hasStarted("B"), "queued requests are dropped on shutdown");
    t.check(coordinator.stats().queued == 0, "queue should be empty after shutdown");

    bool threw = false;
    try {
        coordinator.submit(request("C", 3));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    t.check(threw, "submit after shutdown should throw");
}

void test_final_status_outlives_pending_progress(TestContext &t) {
    TempDir dir;
    SlowProgressSurface surface;
    HalfwayTransferClient client(surface);
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, std::make_shared<ManualClock>());

    auto a = coordinator.submit(request("A", 1));
    const SurfaceRef ref{"chat", 1};

    t.check(eventually([&] { return surface.last(ref).find("Download Complete") != std::string::npos; }),
            "completion summary should be rendered");
    t.check(client.progressRendered, "a progress render should have overlapped the transfer's end");
    t.check(coordinator.statusOf(a.taskId) == std::optional<DownloadStatus>(DownloadStatus::Completed),
            "A should be completed");

    // Give a late progress push time to land if one were still pending
    std::this_thread::sleep_for(400ms);
    auto history = surface.history(ref);
    t.check(!history.empty() && history.back().find("Download Complete") != std::string::npos,
            "completed task's surface should end on the completion summary");

    bool sawProgress = false;
    for (const auto &text : history) {
        sawProgress = sawProgress || text.find("Progress:") != std::string::npos;
    }
    t.check(sawProgress, "the progress text should have been shown before the summary");
}

void test_finished_tasks_leave_after_grace_window(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto settings = settingsFor(dir, 3);
    settings.cleanupDelay = 50ms;
    DownloadCoordinator coordinator(settings, client, surface, std::make_shared<ManualClock>());

    client.fail("B", [] { throw PermanentTransferError("HTTP 410"); });
    auto a = coordinator.submit(request("A", 1));
    auto b = coordinator.submit(request("B", 2));
    auto c = coordinator.submit(request("C", 3));
    t.check(client.waitStarted("A") && client.waitStarted("B") && client.waitStarted("C"),
            "all three should start");

    client.release("A");
    client.release("B");
    t.check(eventually([&] {
                return coordinator.statusOf(a.taskId) == std::optional<DownloadStatus>(DownloadStatus::Completed) ||
                       !coordinator.isTracked(a.taskId);
            }),
            "A should complete");

    t.check(eventually([&] { return !coordinator.isTracked(a.taskId); }),
            "completed task should leave the registry after the delay");
    t.check(eventually([&] { return !coordinator.isTracked(b.taskId); }),
            "failed task should leave the registry after the delay");
    t.checkContains(surface.last(SurfaceRef{"chat", 2}), "HTTP 410", "failure should stay rendered");
    t.check(surface.released(SurfaceRef{"chat", 1}) && surface.released(SurfaceRef{"chat", 2}),
            "finished tasks should release their status areas");
    t.check(!surface.released(SurfaceRef{"chat", 3}), "running task keeps its status area");

    std::this_thread::sleep_for(200ms);
    t.check(coordinator.isTracked(c.taskId), "running task should never be removed by the delay");
    t.check(coordinator.statusOf(c.taskId) == std::optional<DownloadStatus>(DownloadStatus::Downloading),
            "running task should still be downloading");

    client.release("C");
    t.check(coordinator.waitUntilIdle(5s), "C should finish");
    t.check(eventually([&] { return coordinator.stats().tracked == 0; }), "registry should empty out");
}

void test_cancel_middle_of_queue(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, std::make_shared<ManualClock>());

    coordinator.submit(request("A", 1));
    auto b = coordinator.submit(request("B", 2));
    auto c = coordinator.submit(request("C", 3));
    auto d = coordinator.submit(request("D", 4));
    t.check(client.waitStarted("A"), "A should start");

    const size_t rendersOfB = surface.history(SurfaceRef{"chat", 2}).size();
    const size_t rendersOfC = surface.history(SurfaceRef{"chat", 3}).size();

    auto result = coordinator.cancel(c.taskId);
    t.check(result.success && result.wasQueued, "C should be removed from the queue");

    t.checkContains(surface.last(SurfaceRef{"chat", 4}), "Position: #2", "D should move up to position 2");
    t.check(surface.history(SurfaceRef{"chat", 2}).size() == rendersOfB, "B's position did not change");
    t.check(surface.history(SurfaceRef{"chat", 3}).size() == rendersOfC, "C gets no position update");
    t.check(surface.released(SurfaceRef{"chat", 3}), "C's status area should be released");
    t.check(!surface.released(SurfaceRef{"chat", 2}), "B's status area is still in use");

    auto queued = coordinator.listQueued();
    t.check(queued.size() == 2, "two requests should remain queued");
    if (queued.size() == 2) {
        t.check(queued[0].taskId == b.taskId && queued[0].position == 1, "B stays first");
        t.check(queued[1].taskId == d.taskId && queued[1].position == 2, "D is second");
    }

    client.release("A");
    t.check(client.waitStarted("B"), "B should follow A");
    t.check(!client.hasStarted("D"), "D waits for B");
    client.release("B");
    t.check(client.waitStarted("D"), "D should follow B");
    client.release("D");

    t.check(coordinator.waitUntilIdle(5s), "all downloads should finish");
    t.check(client.started() == std::vector<std::string>({"A", "B", "D"}), "cancelled C never starts");
}

void test_list_queued_prunes_stale_tasks(TestContext &t) {
    TempDir dir;
    GatedTransferClient client;
    RecordingSurface surface;
    auto clock = std::make_shared<ManualClock>();
    DownloadCoordinator coordinator(settingsFor(dir, 1), client, surface, clock);

    auto a = coordinator.submit(request("A", 1));
    client.release("A");
    t.check(coordinator.waitUntilIdle(5s), "A should finish");

    clock->advance(31s);
    t.check(coordinator.isTracked(a.taskId), "nothing prunes without a call");
    t.check(coordinator.listQueued().empty(), "queue is empty");
    t.check(!coordinator.isTracked(a.taskId), "listing the queue should prune stale tasks");
}

} // namespace

int main() {
    TestContext t;
    test_cancel_running_promotes_queued(t);
    test_cancel_queued_leaves_files_alone(t);
    test_cancel_unknown_id(t);
    test_fifo_promotion_and_positions(t);
    test_prune_after_stale_age(t);
    test_failure_frees_slot(t);
    test_same_name_gets_unique_destination(t);
    test_shutdown_cancels_everything(t);
    test_final_status_outlives_pending_progress(t);
    test_finished_tasks_leave_after_grace_window(t);
    test_cancel_middle_of_queue(t);
    test_list_queued_prunes_stale_tasks(t);
    return finish(t, "courier_coordinator_tests");
}
