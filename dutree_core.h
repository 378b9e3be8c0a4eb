// dutree_core.h - Core functionality for the disk usage tree reporter
#ifndef DUTREE_CORE_H
#define DUTREE_CORE_H

#include <iostream>
#include <filesystem>
#include <vector>
#include <algorithm>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace fs = std::filesystem;

// Constants for performance tuning
constexpr size_t THREAD_POOL_SIZE = 0;  // 0 = auto-detect
constexpr size_t MAX_THREAD_COUNT = 1024;
constexpr size_t QUEUE_SIZE_LIMIT = 50000;
constexpr auto JOIN_POLL_INTERVAL = std::chrono::milliseconds(1);

// ANSI color codes
extern const std::string RESET;
extern const std::string BLUE;
extern const std::string BOLD;

// Progress reporting constants
extern const std::string CLEAR_LINE;

// Configuration structure
struct Config {
    fs::path root_path = ".";
    size_t thread_count = THREAD_POOL_SIZE;
    std::string format = "binary";
    bool strict_root = false;
    bool no_colors = false;
    bool show_progress = true;
    bool show_stats = false;
};

// Thrown only when the root cannot be read and strict_root is set
class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class EntryKind {
    File = 0,
    Directory = 1
};

enum class FailureKind {
    ScanFailure,      // directory cannot be opened or listed
    EntryFailure,     // one directory entry cannot be classified
    MetadataFailure   // file size cannot be read
};

class Entry;

class FileEntry {
public:
    FileEntry(fs::path p, uintmax_t bytes) : path_(std::move(p)), size_(bytes) {}

    const fs::path& path() const { return path_; }
    uintmax_t size() const { return size_; }

private:
    fs::path path_;
    uintmax_t size_;
};

// A directory is frozen on construction: its size is the sum of the given
// children and the children are sorted once.
class DirectoryEntry {
public:
    DirectoryEntry(fs::path p, std::vector<Entry> children);

    const fs::path& path() const { return path_; }
    uintmax_t size() const { return size_; }
    const std::vector<Entry>& children() const { return children_; }

private:
    fs::path path_;
    uintmax_t size_{0};
    std::vector<Entry> children_;
};

// Resolved node of the result tree
class Entry {
public:
    Entry(FileEntry file) : node_(std::move(file)) {}
    Entry(DirectoryEntry directory) : node_(std::move(directory)) {}

    EntryKind kind() const;
    const fs::path& path() const;
    uintmax_t size() const;

    // nullptr for files
    const DirectoryEntry* as_directory() const { return std::get_if<DirectoryEntry>(&node_); }

    template<class Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), node_);
    }

private:
    std::variant<FileEntry, DirectoryEntry> node_;
};

// Sibling order: directories first, then size descending, then path ascending
bool entry_order(const Entry& a, const Entry& b);
void sort_entries(std::vector<Entry>& entries);

// Rate limit for the progress line; never fires unless stderr is a terminal
class ProgressThrottle {
private:
    std::chrono::steady_clock::time_point next_update;
    std::chrono::milliseconds update_interval;
    bool enabled;
    std::mutex mutex;

public:
    explicit ProgressThrottle(bool requested,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(100));
    bool should_update();
    bool is_enabled() const { return enabled; }
};

// Work-stealing thread pool. Submissions beyond the queue limit run inline on
// the caller, and joining threads execute queued work while they wait.
class WorkStealingThreadPool {
private:
    struct WorkQueue {
        std::deque<std::function<void()>> tasks;
        std::mutex mutex;
        std::atomic<size_t> size{0};
    };

    std::vector<std::thread> workers;
    std::vector<std::unique_ptr<WorkQueue>> queues;
    std::condition_variable work_available;
    std::mutex global_mutex;
    std::atomic<bool> stop{false};
    std::atomic<size_t> queued_tasks{0};
    size_t num_threads;
    size_t queue_limit;

    bool try_pop_local(size_t id, std::function<void()>& task);
    bool try_steal(size_t thief_id, std::function<void()>& task);
    void worker_thread(size_t id);

public:
    explicit WorkStealingThreadPool(size_t threads = 0, size_t max_queued = QUEUE_SIZE_LIMIT);
    ~WorkStealingThreadPool();

    WorkStealingThreadPool(const WorkStealingThreadPool&) = delete;
    WorkStealingThreadPool& operator=(const WorkStealingThreadPool&) = delete;

    template<class F>
    void enqueue(F&& f);

    template<class F>
    std::future<std::invoke_result_t<std::decay_t<F>>> submit(F&& f);

    template<class R>
    R join(std::future<R>& result);

    // Runs one queued task on the calling thread; false if none was queued
    bool run_pending_task();

    size_t thread_count() const { return num_threads; }
};

struct ScanItem {
    fs::path path;
    EntryKind kind;
    fs::file_type type;
};

struct ScanStats {
    std::atomic<size_t> file_count{0};
    std::atomic<size_t> dir_count{0};
    std::atomic<size_t> other_count{0};
    std::atomic<size_t> io_errors{0};
    std::atomic<size_t> entries_traversed{0};
};

// Lists the immediate children of one directory and reports failures
class DirectoryScanner {
private:
    std::ostream& warnings;
    std::mutex warnings_mutex;
    bool progress_drawn = false;
    ScanStats stats_;

public:
    explicit DirectoryScanner(std::ostream& warning_stream = std::cerr);

    // False when the directory itself cannot be opened; unreadable entries
    // are skipped and the listing continues.
    bool try_list_directory(const fs::path& dir_path, std::vector<ScanItem>& items);

    // Warnings and the progress line share one stream and one lock; a warning
    // first erases a progress line that is still on screen.
    void report_failure(FailureKind kind, const fs::path& path, const std::error_code& ec);
    void show_progress(const std::string& text);
    void clear_progress();

    ScanStats& stats() { return stats_; }
    const ScanStats& stats() const { return stats_; }
};

// Recursive size aggregation. Every subdirectory is resolved as its own pool
// task; a directory is only built after all of its child tasks are joined.
class SizeAggregator {
private:
    WorkStealingThreadPool& pool;
    const Config& config;
    DirectoryScanner scanner;
    ProgressThrottle progress_throttle;
    std::atomic<uintmax_t> total_size{0};
    std::chrono::steady_clock::time_point start_time;

    Entry resolve_directory(const fs::path& path);
    Entry resolve_file(const fs::path& path, fs::file_type type);
    void update_progress(const fs::path& path);

public:
    SizeAggregator(WorkStealingThreadPool& tp, const Config& cfg,
                   std::ostream& warning_stream = std::cerr);

    // Applies the strict_root policy, then resolves the tree
    Entry resolve_root(const fs::path& path);

    // Never throws for filesystem errors; failing nodes resolve to size 0
    Entry resolve(const fs::path& path);

    const ScanStats& stats() const { return scanner.stats(); }
    void print_stats(std::ostream& out = std::cerr) const;
};

// Utility functions
std::string format_size(uintmax_t bytes, const std::string& format);
std::string shorten_path(const std::string& path, size_t max_length = 45);
const char* failure_label(FailureKind kind);
std::string to_lower(std::string text);

// Template implementation for WorkStealingThreadPool
template<class F>
void WorkStealingThreadPool::enqueue(F&& f) {
    if (stop) return;

    static std::atomic<size_t> next_queue{0};
    const size_t actual_threads = queues.size();
    size_t queue_id = next_queue.fetch_add(1) % actual_threads;

    size_t attempts = 0;
    while (attempts < actual_threads) {
        auto& queue = queues[queue_id];

        if (queue->size.load() < queue_limit / actual_threads) {
            std::lock_guard<std::mutex> lock(queue->mutex);
            queue->tasks.emplace_back(std::forward<F>(f));
            queue->size++;
            queued_tasks++;
            work_available.notify_one();
            return;
        }

        queue_id = (queue_id + 1) % actual_threads;
        attempts++;
    }

    f();
}

template<class F>
std::future<std::invoke_result_t<std::decay_t<F>>> WorkStealingThreadPool::submit(F&& f) {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    auto result = task->get_future();
    enqueue([task]() { (*task)(); });
    return result;
}

template<class R>
R WorkStealingThreadPool::join(std::future<R>& result) {
    while (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (!run_pending_task()) {
            result.wait_for(JOIN_POLL_INTERVAL);
        }
    }
    return result.get();
}

#endif // DUTREE_CORE_H
