// dutree_core.cpp - Core functionality implementation
#include "dutree_core.h"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <unistd.h>

// Define color constants
const std::string RESET = "\033[0m";
const std::string BLUE = "\033[34m";
const std::string BOLD = "\033[1m";
const std::string CLEAR_LINE = "\033[2K\r";

// Format size based on configuration
std::string format_size(uintmax_t bytes, const std::string& format) {
    if (format == "bytes") {
        return std::to_string(bytes) + " B";
    }

    double size = static_cast<double>(bytes);
    int unit_index = 0;

    if (format == "metric" || format == "binary") {
        const char* metric_units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
        const char* binary_units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
        const char** units = format == "metric" ? metric_units : binary_units;
        const double divisor = format == "metric" ? 1000.0 : 1024.0;

        while (size >= divisor && unit_index < 5) {
            size /= divisor;
            unit_index++;
        }

        std::ostringstream oss;
        if (unit_index == 0) {
            oss << bytes << " " << units[unit_index];
        } else {
            oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
        }
        return oss.str();
    }

    struct FixedUnit {
        const char* name;
        const char* label;
        double divisor;
    };
    static const FixedUnit fixed_units[] = {
        {"gb", "GB", 1000000000.0},
        {"gib", "GiB", 1073741824.0},
        {"mb", "MB", 1000000.0},
        {"mib", "MiB", 1048576.0},
    };

    for (const auto& unit : fixed_units) {
        if (format == unit.name) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2) << size / unit.divisor << " " << unit.label;
            return oss.str();
        }
    }

    return std::to_string(bytes) + " B";
}

// Helper function to shorten paths for display
std::string shorten_path(const std::string& path, size_t max_length) {
    if (path.length() <= max_length) {
        return path;
    }

    const std::string ellipsis = "...";
    if (max_length <= ellipsis.length()) {
        return path.substr(0, max_length);
    }

    const size_t keep = (max_length - ellipsis.length()) / 2;
    return path.substr(0, keep) + ellipsis + path.substr(path.length() - keep);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* failure_label(FailureKind kind) {
    switch (kind) {
        case FailureKind::ScanFailure:
            return "Cannot list directory";
        case FailureKind::EntryFailure:
            return "Cannot read directory entry";
        case FailureKind::MetadataFailure:
            return "Cannot read size";
    }
    return "I/O error";
}

// Entry implementation
DirectoryEntry::DirectoryEntry(fs::path p, std::vector<Entry> children)
    : path_(std::move(p)), children_(std::move(children)) {
    size_ = std::accumulate(children_.begin(), children_.end(), uintmax_t{0},
        [](uintmax_t total, const Entry& child) { return total + child.size(); });
    sort_entries(children_);
}

EntryKind Entry::kind() const {
    return std::holds_alternative<DirectoryEntry>(node_) ? EntryKind::Directory : EntryKind::File;
}

const fs::path& Entry::path() const {
    return visit([](const auto& node) -> const fs::path& { return node.path(); });
}

uintmax_t Entry::size() const {
    return visit([](const auto& node) { return node.size(); });
}

bool entry_order(const Entry& a, const Entry& b) {
    if (a.kind() != b.kind()) {
        return a.kind() == EntryKind::Directory;
    }
    if (a.size() != b.size()) {
        return a.size() > b.size();
    }
    return a.path() < b.path();
}

void sort_entries(std::vector<Entry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), entry_order);
}

// ProgressThrottle implementation
ProgressThrottle::ProgressThrottle(bool requested, std::chrono::milliseconds interval)
    : next_update(std::chrono::steady_clock::now() + interval),
      update_interval(interval),
      enabled(requested && isatty(fileno(stderr))) {}

bool ProgressThrottle::should_update() {
    if (!enabled) return false;

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex);
    if (now < next_update) {
        return false;
    }
    next_update = now + update_interval;
    return true;
}

// WorkStealingThreadPool implementation
bool WorkStealingThreadPool::try_pop_local(size_t id, std::function<void()>& task) {
    auto& my_queue = queues[id];
    std::unique_lock<std::mutex> lock(my_queue->mutex);
    if (my_queue->tasks.empty()) {
        return false;
    }
    task = std::move(my_queue->tasks.front());
    my_queue->tasks.pop_front();
    my_queue->size--;
    queued_tasks--;
    return true;
}

bool WorkStealingThreadPool::try_steal(size_t thief_id, std::function<void()>& task) {
    const size_t actual_threads = queues.size();
    for (size_t i = 1; i <= actual_threads; ++i) {
        size_t victim_id = (thief_id + i) % actual_threads;
        auto& victim_queue = queues[victim_id];

        if (victim_queue->size.load() > 0) {
            std::unique_lock<std::mutex> lock(victim_queue->mutex, std::try_to_lock);
            if (lock.owns_lock() && !victim_queue->tasks.empty()) {
                task = std::move(victim_queue->tasks.back());
                victim_queue->tasks.pop_back();
                victim_queue->size--;
                queued_tasks--;
                return true;
            }
        }
    }
    return false;
}

void WorkStealingThreadPool::worker_thread(size_t id) {
    while (!stop) {
        std::function<void()> task;

        if (!try_pop_local(id, task) && !try_steal(id, task)) {
            std::unique_lock<std::mutex> lock(global_mutex);
            work_available.wait_for(lock, std::chrono::milliseconds(10),
                [this] { return stop.load() || queued_tasks.load() > 0; });
            continue;
        }

        task();
    }
}

bool WorkStealingThreadPool::run_pending_task() {
    std::function<void()> task;
    static std::atomic<size_t> next_victim{0};

    if (!try_steal(next_victim.fetch_add(1) % queues.size(), task)) {
        return false;
    }

    task();
    return true;
}

WorkStealingThreadPool::WorkStealingThreadPool(size_t threads, size_t max_queued)
    : queue_limit(max_queued) {
    num_threads = threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    queues.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        queues.emplace_back(std::make_unique<WorkQueue>());
    }

    workers.reserve(num_threads);
    try {
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back(&WorkStealingThreadPool::worker_thread, this, i);
        }
    } catch (const std::system_error&) {
        // The destructor does not run for a half-built pool
        stop = true;
        work_available.notify_all();
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }
}

WorkStealingThreadPool::~WorkStealingThreadPool() {
    stop = true;
    work_available.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

// DirectoryScanner implementation
DirectoryScanner::DirectoryScanner(std::ostream& warning_stream)
    : warnings(warning_stream) {}

void DirectoryScanner::report_failure(FailureKind kind, const fs::path& path,
                                      const std::error_code& ec) {
    stats_.io_errors++;

    std::lock_guard<std::mutex> lock(warnings_mutex);
    if (progress_drawn) {
        warnings << CLEAR_LINE;
        progress_drawn = false;
    }
    warnings << "Warning: " << failure_label(kind) << ": " << path.string()
             << " (" << ec.message() << ")\n";
}

void DirectoryScanner::show_progress(const std::string& text) {
    std::lock_guard<std::mutex> lock(warnings_mutex);
    warnings << "\r" << text << std::flush;
    progress_drawn = true;
}

void DirectoryScanner::clear_progress() {
    std::lock_guard<std::mutex> lock(warnings_mutex);
    if (progress_drawn) {
        warnings << CLEAR_LINE << std::flush;
        progress_drawn = false;
    }
}

bool DirectoryScanner::try_list_directory(const fs::path& dir_path,
                                          std::vector<ScanItem>& items) {
    std::error_code ec;
    fs::directory_iterator it(dir_path, ec);
    if (ec) {
        report_failure(FailureKind::ScanFailure, dir_path, ec);
        return false;
    }

    const fs::directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        const auto status = it->symlink_status(entry_ec);
        if (entry_ec) {
            report_failure(FailureKind::EntryFailure, it->path(), entry_ec);
        } else {
            const EntryKind kind = fs::is_directory(status) ? EntryKind::Directory : EntryKind::File;
            items.push_back({it->path(), kind, status.type()});
        }

        it.increment(ec);
        if (ec) {
            // The iterator cannot advance past a readdir error; keep what was listed
            report_failure(FailureKind::EntryFailure, dir_path, ec);
            break;
        }
    }

    return true;
}

// SizeAggregator implementation
SizeAggregator::SizeAggregator(WorkStealingThreadPool& tp, const Config& cfg,
                               std::ostream& warning_stream)
    : pool(tp), config(cfg), scanner(warning_stream),
      progress_throttle(cfg.show_progress) {
    start_time = std::chrono::steady_clock::now();
}

void SizeAggregator::update_progress(const fs::path& path) {
    size_t current_entries = ++scanner.stats().entries_traversed;

    if (progress_throttle.should_update()) {
        scanner.show_progress("Enumerating " + std::to_string(current_entries) + " items - " +
                              shorten_path(path.string()));
    }
}

Entry SizeAggregator::resolve_file(const fs::path& path, fs::file_type type) {
    update_progress(path);

    if (type != fs::file_type::regular) {
        scanner.stats().other_count++;
        return FileEntry(path, 0);
    }

    std::error_code ec;
    uintmax_t bytes = fs::file_size(path, ec);
    if (ec) {
        scanner.report_failure(FailureKind::MetadataFailure, path, ec);
        bytes = 0;
    }

    scanner.stats().file_count++;
    return FileEntry(path, bytes);
}

Entry SizeAggregator::resolve_directory(const fs::path& path) {
    scanner.stats().dir_count++;
    update_progress(path);

    std::vector<ScanItem> items;
    if (!scanner.try_list_directory(path, items)) {
        return DirectoryEntry(path, {});
    }

    std::vector<Entry> children;
    children.reserve(items.size());
    std::vector<std::future<Entry>> pending;

    for (const auto& item : items) {
        if (item.kind == EntryKind::Directory) {
            pending.push_back(pool.submit([this, child = item.path]() {
                return resolve_directory(child);
            }));
        } else {
            children.push_back(resolve_file(item.path, item.type));
        }
    }

    for (auto& result : pending) {
        children.push_back(pool.join(result));
    }

    return DirectoryEntry(path, std::move(children));
}

Entry SizeAggregator::resolve(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || status.type() == fs::file_type::not_found) {
        if (!ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        scanner.report_failure(FailureKind::MetadataFailure, path, ec);
        return FileEntry(path, 0);
    }

    if (fs::is_directory(status)) {
        return resolve_directory(path);
    }
    return resolve_file(path, status.type());
}

Entry SizeAggregator::resolve_root(const fs::path& path) {
    start_time = std::chrono::steady_clock::now();

    // The root itself is followed when it is a symlink
    std::error_code ec;
    const auto status = fs::status(path, ec);

    if (config.strict_root) {
        if (ec) {
            throw ScanError("Cannot access " + path.string() + ": " + ec.message());
        }
        if (fs::is_directory(status)) {
            fs::directory_iterator listing(path, ec);
            if (ec) {
                throw ScanError("Cannot list " + path.string() + ": " + ec.message());
            }
        }
    }

    Entry root = (!ec && fs::is_directory(status)) ? resolve_directory(path) : resolve(path);

    scanner.clear_progress();

    total_size = root.size();
    return root;
}

void SizeAggregator::print_stats(std::ostream& out) const {
    auto duration = std::chrono::steady_clock::now() - start_time;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    const ScanStats& counters = scanner.stats();

    out << "\nScanned " << counters.file_count << " files, "
        << counters.dir_count << " directories, and "
        << counters.other_count << " other entries in " << ms << "ms\n";
    if (counters.io_errors > 0) {
        out << "Encountered " << counters.io_errors << " I/O errors\n";
    }
    out << "Total size: " << format_size(total_size, config.format) << "\n";
}
