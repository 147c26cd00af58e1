#include <spdlog/spdlog.h>
#include <map>
#include <system_error>
#include <vector>
#include <dlinkwm/common/file_watcher.h>

namespace dlinkwm::common {

namespace fs = std::filesystem;

namespace {

struct FileStamp {
    fs::file_time_type mtime{};
    std::uintmax_t size{0};

    bool operator==(const FileStamp& other) const {
        return mtime == other.mtime && size == other.size;
    }
};

using Snapshot = std::map<fs::path, FileStamp>;

bool stampOf(const fs::path& p, FileStamp& out) {
    std::error_code ec;
    auto mtime = fs::last_write_time(p, ec);
    if (ec)
        return false;
    auto size = fs::file_size(p, ec);
    if (ec)
        return false;
    out = FileStamp{mtime, size};
    return true;
}

// Returns an error when the watched location itself is gone, which ends the loop.
Result<Snapshot> scan(const PollingFileWatcher::Options& opts, bool targetIsDir) {
    Snapshot snap;
    std::error_code ec;

    if (!targetIsDir) {
        auto parent = opts.target.parent_path();
        if (!parent.empty() && !fs::is_directory(parent, ec)) {
            return Error{ErrorCode::IoError,
                         "Watched directory no longer exists: " + parent.string()};
        }
        if (fs::is_regular_file(opts.target, ec)) {
            FileStamp st;
            if (stampOf(opts.target, st))
                snap.emplace(opts.target, st);
        }
        return snap;
    }

    if (!fs::is_directory(opts.target, ec)) {
        return Error{ErrorCode::IoError,
                     "Watched directory no longer exists: " + opts.target.string()};
    }

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code fec;
        if (!entry.is_regular_file(fec))
            return;
        if (opts.filter && !opts.filter(entry.path()))
            return;
        FileStamp st;
        if (stampOf(entry.path(), st))
            snap.emplace(entry.path(), st);
    };

    if (opts.recursive) {
        fs::recursive_directory_iterator it(
            opts.target, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot scan " + opts.target.string() + ": " + ec.message()};
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                // Entry vanished mid-scan; the next pass picks up the new state
                ec.clear();
                break;
            }
            consider(*it);
        }
    } else {
        fs::directory_iterator it(opts.target, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot scan " + opts.target.string() + ": " + ec.message()};
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                ec.clear();
                break;
            }
            consider(*it);
        }
    }
    return snap;
}

std::vector<FileEvent> diff(const Snapshot& before, const Snapshot& after) {
    std::vector<FileEvent> events;
    auto a = before.begin();
    auto b = after.begin();
    while (a != before.end() || b != after.end()) {
        if (b == after.end() || (a != before.end() && a->first < b->first)) {
            events.push_back({FileEventKind::Removed, a->first});
            ++a;
        } else if (a == before.end() || b->first < a->first) {
            events.push_back({FileEventKind::Created, b->first});
            ++b;
        } else {
            if (!(a->second == b->second)) {
                events.push_back({FileEventKind::Modified, b->first});
            }
            ++a;
            ++b;
        }
    }
    return events;
}

} // namespace

WatchHandle::~WatchHandle() {
    stop();
    join();
}

void WatchHandle::stop() {
    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        state_->stopRequested = true;
    }
    state_->cv.notify_all();
}

void WatchHandle::join() {
    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

Result<std::unique_ptr<WatchHandle>> PollingFileWatcher::start(Options options,
                                                               Callback callback) {
    if (!callback) {
        return Error{ErrorCode::InvalidArgument, "Watcher callback must not be empty"};
    }
    if (options.target.empty()) {
        return Error{ErrorCode::InvalidArgument, "Watcher target must not be empty"};
    }
    if (options.interval.count() <= 0) {
        options.interval = std::chrono::milliseconds(1);
    }

    std::error_code ec;
    const bool targetIsDir = fs::is_directory(options.target, ec);
    if (!targetIsDir) {
        if (fs::exists(options.target, ec) && !fs::is_regular_file(options.target, ec)) {
            return Error{ErrorCode::IoError,
                         "Watch target is neither a directory nor a regular file: " +
                             options.target.string()};
        }
        auto parent = options.target.parent_path();
        if (!parent.empty() && !fs::is_directory(parent, ec)) {
            return Error{ErrorCode::IoError,
                         "Cannot watch " + options.target.string() + ": directory " +
                             parent.string() + " does not exist"};
        }
    }

    auto baseline = scan(options, targetIsDir);
    if (!baseline) {
        return baseline.error();
    }

    std::unique_ptr<WatchHandle> handle(new WatchHandle(options.name));
    auto state = handle->state_;
    state->running.store(true, std::memory_order_release);
    handle->thread_ = std::thread([state, opts = std::move(options), cb = std::move(callback), targetIsDir,
                              snap = std::move(baseline).value()]() mutable {
        spdlog::debug("[{}] watching {}", opts.name, opts.target.string());
        while (true) {
            {
                std::unique_lock<std::mutex> lk(state->mutex);
                if (state->cv.wait_for(lk, opts.interval,
                                       [&state] { return state->stopRequested; })) {
                    break;
                }
            }
            auto next = scan(opts, targetIsDir);
            if (!next) {
                spdlog::warn("[{}] stopping: {}", opts.name, next.error().message);
                break;
            }
            for (const auto& ev : diff(snap, next.value())) {
                if (state->stopping()) {
                    break;
                }
                try {
                    cb(ev);
                } catch (const std::exception& e) {
                    spdlog::error("[{}] handler failed for {} ({}): {}", opts.name,
                                  ev.path.string(), fileEventKindName(ev.kind), e.what());
                }
            }
            snap = std::move(next).value();
            state->scans.fetch_add(1, std::memory_order_acq_rel);
        }
        state->running.store(false, std::memory_order_release);
        spdlog::debug("[{}] watch loop exited", opts.name);
    });
    return std::move(handle);
}

} // namespace dlinkwm::common
