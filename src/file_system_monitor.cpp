#include "file_system_monitor.hpp"
#include "sys/inotify_handle.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include <spdlog/spdlog.h>

//// from Inotify API documentation
////
/*
       Note that the event queue can overflow.  In this case, events are
       lost.  Robust applications should handle the possibility of lost
       events gracefully.
*/
////
namespace {

constexpr uint32_t WATCH_MASK = IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE | IN_MOVED_TO;

// Upper bound for one poll() so that stop() is noticed without an extra wakeup fd
constexpr std::chrono::milliseconds POLL_SLICE{100};

std::string describe(uint32_t mask) {
    if (mask & IN_Q_OVERFLOW) return "overflow";
    if (mask & IN_CLOSE_WRITE) return "close_write";
    if (mask & IN_MOVED_TO) return "moved_to";
    if (mask & IN_CREATE) return "create";
    if (mask & IN_MODIFY) return "modify";
    return "other";
}

} // namespace

FileSystemMonitor::FileSystemMonitor() : m_inotify(std::make_unique<sys::InotifyHandle>()) {}

FileSystemMonitor::FileSystemMonitor(std::unique_ptr<sys::InotifyHandle> handle) : m_inotify(std::move(handle)) {}

FileSystemMonitor::~FileSystemMonitor() = default;

void FileSystemMonitor::addWatch(const std::string& path) {
    const std::filesystem::path file(path);
    std::string directory = file.parent_path().string();
    if (directory.empty()) {
        directory = ".";
    }

    std::lock_guard lock(m_watch_mutex);
    // inotify returns the same descriptor when a directory is watched twice
    const int wd = m_inotify->addWatch(directory, WATCH_MASK);
    auto& watch = m_watch_descriptors[wd];
    watch.directory = directory;
    watch.files.insert(file.filename().string());
    spdlog::debug("Watching {} (directory {})", path, directory);
}

void FileSystemMonitor::removeWatch(const std::string& path) {
    const std::filesystem::path file(path);
    const std::string name = file.filename().string();

    std::lock_guard lock(m_watch_mutex);
    for (auto it = m_watch_descriptors.begin(); it != m_watch_descriptors.end(); ++it) {
        auto& watch = it->second;
        if (watch.files.erase(name) == 0) {
            continue;
        }
        if (watch.files.empty()) {
            m_inotify->removeWatch(it->first);
            m_watch_descriptors.erase(it);
        }
        return;
    }
}

bool FileSystemMonitor::waitForEvents(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!m_stopped) {
        if (!empty()) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        if (m_inotify->waitReadable(std::min(remaining, POLL_SLICE))) {
            readPending();
        }
    }
    return false;
}

void FileSystemMonitor::readPending() {
    for (const auto& raw : m_inotify->readEvents()) {
        std::vector<std::string> paths;
        {
            std::lock_guard lock(m_watch_mutex);
            if (raw.mask & IN_Q_OVERFLOW) {
                // events were lost; report every watched file as changed
                spdlog::warn("inotify queue overflow, treating watched files as changed");
                for (const auto& [wd, watch] : m_watch_descriptors) {
                    for (const auto& name : watch.files) {
                        paths.push_back(watch.directory + "/" + name);
                    }
                }
            } else {
                auto it = m_watch_descriptors.find(raw.wd);
                if (it != m_watch_descriptors.end() && it->second.files.count(raw.name) != 0) {
                    paths.push_back(it->second.directory + "/" + raw.name);
                }
            }
        }
        for (auto& path : paths) {
            pushEvent({std::move(path), describe(raw.mask), std::chrono::system_clock::now(), raw.mask});
        }
    }
}

void FileSystemMonitor::pushEvent(FSEvent event) {
    const std::string path = event.path;
    {
        std::lock_guard lock(m_queue_mutex);
        m_event_queue.push(std::move(event));
    }
    if (m_callback) {
        m_callback(path);
    }
}

std::optional<FileSystemMonitor::FSEvent> FileSystemMonitor::getNextEvent() {
    std::lock_guard lock(m_queue_mutex);
    if (m_event_queue.empty()) {
        return std::nullopt;
    }
    FSEvent event = std::move(m_event_queue.front());
    m_event_queue.pop();
    return event;
}

void FileSystemMonitor::stop() {
    m_stopped = true;
}

void FileSystemMonitor::setCallback(std::function<void(const std::string&)> cb) {
    m_callback = std::move(cb);
}

bool FileSystemMonitor::empty() {
    std::lock_guard lock(m_queue_mutex);
    return m_event_queue.empty();
}
