#ifndef FILE_SYSTEM_MONITOR_HPP
#define FILE_SYSTEM_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>

namespace sys {
class InotifyHandle;
}

/// Watches individual files for changes using the inotify API.
///
/// Editors and Pi-hole itself replace files by rename, so the monitor watches
/// the parent directory and reports events whose name matches a watched file.
class FileSystemMonitor {
public:
    /// @brief A structure to hold file system event information
    struct FSEvent {
        std::string path;
        std::string action;
        std::chrono::system_clock::time_point timestamp;
        uint32_t mask;
    };

    FileSystemMonitor();
    virtual ~FileSystemMonitor();
    FileSystemMonitor(const FileSystemMonitor&) = delete;
    FileSystemMonitor& operator=(const FileSystemMonitor&) = delete;
    FileSystemMonitor(FileSystemMonitor&&) = delete;
    FileSystemMonitor& operator=(FileSystemMonitor&&) = delete;

    /// @brief  Add a watch for a file
    /// @param path  file to watch; its parent directory must exist
    virtual void addWatch(const std::string& path);

    /// @brief Remove a watch from the file system monitor
    /// @param path
    virtual void removeWatch(const std::string& path);

    /// @brief Wait until at least one event is queued
    /// @return false on timeout or after stop()
    virtual bool waitForEvents(std::chrono::milliseconds timeout);

    /// @brief  Get the next file system event
    /// @return std::nullopt when the queue is empty
    virtual std::optional<FSEvent> getNextEvent();

    /// @brief Stop the file system monitor. Pending waits return promptly.
    virtual void stop();

    /// @brief Set the callback function to be called when a file system event occurs
    /// @param cb receives the path of the changed file
    void setCallback(std::function<void(const std::string&)> cb);

    virtual bool empty();

    bool stopped() const { return m_stopped.load(); }

protected:
    /// For subclasses that do not talk to the kernel
    explicit FileSystemMonitor(std::unique_ptr<sys::InotifyHandle> handle);

    void pushEvent(FSEvent event);

    std::function<void(const std::string&)> m_callback;
    std::queue<FSEvent> m_event_queue;
    std::mutex m_queue_mutex;
    std::atomic<bool> m_stopped{false};

private:
    struct DirectoryWatch {
        std::string directory;
        std::set<std::string> files;
    };

    void readPending();

    std::unique_ptr<sys::InotifyHandle> m_inotify;
    std::unordered_map<int, DirectoryWatch> m_watch_descriptors;
    std::mutex m_watch_mutex;
};

#endif //FILE_SYSTEM_MONITOR_HPP
