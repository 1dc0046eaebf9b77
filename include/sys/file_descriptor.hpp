#ifndef FILE_DESCRIPTOR_HPP
#define FILE_DESCRIPTOR_HPP

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <string>
#include <system_error>
#include <sys/stat.h>

namespace sys {

class FileDescriptor {
private:
    int m_fd = -1;

public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : m_fd(fd) {
        if (m_fd == -1) {
            throw std::system_error(errno, std::system_category(), "Invalid file descriptor");
        }
    }

    FileDescriptor(const std::string& path, int flags, mode_t mode = 0) {
        m_fd = open(path.c_str(), flags, mode);
        if (m_fd == -1) {
            throw std::system_error(errno, std::system_category(),
                "Failed to open file: " + path);
        }
    }

    ~FileDescriptor() {
        if (m_fd != -1) {
            close(m_fd);
        }
    }

    // Prevent copying
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Allow moving
    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.m_fd) {
        other.m_fd = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (m_fd != -1) {
                close(m_fd);
            }
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    int fd() const { return m_fd; }

    bool isValid() const { return m_fd != -1; }

    // Read up to bufferSize bytes, retrying on EINTR. Returns 0 at end of file.
    ssize_t read(void* buffer, size_t bufferSize) {
        ssize_t result;
        do {
            result = ::read(m_fd, buffer, bufferSize);
        } while (result == -1 && errno == EINTR);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to read from file");
        }
        return result;
    }

    // Read until end of file
    std::string readAll() {
        std::string content;
        char buffer[4096];
        for (ssize_t n = read(buffer, sizeof(buffer)); n > 0; n = read(buffer, sizeof(buffer))) {
            content.append(buffer, static_cast<size_t>(n));
        }
        return content;
    }

    // Write the whole buffer, looping over short writes
    void writeAll(const void* buffer, size_t bufferSize) {
        auto cursor = static_cast<const char*>(buffer);
        while (bufferSize > 0) {
            ssize_t result = ::write(m_fd, cursor, bufferSize);
            if (result == -1) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::system_category(), "Failed to write to file");
            }
            cursor += result;
            bufferSize -= static_cast<size_t>(result);
        }
    }
};
}
#endif  // FILE_DESCRIPTOR_HPP
