#ifndef TELEPORTER_TRANSPORT_HPP
#define TELEPORTER_TRANSPORT_HPP

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "session_manager.hpp"

/// Opaque teleporter archive (zip) as exported by main
struct BackupBlob {
    std::string data;

    bool empty() const { return data.empty(); }
    /// SHA-256 hex of the archive bytes
    std::string digest() const;
};

struct ImportResult {
    std::vector<std::string> processedFiles;
};

/// Whole-configuration transfer through `/api/teleporter`. No filtering.
class TeleporterTransport {
public:
    /// @param cacheLocation directory receiving a copy of every exported archive,
    ///                      empty to disable the cache
    explicit TeleporterTransport(std::string cacheLocation = {});

    /// @throws TransportError on a failed request or an empty archive
    BackupBlob exportBackup(const Session& mainSession) const;

    /// @brief Restore an archive onto a secondary
    /// @param importOptions forwarded as the `import` form field when present
    /// @throws TransportError on an empty blob (before any request) or a non-2xx answer
    ImportResult importBackup(const Session& secondarySession,
                              const BackupBlob& blob,
                              const std::optional<Json::Value>& importOptions) const;

    /// Path of the cached archive, empty when caching is disabled
    std::string cachePath() const;

private:
    void writeCache(const BackupBlob& blob) const;

    std::string m_cacheLocation;
};

#endif // TELEPORTER_TRANSPORT_HPP
