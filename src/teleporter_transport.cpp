#include "teleporter_transport.hpp"
#include "content_digest.hpp"
#include "json_codec.hpp"
#include "sync_errors.hpp"
#include "sys/file_descriptor.hpp"

#include <spdlog/spdlog.h>

#include <random>
#include <sstream>

namespace {

constexpr const char* BACKUP_FILE_NAME = "pihole_backup.zip";
constexpr std::size_t ERROR_EXCERPT_LENGTH = 200;

std::string excerpt(const std::string& body) {
    if (body.size() <= ERROR_EXCERPT_LENGTH) {
        return body;
    }
    return body.substr(0, ERROR_EXCERPT_LENGTH) + "...";
}

std::string makeBoundary() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream boundary;
    boundary << "----pihole-sync-" << std::hex << generator() << generator();
    return boundary.str();
}

void appendField(std::string& body, const std::string& boundary, const std::string& name, const std::string& value) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value + "\r\n";
}

} // namespace

std::string BackupBlob::digest() const {
    return digest::sha256(data);
}

TeleporterTransport::TeleporterTransport(std::string cacheLocation) : m_cacheLocation(std::move(cacheLocation)) {}

std::string TeleporterTransport::cachePath() const {
    if (m_cacheLocation.empty()) {
        return {};
    }
    return m_cacheLocation + "/" + BACKUP_FILE_NAME;
}

BackupBlob TeleporterTransport::exportBackup(const Session& mainSession) const {
    http::Request request;
    request.method = http::Method::GET;
    request.target = "/api/teleporter";
    request.headers["Accept"] = "application/zip";

    const auto response = mainSession.send(request);
    if (!response.ok()) {
        throw TransportError("[" + mainSession.label() + "] teleporter export failed with HTTP " +
                             std::to_string(response.status) + ": " + excerpt(response.body),
                             response.status);
    }
    if (response.body.empty()) {
        throw TransportError("[" + mainSession.label() + "] teleporter export returned an empty backup archive",
                             response.status);
    }

    BackupBlob blob{response.body};
    spdlog::info("[{}] downloaded backup archive ({} bytes)", mainSession.label(), blob.data.size());
    writeCache(blob);
    return blob;
}

ImportResult TeleporterTransport::importBackup(const Session& secondarySession,
                                               const BackupBlob& blob,
                                               const std::optional<Json::Value>& importOptions) const {
    if (blob.empty()) {
        throw TransportError("[" + secondarySession.label() + "] refusing to import an empty backup archive");
    }

    const std::string boundary = makeBoundary();
    std::string body;
    appendField(body, boundary, "resourceName", BACKUP_FILE_NAME);
    body += "--" + boundary + "\r\n";
    body += std::string("Content-Disposition: form-data; name=\"file\"; filename=\"") + BACKUP_FILE_NAME + "\"\r\n";
    body += "Content-Type: application/zip\r\n\r\n";
    body += blob.data;
    body += "\r\n";
    if (importOptions) {
        appendField(body, boundary, "import", json::write(*importOptions));
    }
    body += "--" + boundary + "--\r\n";

    http::Request request;
    request.method = http::Method::POST;
    request.target = "/api/teleporter";
    request.contentType = "multipart/form-data; boundary=" + boundary;
    request.body = std::move(body);

    const auto response = secondarySession.send(request);
    if (!response.ok()) {
        throw TransportError("[" + secondarySession.label() + "] teleporter import failed with HTTP " +
                             std::to_string(response.status) + ": " + excerpt(response.body),
                             response.status);
    }

    ImportResult result;
    Json::Value parsed;
    try {
        parsed = json::parse(response.body, "[" + secondarySession.label() + "] POST /api/teleporter");
    } catch (const TransportError& e) {
        spdlog::warn("[{}] import returned HTTP {} without a JSON body, assuming success: {}",
                     secondarySession.label(), response.status, e.what());
    }
    if (parsed.isObject() && parsed["files"].isArray()) {
        for (const auto& file : parsed["files"]) {
            if (file.isString()) {
                result.processedFiles.push_back(file.asString());
            }
        }
    }

    spdlog::info("[{}] backup imported, {} files processed", secondarySession.label(), result.processedFiles.size());
    for (const auto& file : result.processedFiles) {
        spdlog::debug("[{}]   {}", secondarySession.label(), file);
    }
    return result;
}

void TeleporterTransport::writeCache(const BackupBlob& blob) const {
    const std::string path = cachePath();
    if (path.empty()) {
        return;
    }

    // The cache is informational; a sync does not depend on it.
    try {
        sys::FileDescriptor file(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        file.writeAll(blob.data.data(), blob.data.size());
        spdlog::debug("Cached backup archive at {}", path);
    } catch (const std::system_error& e) {
        spdlog::warn("Could not cache backup archive at {}: {}", path, e.what());
    }
}
