#ifndef CONTENT_DIGEST_HPP
#define CONTENT_DIGEST_HPP

#include <mutex>
#include <string>
#include <unordered_map>

#include <json/json.h>

namespace digest {

/// SHA-256 of a byte buffer, lowercase hex
std::string sha256(const std::string& data);

/// SHA-256 of the canonical (compact, key-sorted) JSON rendering
std::string ofJson(const Json::Value& value);

} // namespace digest

/// Remembers the last content digest pushed to each secondary so that an
/// unchanged backup or config tree is not re-applied. In memory only.
class DigestTracker {
public:
    /// @brief Check whether a digest differs from the one last recorded
    /// @param key  instance label plus the kind of content, e.g. "pi2:443/config"
    /// @return true when nothing was recorded yet or the digest differs
    bool hasChanged(const std::string& key, const std::string& digest) const;

    void update(const std::string& key, const std::string& digest);

private:
    std::unordered_map<std::string, std::string> m_digests;
    mutable std::mutex m_mutex;
};

#endif // CONTENT_DIGEST_HPP
