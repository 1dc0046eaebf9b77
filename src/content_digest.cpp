#include "content_digest.hpp"
#include "json_codec.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace digest {

std::string sha256(const std::string& data) {
    SHA256_CTX sha256Context;
    SHA256_Init(&sha256Context);
    SHA256_Update(&sha256Context, data.data(), data.size());

    unsigned char result[SHA256_DIGEST_LENGTH];
    SHA256_Final(result, &sha256Context);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::setw(2) << static_cast<int>(result[i]);
    }
    return ss.str();
}

std::string ofJson(const Json::Value& value) {
    return sha256(json::write(value));
}

} // namespace digest

bool DigestTracker::hasChanged(const std::string& key, const std::string& digest) const {
    std::lock_guard lock(m_mutex);
    auto it = m_digests.find(key);
    return it == m_digests.end() || it->second != digest;
}

void DigestTracker::update(const std::string& key, const std::string& digest) {
    std::lock_guard lock(m_mutex);
    m_digests[key] = digest;
}
