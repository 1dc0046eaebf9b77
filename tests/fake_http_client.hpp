#ifndef FAKE_HTTP_CLIENT_HPP
#define FAKE_HTTP_CLIENT_HPP

#include "http_client.hpp"
#include "sync_errors.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Scripted stand-in for a set of Pi-hole instances. Responses are keyed by
// host and "METHOD target"; several responses for the same key are served in
// order and the last one repeats. Unscripted requests get a 404.
class FakeHttpClient : public http::Client {
public:
    struct Recorded {
        http::Endpoint endpoint;
        http::Request request;

        std::string key() const { return std::string(http::methodName(request.method)) + " " + request.target; }
    };

    http::Response send(const http::Endpoint& endpoint, const http::Request& request) override {
        std::function<void(const http::Endpoint&, const http::Request&)> hook;
        Scripted scripted;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back({endpoint, request});
            hook = m_onRequest;
            scripted = next(endpoint.host, std::string(http::methodName(request.method)) + " " + request.target);
        }
        if (hook) {
            hook(endpoint, request);
        }
        if (scripted.error) {
            throw TransportError(*scripted.error);
        }
        return scripted.response;
    }

    void on(const std::string& host, const std::string& key, int status, const std::string& body = {}) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[host][key].push_back(Scripted{http::Response{status, body}, std::nullopt});
    }

    void fail(const std::string& host, const std::string& key, const std::string& message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[host][key].push_back(Scripted{http::Response{}, message});
    }

    // Successful login, logout and readiness probe for one host
    void acceptLogin(const std::string& host) {
        on(host, "POST /api/auth", 200,
           R"({"session":{"valid":true,"sid":"sid-)" + host + R"(","validity":1800}})");
        on(host, "DELETE /api/auth", 204);
        on(host, "GET /api/auth", 401, R"({"session":{"valid":false}})");
    }

    void onRequest(std::function<void(const http::Endpoint&, const http::Request&)> hook) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onRequest = std::move(hook);
    }

    std::vector<Recorded> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    std::vector<Recorded> requests(const std::string& host, const std::string& key) const {
        std::vector<Recorded> matching;
        for (const auto& recorded : requests()) {
            if (recorded.endpoint.host == host && recorded.key() == key) {
                matching.push_back(recorded);
            }
        }
        return matching;
    }

    std::size_t count(const std::string& host, const std::string& key) const {
        return requests(host, key).size();
    }

    void clearRequests() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.clear();
    }

private:
    struct Scripted {
        http::Response response;
        std::optional<std::string> error;
    };

    Scripted next(const std::string& host, const std::string& key) {
        auto hostIt = m_scripts.find(host);
        if (hostIt == m_scripts.end()) {
            return Scripted{http::Response{404, R"({"error":{"key":"not_found","message":"Not found"}})"}, std::nullopt};
        }
        auto keyIt = hostIt->second.find(key);
        if (keyIt == hostIt->second.end() || keyIt->second.empty()) {
            return Scripted{http::Response{404, R"({"error":{"key":"not_found","message":"Not found"}})"}, std::nullopt};
        }
        auto& queue = keyIt->second;
        Scripted scripted = queue.front();
        if (queue.size() > 1) {
            queue.pop_front();
        }
        return scripted;
    }

    mutable std::mutex m_mutex;
    std::map<std::string, std::map<std::string, std::deque<Scripted>>> m_scripts;
    std::vector<Recorded> m_requests;
    std::function<void(const http::Endpoint&, const http::Request&)> m_onRequest;
};

#endif // FAKE_HTTP_CLIENT_HPP
