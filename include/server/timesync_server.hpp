#pragma once

#include "server/timesync_api.hpp"

#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace wolfcache {

/**
 * @brief HTTP front end for the time-sync tracker
 *
 * Routes:
 *   GET  /health
 *   GET  /stats
 *   POST /sync
 *   GET  /sync/status
 *   GET  /sync/status/{service}
 *   POST /sync/compare
 *   GET  /sync/latest
 *   POST /sync/register/{service}
 *   POST /sync/disconnect/{service}
 *
 * All bodies are JSON; CORS is open to any origin. POST routes are rate
 * limited per remote address when the API has a RateLimiter.
 */
class TimeSyncServer {
public:
    TimeSyncServer(std::shared_ptr<TimeSyncApi> api,
                   std::string host = "0.0.0.0",
                   int port = 8900,
                   size_t thread_pool_size = 4);
    ~TimeSyncServer();

    /// Blocks until stop() is called. Throws if the port cannot be bound.
    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

private:
    void register_routes(httplib::Server& svr);

    static void send(const TimeSyncApi::Response& result, httplib::Response& res);

    // Writes a 429 and returns true if the caller is over its rate limit
    bool reject_over_limit(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<TimeSyncApi> api_;
    std::string host_;
    int port_;
    size_t thread_pool_size_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
};

} // namespace wolfcache
