#include "server/timesync_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <exception>
#include <format>
#include <stdexcept>

namespace wolfcache {

TimeSyncServer::TimeSyncServer(std::shared_ptr<TimeSyncApi> api,
                               std::string host,
                               int port,
                               size_t thread_pool_size)
    : api_(std::move(api))
    , host_(std::move(host))
    , port_(port)
    , thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 1)
    , server_(std::make_unique<httplib::Server>()) {}

TimeSyncServer::~TimeSyncServer() {
    stop();
}

void TimeSyncServer::send(const TimeSyncApi::Response& result, httplib::Response& res) {
    res.status = result.status;
    res.set_content(result.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    http::kJsonContentType);
}

bool TimeSyncServer::reject_over_limit(const httplib::Request& req, httplib::Response& res) {
    auto rejection = api_->admit(req.remote_addr);
    if (!rejection) return false;
    send(*rejection, res);
    return true;
}

void TimeSyncServer::start() {
    auto& svr = *server_;

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "*"}
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, what));
        res.status = http::kInternalError;
        res.set_content(R"({"error":"internal error"})", http::kJsonContentType);
    });

    register_routes(svr);

    utils::log::info(std::format("Starting Time Sync Server on {}:{} ({} threads)",
        host_, port_, thread_pool_size_));

    running_.store(true);
    if (!svr.listen(host_, port_)) {
        running_.store(false);
        throw std::runtime_error(std::format("Failed to bind {}:{}", host_, port_));
    }
    running_.store(false);
}

void TimeSyncServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
        utils::log::info("Time Sync Server stopped");
    }
}

// ============================================================================
// Route registration
// ============================================================================

void TimeSyncServer::register_routes(httplib::Server& svr) {
    svr.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(api_->health(), res);
    });

    svr.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        send(api_->stats(), res);
    });

    svr.Post("/sync", [this](const httplib::Request& req, httplib::Response& res) {
        if (reject_over_limit(req, res)) return;
        send(api_->sync(req.body), res);
    });

    svr.Get("/sync/status", [this](const httplib::Request&, httplib::Response& res) {
        send(api_->all_statuses(), res);
    });

    svr.Get(R"(/sync/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(api_->status(req.matches[1].str()), res);
    });

    svr.Post("/sync/compare", [this](const httplib::Request& req, httplib::Response& res) {
        if (reject_over_limit(req, res)) return;
        send(api_->compare(req.body), res);
    });

    svr.Get("/sync/latest", [this](const httplib::Request&, httplib::Response& res) {
        send(api_->latest(), res);
    });

    svr.Post(R"(/sync/register/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (reject_over_limit(req, res)) return;
        send(api_->register_service(req.matches[1].str()), res);
    });

    svr.Post(R"(/sync/disconnect/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (reject_over_limit(req, res)) return;
        send(api_->disconnect(req.matches[1].str()), res);
    });
}

} // namespace wolfcache
