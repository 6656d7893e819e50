#ifndef SNAPSHOT_HTTP_SERVER_HPP
#define SNAPSHOT_HTTP_SERVER_HPP

#include "configs/server_config.hpp"
#include "tracker/coordinators/snapshot_coordinator.hpp"
#include "utils/connectivity_manager.hpp"
#include "utils/time_provider.hpp"
#include <boost/beast/http.hpp>
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace FtseTracker {
namespace API {

/**
 * SnapshotHttpServer - HTTP/1.1 read endpoint.
 *
 * The acceptor is non-blocking and polled so the loop notices shutdown.
 * Each accepted connection gets its own thread and io_context and carries
 * one request. Reading the request and writing the response each run under
 * the session deadline, so an idle client only ties up its own session.
 * A request that refreshes inline delays only its own client.
 *
 *   GET /api/ftse[?refresh=true]   current snapshot
 *   GET /health                    liveness plus upstream connectivity
 *   GET /                          liveness
 */
class SnapshotHttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    SnapshotHttpServer(const ServerConfig& server_config, Core::SnapshotCoordinator& coordinator,
                       ConnectivityManager& connectivity_mgr, const TimeProvider& time_provider_ref,
                       std::atomic<bool>& running_flag);

    // Blocks until running is cleared and every session has been joined.
    // Bind failures throw.
    void run();

    Response handle_request(const Request& request);

    unsigned long get_requests_served() const { return requests_served.load(); }
    // Bound port once listening (resolves a configured port 0), else 0
    unsigned short get_listening_port() const { return listening_port.load(); }
    std::size_t get_active_session_count() const { return active_sessions.load(); }

    static std::string extract_path(const std::string& target);
    static std::map<std::string, std::string> parse_query(const std::string& target);

private:
    const ServerConfig& config;
    Core::SnapshotCoordinator& coordinator;
    ConnectivityManager& connectivity_manager;
    const TimeProvider& time_provider;
    std::atomic<bool>& running;
    std::atomic<unsigned long> requests_served{0};
    std::atomic<unsigned short> listening_port{0};
    std::atomic<std::size_t> active_sessions{0};

    struct Session;
    void serve_session(Session& session);
    static void reap_finished_sessions(std::vector<std::unique_ptr<Session>>& sessions);

    Response handle_snapshot(const Request& request, const std::string& target);
    Response handle_health(const Request& request);
    Response handle_root(const Request& request);
    Response make_json_response(const Request& request, boost::beast::http::status status, const std::string& body) const;
    void apply_cors_headers(Response& response) const;
};

} // namespace API
} // namespace FtseTracker

#endif // SNAPSHOT_HTTP_SERVER_HPP
