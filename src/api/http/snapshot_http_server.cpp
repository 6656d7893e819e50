#include "snapshot_http_server.hpp"
#include "snapshot_json.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/server_logs.hpp"
#include "utils/time_utils.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <thread>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

using FtseTracker::Logging::ServerLogs;

namespace FtseTracker {
namespace API {

namespace {

const char* const SNAPSHOT_PATH = "/api/ftse";
const char* const HEALTH_PATH = "/health";
const char* const ROOT_PATH = "/";
const char* const API_PREFIX = "/api/";

bool is_api_path(const std::string& path) {
    return path.compare(0, std::char_traits<char>::length(API_PREFIX), API_PREFIX) == 0;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

} // anonymous namespace

SnapshotHttpServer::SnapshotHttpServer(const ServerConfig& server_config, Core::SnapshotCoordinator& coordinator_ref,
                                       ConnectivityManager& connectivity_mgr, const TimeProvider& time_provider_ref,
                                       std::atomic<bool>& running_flag)
    : config(server_config), coordinator(coordinator_ref), connectivity_manager(connectivity_mgr),
      time_provider(time_provider_ref), running(running_flag) {}

// ========================================================================
// SESSIONS
// ========================================================================

struct SnapshotHttpServer::Session {
    asio::io_context ioc;
    beast::tcp_stream stream;
    std::thread worker;
    std::atomic<bool> finished{false};

    Session() : stream(ioc) {}
    ~Session() {
        if (worker.joinable()) {
            worker.join();
        }
    }
};

void SnapshotHttpServer::run() {
    Logging::set_log_thread_tag("SERVER");

    asio::io_context ioc;
    tcp::endpoint endpoint(asio::ip::make_address(config.bind_address), static_cast<unsigned short>(config.port));
    tcp::acceptor acceptor(ioc);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
    acceptor.non_blocking(true);

    listening_port.store(acceptor.local_endpoint().port());
    ServerLogs::log_server_listening(config, listening_port.load());

    const std::chrono::milliseconds poll_interval(config.accept_poll_interval_milliseconds);
    const std::size_t session_limit = static_cast<std::size_t>(config.max_concurrent_sessions);
    std::vector<std::unique_ptr<Session>> sessions;
    std::unique_ptr<Session> pending_session;

    while (running.load()) {
        reap_finished_sessions(sessions);
        active_sessions.store(sessions.size());

        if (!pending_session) {
            pending_session = std::make_unique<Session>();
        }

        // The session socket lives on the session's own io_context
        beast::error_code ec;
        acceptor.accept(pending_session->stream.socket(), ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(poll_interval);
            continue;
        }
        if (ec) {
            ServerLogs::log_session_exception("accept: " + ec.message());
            continue;
        }

        if (sessions.size() >= session_limit) {
            ServerLogs::log_session_rejected(sessions.size());
            pending_session.reset();
            continue;
        }

        Session& session = *pending_session;
        session.worker = std::thread(&SnapshotHttpServer::serve_session, this, std::ref(session));
        sessions.push_back(std::move(pending_session));
        active_sessions.store(sessions.size());
    }

    // Sessions see the same flag and cancel their pending I/O
    std::size_t joined_sessions = sessions.size();
    sessions.clear();
    active_sessions.store(0);

    ServerLogs::log_server_stopped(requests_served.load(), joined_sessions);
}

void SnapshotHttpServer::serve_session(Session& session) {
    Logging::set_log_thread_tag("SESSN");

    const std::chrono::seconds deadline(config.session_timeout_seconds);
    const std::chrono::milliseconds poll_interval(config.accept_poll_interval_milliseconds);

    beast::flat_buffer buffer;
    Request request;
    Response response;
    beast::error_code session_error;

    try {
        session.stream.expires_after(deadline);
        http::async_read(session.stream, buffer, request,
            [this, &session, &request, &response, &session_error, deadline](beast::error_code read_error, std::size_t) {
                if (read_error) {
                    session_error = read_error;
                    return;
                }
                response = handle_request(request);
                response.keep_alive(false);

                session.stream.expires_after(deadline);
                http::async_write(session.stream, response,
                    [&session_error](beast::error_code write_error, std::size_t) {
                        session_error = write_error;
                    });
            });

        // run_for in slices so shutdown does not wait out the deadline
        bool cancelled = false;
        while (!session.ioc.stopped()) {
            session.ioc.run_for(poll_interval);
            if (!cancelled && !running.load()) {
                session.stream.cancel();
                cancelled = true;
            }
        }

        if (!session_error) {
            beast::error_code shutdown_ec;
            session.stream.socket().shutdown(tcp::socket::shutdown_send, shutdown_ec);
        } else if (session_error != asio::error::operation_aborted && session_error != http::error::end_of_stream) {
            // Timeout, malformed request or client gone
            ServerLogs::log_session_exception(session_error.message());
        }
    } catch (const std::exception& session_exception_error) {
        ServerLogs::log_session_exception(session_exception_error.what());
    }

    session.finished.store(true);
}

void SnapshotHttpServer::reap_finished_sessions(std::vector<std::unique_ptr<Session>>& sessions) {
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const std::unique_ptr<Session>& session) { return session->finished.load(); }),
                   sessions.end());
}

SnapshotHttpServer::Response SnapshotHttpServer::handle_request(const Request& request) {
    requests_served.fetch_add(1);

    std::string target(request.target().data(), request.target().size());
    std::string path = extract_path(target);

    Response response;
    if (request.method() == http::verb::options && is_api_path(path)) {
        response = Response(http::status::no_content, request.version());
        response.set(http::field::access_control_allow_methods, "GET, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
        apply_cors_headers(response);
        response.prepare_payload();
    } else if (path != SNAPSHOT_PATH && path != HEALTH_PATH && path != ROOT_PATH) {
        json not_found_json = {{"error", "Not found"}, {"path", path}};
        response = make_json_response(request, http::status::not_found, not_found_json.dump());
    } else if (request.method() != http::verb::get) {
        json method_json = {{"error", "Method not allowed"}};
        response = make_json_response(request, http::status::method_not_allowed, method_json.dump());
        response.set(http::field::allow, "GET");
    } else if (path == SNAPSHOT_PATH) {
        response = handle_snapshot(request, target);
    } else if (path == HEALTH_PATH) {
        response = handle_health(request);
    } else {
        response = handle_root(request);
    }

    if (is_api_path(path)) {
        apply_cors_headers(response);
    }

    ServerLogs::log_request(std::string(request.method_string().data(), request.method_string().size()),
                            target, response.result_int());
    return response;
}

SnapshotHttpServer::Response SnapshotHttpServer::handle_snapshot(const Request& request, const std::string& target) {
    auto request_time = time_provider.now();
    try {
        std::map<std::string, std::string> query = parse_query(target);
        std::map<std::string, std::string>::const_iterator refresh_iterator = query.find("refresh");
        bool force_refresh = refresh_iterator != query.end() && to_lower(refresh_iterator->second) == "true";

        Core::Snapshot snapshot = coordinator.get_current_for_request(force_refresh);

        json snapshot_json = snapshot_to_json(snapshot);
        snapshot_json["request_time"] = TimeUtils::to_epoch_seconds(request_time);
        snapshot_json["server_time"] = TimeUtils::format_human_readable_local(request_time);
        return make_json_response(request, http::status::ok, snapshot_json.dump());
    } catch (const std::exception& handler_exception_error) {
        ServerLogs::log_handler_exception(target, handler_exception_error.what());
        json error_json = {
            {"error", handler_exception_error.what()},
            {"timestamp", TimeUtils::to_epoch_seconds(request_time)},
            {"server_time", TimeUtils::format_human_readable_local(request_time)}
        };
        return make_json_response(request, http::status::internal_server_error, error_json.dump());
    }
}

SnapshotHttpServer::Response SnapshotHttpServer::handle_health(const Request& request) {
    json health_json = {
        {"status", "healthy"},
        {"timestamp", TimeUtils::to_epoch_seconds(time_provider.now())},
        {"connectivity", connectivity_manager.get_status_string()}
    };
    return make_json_response(request, http::status::ok, health_json.dump());
}

SnapshotHttpServer::Response SnapshotHttpServer::handle_root(const Request& request) {
    json root_json = {{"status", "ok"}, {"message", "FTSE tracker is running"}};
    return make_json_response(request, http::status::ok, root_json.dump());
}

SnapshotHttpServer::Response SnapshotHttpServer::make_json_response(const Request& request, http::status status,
                                                                    const std::string& body) const {
    Response response(status, request.version());
    response.set(http::field::server, "ftse-tracker");
    response.set(http::field::content_type, "application/json; charset=utf-8");
    response.set(http::field::cache_control, "no-cache");
    response.body() = body;
    response.prepare_payload();
    return response;
}

void SnapshotHttpServer::apply_cors_headers(Response& response) const {
    response.set(http::field::access_control_allow_origin, config.cors_allowed_origin);
}

std::string SnapshotHttpServer::extract_path(const std::string& target) {
    size_t query_position = target.find('?');
    std::string path = query_position == std::string::npos ? target : target.substr(0, query_position);
    return path.empty() ? std::string(ROOT_PATH) : path;
}

std::map<std::string, std::string> SnapshotHttpServer::parse_query(const std::string& target) {
    std::map<std::string, std::string> query;
    size_t query_position = target.find('?');
    if (query_position == std::string::npos) {
        return query;
    }

    std::string query_string = target.substr(query_position + 1);
    size_t segment_start = 0;
    while (segment_start <= query_string.size()) {
        size_t segment_end = query_string.find('&', segment_start);
        if (segment_end == std::string::npos) {
            segment_end = query_string.size();
        }
        std::string segment = query_string.substr(segment_start, segment_end - segment_start);
        if (!segment.empty()) {
            size_t equals_position = segment.find('=');
            std::string key = equals_position == std::string::npos ? segment : segment.substr(0, equals_position);
            std::string value = equals_position == std::string::npos ? std::string() : segment.substr(equals_position + 1);
            // First occurrence wins
            query.emplace(key, value);
        }
        segment_start = segment_end + 1;
    }
    return query;
}

} // namespace API
} // namespace FtseTracker
