/**
 * @file server.h
 * @brief Unix socket IPC server
 */

#pragma once

#include "dailyd/core/service.h"
#include "dailyd/ipc/protocol.h"
#include "dailyd/ratelimit/rate_limiter.h"
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <unordered_map>

namespace dailyd {

/**
 * @brief Request handler function type
 */
using RequestHandler = std::function<Response(const Request&)>;

/**
 * @brief Decides whether a caller may issue another request
 */
using AdmissionCheck = std::function<Admission(const std::string& caller)>;

/**
 * @brief Unix socket IPC server
 *
 * One request per connection. Each client is served on its own thread so a
 * long generation does not block other callers.
 */
class IPCServer : public Service {
public:
    /**
     * @param socket_path Path to Unix socket
     * @param backlog listen() backlog
     * @param timeout_ms Send/receive timeout per client socket
     */
    explicit IPCServer(const std::string& socket_path,
                       int backlog = SOCKET_BACKLOG,
                       int timeout_ms = SOCKET_TIMEOUT_MS);
    ~IPCServer() override;

    // Service interface
    bool start() override;

    /**
     * @brief Refuse new connections and drain the accepted ones
     *
     * Accepted requests run to completion and receive their response, so
     * this returns only after the slowest one. A generating request is
     * bounded by the generation timeout times (retries + 1) plus backoff; a
     * waiting one by poll_interval times poll_max_attempts. The number still
     * in flight is logged every few seconds meanwhile.
     */
    void stop() override;
    const char* name() const override { return "IPCServer"; }
    int priority() const override { return 100; }  // Start first
    bool is_running() const override { return running_.load(); }
    bool is_healthy() const override;

    /**
     * @brief Register a request handler for a method
     */
    void register_handler(const std::string& method, RequestHandler handler);

    /**
     * @brief Install the rate limit check run before every handler
     *
     * ping and version are never limited.
     */
    void set_admission(AdmissionCheck check);

    size_t connections_served() const { return connections_served_.load(); }
    size_t active_connections() const { return active_connections_.load(); }

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int backlog_;
    int timeout_ms_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> accept_thread_;

    std::unordered_map<std::string, RequestHandler> handlers_;
    std::mutex handlers_mutex_;

    AdmissionCheck admission_;
    std::mutex admission_mutex_;

    std::atomic<size_t> connections_served_{0};
    std::atomic<size_t> active_connections_{0};

    // Condition variable for waiting on in-flight handlers during stop()
    std::condition_variable connections_cv_;
    std::mutex connections_mutex_;

    bool create_socket();
    bool setup_permissions();
    void cleanup_socket();

    void accept_loop();

    /**
     * @brief Handle a single client connection (runs on its own thread)
     */
    void handle_client(int client_fd);

    /**
     * @brief Rate limit key from the kernel-reported peer uid
     *
     * Nothing the client sends goes into the key.
     */
    static std::string caller_key(int client_fd);

    /**
     * @brief Admit, then dispatch request to handler
     */
    Response dispatch(const Request& request);
};

} // namespace dailyd
