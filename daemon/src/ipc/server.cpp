/**
 * @file server.cpp
 * @brief Unix socket IPC server implementation
 */

#include "dailyd/ipc/server.h"
#include "dailyd/logger.h"
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

namespace dailyd {

IPCServer::IPCServer(const std::string& socket_path, int backlog, int timeout_ms)
    : socket_path_(socket_path)
    , backlog_(backlog)
    , timeout_ms_(timeout_ms) {
}

IPCServer::~IPCServer() {
    stop();
}

bool IPCServer::start() {
    if (running_) {
        return true;
    }

    if (!create_socket()) {
        return false;
    }

    running_ = true;
    accept_thread_ = std::make_unique<std::thread>([this] { accept_loop(); });

    LOG_INFO("IPCServer", "Started on " + socket_path_);
    return true;
}

void IPCServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Unblock accept() and refuse new connections
    if (server_fd_ != -1) {
        shutdown(server_fd_, SHUT_RDWR);
    }

    if (accept_thread_ && accept_thread_->joinable()) {
        accept_thread_->join();
    }

    // Client threads reference this object; wait for them
    {
        std::unique_lock<std::mutex> lock(connections_mutex_);
        const auto drain_started = std::chrono::steady_clock::now();
        while (!connections_cv_.wait_for(lock, std::chrono::seconds(DRAIN_LOG_INTERVAL_SEC), [this] {
            return active_connections_.load() == 0;
        })) {
            auto waited = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - drain_started);
            LOG_INFO("IPCServer", "Waiting for " + std::to_string(active_connections_.load()) +
                     " in-flight requests (" + std::to_string(waited.count()) + "s)");
        }
    }

    cleanup_socket();
    LOG_INFO("IPCServer", "Stopped");
}

bool IPCServer::is_healthy() const {
    return running_.load() && server_fd_ != -1;
}

void IPCServer::register_handler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[method] = std::move(handler);
    LOG_DEBUG("IPCServer", "Registered handler for: " + method);
}

void IPCServer::set_admission(AdmissionCheck check) {
    std::lock_guard<std::mutex> lock(admission_mutex_);
    admission_ = std::move(check);
}

bool IPCServer::create_socket() {
    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ == -1) {
        LOG_ERROR("IPCServer", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(socket_path_, ec)) {
        std::filesystem::remove(socket_path_, ec);
        LOG_DEBUG("IPCServer", "Removed existing socket file");
    }

    auto parent = std::filesystem::path(socket_path_).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("IPCServer", "Cannot create " + parent.string() + ": " + ec.message());
            close(server_fd_);
            server_fd_ = -1;
            return false;
        }
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (socket_path_.size() > sizeof(addr.sun_path) - 1) {
        LOG_ERROR("IPCServer", "Socket path too long: " + socket_path_ + " (max " +
                  std::to_string(sizeof(addr.sun_path) - 1) + " bytes)");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("IPCServer", "Failed to bind socket: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, backlog_) == -1) {
        LOG_ERROR("IPCServer", "Failed to listen: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return setup_permissions();
}

bool IPCServer::setup_permissions() {
    // Local-only socket; per-caller limits apply instead of file permissions
    if (chmod(socket_path_.c_str(), 0666) == -1) {
        LOG_WARN("IPCServer", "Failed to set socket permissions: " + std::string(strerror(errno)));
    }
    return true;
}

void IPCServer::cleanup_socket() {
    if (server_fd_ != -1) {
        close(server_fd_);
        server_fd_ = -1;
    }

    std::error_code ec;
    if (std::filesystem::exists(socket_path_, ec)) {
        std::filesystem::remove(socket_path_, ec);
    }
}

void IPCServer::accept_loop() {
    LOG_DEBUG("IPCServer", "Accept loop started");

    while (running_) {
        int client_fd = accept(server_fd_, nullptr, nullptr);

        if (client_fd == -1) {
            if (running_) {
                LOG_ERROR("IPCServer", "Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        struct timeval timeout;
        timeout.tv_sec = timeout_ms_ / 1000;
        timeout.tv_usec = (timeout_ms_ % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_++;
            connections_served_++;
        }

        try {
            std::thread([this, client_fd] { handle_client(client_fd); }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("IPCServer", "Cannot spawn client thread: " + std::string(e.what()));
            close(client_fd);
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                active_connections_--;
            }
            connections_cv_.notify_all();
        }
    }

    LOG_DEBUG("IPCServer", "Accept loop ended");
}

void IPCServer::handle_client(int client_fd) {
    try {
        std::string buffer(MAX_MESSAGE_SIZE, '\0');
        ssize_t bytes = recv(client_fd, &buffer[0], buffer.size() - 1, 0);

        if (bytes <= 0) {
            LOG_DEBUG("IPCServer", "Client disconnected without data");
        } else {
            buffer.resize(static_cast<size_t>(bytes));
            LOG_DEBUG("IPCServer", "Received: " + buffer);

            auto request = Request::parse(buffer);
            Response response;
            if (!request) {
                response = Response::err("Invalid request format", ErrorCodes::PARSE_ERROR);
            } else {
                request->caller = caller_key(client_fd);
                response = dispatch(*request);
            }

            std::string response_str = response.to_json();
            LOG_DEBUG("IPCServer", "Sending: " + response_str);
            if (send(client_fd, response_str.c_str(), response_str.length(), MSG_NOSIGNAL) == -1) {
                // Caller went away; any generation it started still publishes
                LOG_DEBUG("IPCServer", "Failed to send response: " + std::string(strerror(errno)));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("IPCServer", "Exception handling client: " + std::string(e.what()));
        std::string response_str = Response::err(e.what(), ErrorCodes::INTERNAL_ERROR).to_json();
        if (send(client_fd, response_str.c_str(), response_str.length(), MSG_NOSIGNAL) == -1) {
            LOG_DEBUG("IPCServer", "Failed to send error response: " + std::string(strerror(errno)));
        }
    }

    close(client_fd);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        active_connections_--;
    }
    connections_cv_.notify_all();
}

std::string IPCServer::caller_key(int client_fd) {
    struct ucred cred;
    socklen_t len = sizeof(cred);
    if (getsockopt(client_fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) == 0) {
        return "uid:" + std::to_string(cred.uid);
    }
    return "uid:unknown";
}

Response IPCServer::dispatch(const Request& request) {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(request.method);
        if (it == handlers_.end()) {
            LOG_WARN("IPCServer", "Unknown method: " + request.method);
            return Response::err("Method not found: " + request.method, ErrorCodes::METHOD_NOT_FOUND);
        }
        handler = it->second;
    }

    if (request.method != Methods::PING && request.method != Methods::VERSION) {
        AdmissionCheck admission;
        {
            std::lock_guard<std::mutex> lock(admission_mutex_);
            admission = admission_;
        }
        if (admission) {
            Admission verdict = admission(request.caller);
            if (!verdict.allowed) {
                LOG_WARN("IPCServer", "Rate limit exceeded for " + request.caller);
                return Response::err("Rate limit exceeded", ErrorCodes::RATE_LIMITED,
                                     {{"retry_after", verdict.retry_after.count()}});
            }
        }
    }

    try {
        return handler(request);
    } catch (const std::exception& e) {
        LOG_ERROR("IPCServer", "Handler error for " + request.method + ": " + e.what());
        return Response::err(e.what(), ErrorCodes::INTERNAL_ERROR);
    }
}

} // namespace dailyd
