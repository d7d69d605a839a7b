#include "ipc_server.hpp"

#include "logger.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace toolbridge {

namespace {

// Reads exactly len bytes; false on EOF, error or receive timeout.
bool read_exact(int fd, char* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t chunk = ::read(fd, data + offset, len - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

bool write_all(int fd, const char* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t chunk = ::send(fd, data + offset, len - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size)
    : socket_path_(std::move(socket_path)),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 1) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG4CPLUS_ERROR(transport_logger(), "Socket path too long: " << socket_path_);
        return false;
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    ::unlink(socket_path_.c_str());

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "bind " << socket_path_ << ": " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "listen: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "epoll_create1: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "epoll_ctl ADD server_fd: " << std::strerror(errno));
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = true;
    }
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&IpcServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&IpcServer::accept_loop, this);

    LOG4CPLUS_INFO(transport_logger(), "IPC server listening on " << socket_path_ << " with "
                   << thread_pool_size_ << " worker(s)");
    return true;
}

void IpcServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // The event thread notices running_ within one epoll timeout.
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = false;
    }
    queue_cv_.notify_all();
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        for (int fd : client_fds_) {
            ::close(fd);
        }
        client_fds_.clear();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
    LOG4CPLUS_INFO(transport_logger(), "IPC server stopped");
}

bool IpcServer::read_request(int client_fd, std::string& request_data) {
    uint32_t length_be = 0;
    if (!read_exact(client_fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        LOG4CPLUS_WARN(transport_logger(), "Frame of " << length << " bytes exceeds limit, closing connection");
        return false;
    }

    request_data.assign(length, '\0');
    return length == 0 || read_exact(client_fd, &request_data[0], length);
}

bool IpcServer::send_response(int client_fd, const std::string& response) {
    uint32_t resp_len_be = htonl(static_cast<uint32_t>(response.size()));
    if (!write_all(client_fd, reinterpret_cast<const char*>(&resp_len_be), sizeof(resp_len_be))) {
        return false;
    }
    return response.empty() || write_all(client_fd, response.data(), response.size());
}

void IpcServer::handle_request(const ClientTask& task) {
    std::optional<std::string> response;
    try {
        response = handler_(task.request_data);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(transport_logger(), "Request handler error: " << e.what() << ", closing connection");
        close_client(task.client_fd);
        return;
    }

    if (response && !send_response(task.client_fd, *response)) {
        LOG4CPLUS_WARN(transport_logger(), "Failed to write response: " << std::strerror(errno));
        close_client(task.client_fd);
        return;
    }

    rearm(task.client_fd);
}

void IpcServer::rearm(int client_fd) {
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP | EPOLLONESHOT;
    ev.data.fd = client_fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, client_fd, &ev) < 0) {
        LOG4CPLUS_WARN(transport_logger(), "epoll_ctl MOD client_fd: " << std::strerror(errno));
        close_client(client_fd);
    }
}

void IpcServer::close_client(int client_fd) {
    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    if (client_fds_.erase(client_fd) == 0) {
        return;
    }
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);
    ::close(client_fd);
}

void IpcServer::worker_thread_func() {
    for (;;) {
        ClientTask task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        handle_request(task);
    }
}

void IpcServer::accept_client() {
    int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        LOG4CPLUS_WARN(transport_logger(), "accept: " << std::strerror(errno));
        return;
    }

    // A client that stalls mid-frame must not hold up the event thread forever.
    timeval timeout{};
    timeout.tv_sec = 5;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        client_fds_.insert(client_fd);
    }

    epoll_event cli_ev{};
    cli_ev.events = EPOLLIN | EPOLLRDHUP | EPOLLONESHOT;
    cli_ev.data.fd = client_fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cli_ev) < 0) {
        LOG4CPLUS_WARN(transport_logger(), "epoll_ctl ADD client_fd: " << std::strerror(errno));
        close_client(client_fd);
        return;
    }
    LOG4CPLUS_DEBUG(transport_logger(), "Client connected fd=" << client_fd);
}

void IpcServer::accept_loop() {
    // 单线程 epoll 处理所有连接；每个连接同一时间只有一个请求在处理
    // Single epoll thread for all connections; each connection has at most one request in flight
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, 200);
        if (nfds < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_ERROR(transport_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                accept_client();
                continue;
            }

            // Pending data is served before a hangup is acted on.
            if (events[i].events & EPOLLIN) {
                std::string request_data;
                if (!read_request(fd, request_data)) {
                    LOG4CPLUS_DEBUG(transport_logger(), "Client disconnected fd=" << fd);
                    close_client(fd);
                    continue;
                }

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    task_queue_.push({fd, std::move(request_data)});
                }
                queue_cv_.notify_one();
                continue;
            }

            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                LOG4CPLUS_DEBUG(transport_logger(), "Client hung up fd=" << fd);
                close_client(fd);
            }
        }
    }
}

} // namespace toolbridge
