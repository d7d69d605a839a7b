#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {

/**
 * Unix domain socket server speaking length-prefixed frames.
 *
 * Each frame is a 4-byte big-endian length followed by that many bytes.
 * A connection has at most one request in flight: the socket is re-armed
 * only after its response has been written, so responses on one connection
 * come back in request order while separate connections run concurrently.
 */
class IpcServer {
public:
    /// Returns the response frame body, or nothing when the request needs no answer.
    using RequestHandler = std::function<std::optional<std::string>(const std::string& request_bytes)>;

    static constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

    /**
     * @param socket_path Path to the Unix domain socket
     * @param handler Request handler, called from worker threads
     * @param thread_pool_size Number of worker threads (0 is treated as 1)
     */
    IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size = 4);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    /// Binds, listens and starts the event thread; returns false if the socket cannot be set up.
    bool start();

    void stop();

    bool is_running() const { return running_.load(); }

    const std::string& socket_path() const { return socket_path_; }

private:
    struct ClientTask {
        int client_fd;
        std::string request_data;
    };

    std::string socket_path_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    // Thread pool members
    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool pool_running_ = false;

    std::set<int> client_fds_;
    std::mutex client_fds_mutex_;

    bool setup_socket();
    void accept_loop();
    void accept_client();
    void worker_thread_func();
    bool read_request(int client_fd, std::string& request_data);
    bool send_response(int client_fd, const std::string& response);
    void handle_request(const ClientTask& task);
    void rearm(int client_fd);
    void close_client(int client_fd);
};

} // namespace toolbridge
