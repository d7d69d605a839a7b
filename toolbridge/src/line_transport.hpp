#pragma once

#include "protocol.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {

/**
 * Line-delimited JSON transport over a pair of streams (stdin/stdout in production).
 *
 * One JSON envelope per input line, one response per output line, flushed
 * immediately. Undecodable lines are logged and skipped. With worker_count > 0
 * requests are dispatched on a pool while the reader keeps reading; responses
 * are still written in the order their requests arrived.
 */
class LineTransport {
public:
    using DispatchFn = std::function<std::optional<Response>(const Request&)>;

    LineTransport(std::istream& in, std::ostream& out, DispatchFn dispatch, size_t worker_count = 0);
    ~LineTransport();

    LineTransport(const LineTransport&) = delete;
    LineTransport& operator=(const LineTransport&) = delete;

    /// Serves until EOF on the input stream and all accepted requests are answered.
    void run();

    size_t responses_written() const { return responses_written_.load(); }
    size_t lines_dropped() const { return lines_dropped_.load(); }

private:
    struct Task {
        Request request;
        std::promise<std::optional<Response>> promise;
    };

    std::optional<Request> decode(const std::string& line);
    std::optional<Response> dispatch_safely(const Request& request);
    void write_response(const Response& response);

    void run_inline();
    void run_pooled();
    void worker_thread_func();
    void writer_thread_func();

    std::istream& in_;
    std::ostream& out_;
    DispatchFn dispatch_;
    size_t worker_count_;

    std::atomic<size_t> responses_written_{0};
    std::atomic<size_t> lines_dropped_{0};

    // Worker pool
    std::vector<std::thread> worker_threads_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool pool_running_ = false;

    // Responses in arrival order
    std::thread writer_thread_;
    std::deque<std::future<std::optional<Response>>> pending_;
    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    bool input_done_ = false;
};

} // namespace toolbridge
