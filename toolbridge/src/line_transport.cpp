#include "line_transport.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <istream>
#include <ostream>

#include <log4cplus/loggingmacros.h>

namespace toolbridge {

LineTransport::LineTransport(std::istream& in, std::ostream& out, DispatchFn dispatch, size_t worker_count)
    : in_(in), out_(out), dispatch_(std::move(dispatch)), worker_count_(worker_count) {}

LineTransport::~LineTransport() {
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
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        input_done_ = true;
    }
    pending_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

void LineTransport::run() {
    LOG4CPLUS_INFO(transport_logger(), "Line transport serving"
                   << (worker_count_ > 0 ? " with " + std::to_string(worker_count_) + " worker(s)" : " inline"));
    if (worker_count_ == 0) {
        run_inline();
    } else {
        run_pooled();
    }
    LOG4CPLUS_INFO(transport_logger(), "Input closed after " << responses_written_.load() << " response(s), "
                   << lines_dropped_.load() << " dropped line(s)");
}

std::optional<Request> LineTransport::decode(const std::string& line) {
    try {
        return codec::decode_line(line);
    } catch (const codec::DecodeError& e) {
        ++lines_dropped_;
        LOG4CPLUS_WARN(transport_logger(), "Dropping malformed message: " << e.what());
        return std::nullopt;
    }
}

std::optional<Response> LineTransport::dispatch_safely(const Request& request) {
    try {
        return dispatch_(request);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(transport_logger(), "Dispatch failed for " << request.method_name << ": " << e.what());
        if (!request.has_id) {
            return std::nullopt;
        }
        return make_error(request.id, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    }
}

void LineTransport::write_response(const Response& response) {
    std::string line = codec::encode_line(response);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        LOG4CPLUS_ERROR(transport_logger(), "Failed to write response id=" << response.id.dump());
        return;
    }
    ++responses_written_;
}

void LineTransport::run_inline() {
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto request = decode(line);
        if (!request) {
            continue;
        }
        if (auto response = dispatch_safely(*request)) {
            write_response(*response);
        }
    }
}

void LineTransport::run_pooled() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = true;
    }
    for (size_t i = 0; i < worker_count_; ++i) {
        worker_threads_.emplace_back(&LineTransport::worker_thread_func, this);
    }
    writer_thread_ = std::thread(&LineTransport::writer_thread_func, this);

    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto request = decode(line);
        if (!request) {
            continue;
        }

        Task task{std::move(*request), {}};
        auto future = task.promise.get_future();
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.push_back(std::move(future));
        }
        pending_cv_.notify_one();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            task_queue_.push(std::move(task));
        }
        queue_cv_.notify_one();
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        input_done_ = true;
    }
    pending_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
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
}

void LineTransport::worker_thread_func() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task.promise.set_value(dispatch_safely(task.request));
    }
}

void LineTransport::writer_thread_func() {
    for (;;) {
        std::future<std::optional<Response>> next;
        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            pending_cv_.wait(lock, [this] { return !pending_.empty() || input_done_; });

            if (pending_.empty()) {
                return;
            }

            next = std::move(pending_.front());
            pending_.pop_front();
        }

        // Blocks on the oldest request even when younger ones already finished.
        if (auto response = next.get()) {
            write_response(*response);
        }
    }
}

} // namespace toolbridge
