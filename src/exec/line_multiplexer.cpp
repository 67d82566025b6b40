#include "codebox/exec/line_multiplexer.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace codebox::exec {

void LineSplitter::feed(std::string_view chunk, const std::function<void(std::string)>& emit) {
    size_t start = 0;
    while (true) {
        size_t newline = chunk.find('\n', start);
        if (newline == std::string_view::npos) {
            pending_.append(chunk.substr(start));
            return;
        }

        pending_.append(chunk.substr(start, newline - start));
        if (!pending_.empty() && pending_.back() == '\r') {
            pending_.pop_back();
        }
        emit(std::move(pending_));
        pending_.clear();
        start = newline + 1;
    }
}

std::optional<std::string> LineSplitter::finish() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string last = std::move(pending_);
    pending_.clear();
    if (!last.empty() && last.back() == '\r') {
        last.pop_back();
    }
    return last;
}

namespace {

// Bounded multi-producer, single-consumer queue of lines
class LineChannel {
public:
    LineChannel(size_t capacity, int producers)
        : capacity_(capacity == 0 ? 1 : capacity)
        , open_producers_(producers)
    {
    }

    // Returns false once the consumer has cancelled
    bool push(OutputLine line) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return cancelled_ || queue_.size() < capacity_;
        });
        if (cancelled_) {
            return false;
        }
        queue_.push_back(std::move(line));
        not_empty_.notify_one();
        return true;
    }

    // Empty once every producer has closed and the queue is drained
    std::optional<OutputLine> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return !queue_.empty() || open_producers_ == 0;
        });
        if (queue_.empty()) {
            return std::nullopt;
        }
        OutputLine line = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return line;
    }

    void close_producer() {
        std::lock_guard<std::mutex> lock(mutex_);
        --open_producers_;
        not_empty_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        queue_.clear();
        not_full_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<OutputLine> queue_;
    size_t capacity_;
    int open_producers_;
    bool cancelled_ = false;
};

void pump_lines(InputStream& stream, OutputSource source, LineChannel& channel) {
    struct ProducerGuard {
        LineChannel& channel;
        ~ProducerGuard() { channel.close_producer(); }
    } guard{channel};

    LineSplitter splitter;
    std::array<char, 4096> buffer;
    bool delivering = true;

    // After a cancel the stream is still read to the end so the child never
    // blocks on a full pipe
    auto emit = [&](std::string text) {
        if (delivering) {
            delivering = channel.push(OutputLine{source, std::move(text)});
        }
    };

    try {
        while (true) {
            auto n = stream.read(buffer.data(), buffer.size());
            if (n.is_err()) {
                spdlog::warn("{} reader stopped: {}",
                             output_source_to_string(source), n.error().full_message());
                return;
            }
            if (n.value() == 0) {
                if (auto last = splitter.finish()) {
                    emit(std::move(*last));
                }
                return;
            }
            splitter.feed(std::string_view(buffer.data(), n.value()), emit);
        }
    } catch (const std::exception& e) {
        spdlog::error("{} reader failed: {}", output_source_to_string(source), e.what());
    }
}

}  // namespace

LineMultiplexer::LineMultiplexer(size_t capacity)
    : capacity_(capacity)
{
}

void LineMultiplexer::run(InputStream& stdout_stream, InputStream& stderr_stream,
                          const LineSink& sink) {
    LineChannel channel(capacity_, 2);

    std::thread stdout_reader(pump_lines, std::ref(stdout_stream),
                              OutputSource::Stdout, std::ref(channel));
    std::thread stderr_reader;
    try {
        stderr_reader = std::thread(pump_lines, std::ref(stderr_stream),
                                    OutputSource::Stderr, std::ref(channel));
    } catch (const std::system_error&) {
        channel.cancel();
        stdout_reader.join();
        throw;
    }

    std::exception_ptr sink_error;
    while (auto line = channel.pop()) {
        try {
            sink(*line);
        } catch (...) {
            sink_error = std::current_exception();
            channel.cancel();
            break;
        }
    }

    stdout_reader.join();
    stderr_reader.join();

    if (sink_error) {
        std::rethrow_exception(sink_error);
    }
}

}  // namespace codebox::exec
