#pragma once

#include "input_stream.hpp"
#include "output_line.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace codebox::exec {

// Incremental '\n' splitter. A trailing '\r' is dropped from each line and
// a final line without a newline is returned by finish().
class LineSplitter {
public:
    void feed(std::string_view chunk, const std::function<void(std::string)>& emit);
    std::optional<std::string> finish();

private:
    std::string pending_;
};

// Merges the stdout and stderr streams of a process into one sink.
//
// One reader thread per stream splits its input into lines and pushes them
// into a bounded queue; the thread calling run() drains the queue and is the
// only caller of the sink. Lines of one stream keep their order. Lines of
// different streams interleave in whatever order the readers queue them,
// so callers must not rely on stdout/stderr ordering.
class LineMultiplexer {
public:
    static constexpr size_t kDefaultCapacity = 256;

    explicit LineMultiplexer(size_t capacity = kDefaultCapacity);

    // Blocks until both streams have ended (or failed) and every queued line
    // has been delivered. If the sink throws, the remaining output is
    // drained and discarded and the exception is rethrown once both readers
    // have finished.
    void run(InputStream& stdout_stream, InputStream& stderr_stream, const LineSink& sink);

private:
    size_t capacity_;
};

}  // namespace codebox::exec
