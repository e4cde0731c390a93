#ifndef UTIL_PIPE_READER_HPP
#define UTIL_PIPE_READER_HPP

#include <kj/async-io.h>
#include <string>

namespace util {

// Drains an asynchronous stream into memory, keeping at most limit bytes.
// Whatever was read stays available after the promise returned by ReadAll is
// cancelled, so partial output survives a timeout.
class PipeReader {
 public:
  PipeReader(kj::Own<kj::AsyncInputStream> stream, size_t limit)
      : stream_(kj::mv(stream)), limit_(limit) {}

  // Reads until EOF. Bytes over the limit are read and dropped so the writer
  // never blocks on a full pipe.
  kj::Promise<void> ReadAll() KJ_WARN_UNUSED_RESULT;

  const std::string& Data() const { return data_; }
  bool Truncated() const { return truncated_; }

  KJ_DISALLOW_COPY(PipeReader);

 private:
  static const constexpr size_t kBufferSize = 64 * 1024;

  kj::Own<kj::AsyncInputStream> stream_;
  size_t limit_;
  std::string data_;
  bool truncated_ = false;
  kj::byte buffer_[kBufferSize];
};

}  // namespace util

#endif
