#include "util/pipe_reader.hpp"

#include <algorithm>

namespace util {

kj::Promise<void> PipeReader::ReadAll() {
  return stream_->tryRead(buffer_, 1, kBufferSize)
      .then([this](size_t amount) -> kj::Promise<void> {
        if (amount == 0) return kj::READY_NOW;
        size_t room = limit_ > data_.size() ? limit_ - data_.size() : 0;
        size_t keep = std::min(room, amount);
        data_.append(reinterpret_cast<const char*>(buffer_), keep);  // NOLINT
        if (keep < amount) truncated_ = true;
        return ReadAll();
      });
}

}  // namespace util
