#pragma once

#include <cstdio>

#include "sinks/result_record.hpp"

namespace triage::sinks {

// One human-readable line per record. Points at stderr by default so the
// lines never interleave with CSV or JSON written to stdout.
class DebugSink {
 public:
  explicit DebugSink(std::FILE* stream = stderr) noexcept : stream_(stream) {}

  void publish(const ResultRecord& record) const;

 private:
  std::FILE* stream_;
};

}  // namespace triage::sinks
