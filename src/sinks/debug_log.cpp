#include "sinks/debug_log.hpp"

namespace triage::sinks {

void DebugSink::publish(const ResultRecord& record) const {
  if (stream_ == nullptr) {
    return;
  }
  std::fprintf(stream_,
               "[score] id=%s hr=%d rr=%d sbp=%d dbp=%d temp=%.1f spo2=%d gcs=%d resources=%d acuity=%.4f level=%d (%s)\n",
               record.id.empty() ? "-" : record.id.c_str(), record.hr, record.rr, record.sbp, record.dbp, record.temp,
               record.spo2, record.gcs, record.resource_count, record.acuity, record.level, record.level_label.c_str());
}

}  // namespace triage::sinks
