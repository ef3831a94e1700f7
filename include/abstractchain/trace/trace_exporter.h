// abstractchain/trace/trace_exporter.h
#ifndef ABSTRACTCHAIN_TRACE_TRACE_EXPORTER_H
#define ABSTRACTCHAIN_TRACE_TRACE_EXPORTER_H

#include "common/types.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace abstractchain {

struct TraceRecord {
    Placeholder placeholder;
    std::string function_name;
    std::vector<Value> arguments;                 // resolved arguments
    uint64_t dispatch_seq = 0;
    std::optional<uint64_t> completion_seq;       // unset while running
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;                           // "running", "done", "failed"
    std::optional<std::string> error;
};

// One record per dispatched node. Dispatch and completion share a single
// sequence counter, so `dep.completion_seq < node.dispatch_seq` holds for every
// dependency edge. Not thread-safe: only the executor's coordinator writes.
class TraceExporter {
public:
    uint64_t on_dispatch(const DependencyNode& node);
    uint64_t on_complete(const DependencyNode& node);

    const std::vector<TraceRecord>& get_traces() const { return traces_; }
    const TraceRecord* find(const Placeholder& placeholder) const;
    void clear_traces();

    nlohmann::json to_json() const { return to_json(traces_); }
    static nlohmann::json to_json(const std::vector<TraceRecord>& traces);

private:
    std::vector<TraceRecord> traces_;
    uint64_t next_seq_ = 1;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_TRACE_TRACE_EXPORTER_H
