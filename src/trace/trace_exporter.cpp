// src/trace/trace_exporter.cpp
#include "abstractchain/trace/trace_exporter.h"
#include <algorithm>

namespace abstractchain {

uint64_t TraceExporter::on_dispatch(const DependencyNode& node) {
    TraceRecord record;
    record.placeholder = node.id;
    record.function_name = node.function_name;
    record.arguments = node.resolved_args;
    record.dispatch_seq = next_seq_++;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running";

    traces_.push_back(std::move(record));
    return traces_.back().dispatch_seq;
}

uint64_t TraceExporter::on_complete(const DependencyNode& node) {
    uint64_t seq = next_seq_++;
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&node](const TraceRecord& r) { return r.placeholder == node.id && r.status == "running"; });
    if (it != traces_.rend()) {
        it->completion_seq = seq;
        it->end_time = std::chrono::system_clock::now();
        it->status = node.status == NodeStatus::DONE ? "done" : "failed";
        if (node.status == NodeStatus::FAILED) {
            it->error = node.error;
        }
    }
    return seq;
}

const TraceRecord* TraceExporter::find(const Placeholder& placeholder) const {
    for (const auto& record : traces_) {
        if (record.placeholder == placeholder) return &record;
    }
    return nullptr;
}

void TraceExporter::clear_traces() {
    traces_.clear();
    next_seq_ = 1;
}

nlohmann::json TraceExporter::to_json(const std::vector<TraceRecord>& traces) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& record : traces) {
        nlohmann::json obj;
        obj["placeholder"] = record.placeholder;
        obj["function"] = record.function_name;
        obj["arguments"] = record.arguments;
        obj["dispatch_seq"] = record.dispatch_seq;
        obj["completion_seq"] = record.completion_seq ? nlohmann::json(*record.completion_seq) : nlohmann::json(nullptr);
        obj["status"] = record.status;
        if (record.completion_seq) {
            obj["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                record.end_time - record.start_time).count();
        }
        if (record.error) {
            obj["error"] = *record.error;
        }
        arr.push_back(std::move(obj));
    }
    return arr;
}

} // namespace abstractchain
