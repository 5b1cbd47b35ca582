// FrameFlowTypes.hpp
//
// Shared value types for the frame graph: frame indices and ranges, the error
// taxonomy, and the (node, frame) task identity with its execution result.
#pragma once
#include <stdexcept>
#include <string>
#include <tuple>
#include <cstddef>

namespace FrameFlow {

// Signed so that window arithmetic can express indices before clamping.
using FrameIndex = long long;

// Half-open range [begin, end)
struct FrameRange {
    FrameIndex begin = 0;
    FrameIndex end = 0;

    bool empty() const { return end <= begin; }
    FrameIndex size() const { return empty() ? 0 : end - begin; }
    bool contains(FrameIndex f) const { return f >= begin && f < end; }
    bool operator==(const FrameRange& o) const { return begin == o.begin && end == o.end; }
    bool operator!=(const FrameRange& o) const { return !(*this == o); }
};

enum class ErrorCode {
    None,
    CycleDetected,
    OutOfRange,
    MissingInput,
    TransformFailed,
    InvalidGraph,
    InvalidConfig
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::CycleDetected: return "CycleDetected";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::MissingInput: return "MissingInput";
        case ErrorCode::TransformFailed: return "TransformFailed";
        case ErrorCode::InvalidGraph: return "InvalidGraph";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

class FlowError : public std::runtime_error {
public:
    FlowError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}
    ErrorCode code() const { return errorCode; }

private:
    ErrorCode errorCode;
};

// One unit of work: a node (by graph index) and one of its output frames
struct TaskKey {
    size_t node = 0;
    FrameIndex frame = 0;

    bool operator<(const TaskKey& o) const { return std::tie(node, frame) < std::tie(o.node, o.frame); }
    bool operator==(const TaskKey& o) const { return node == o.node && frame == o.frame; }
    bool operator!=(const TaskKey& o) const { return !(*this == o); }
};

struct TaskResult {
    TaskKey key;
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    std::string outputPath;

    static TaskResult success(TaskKey key, std::string path) {
        TaskResult r;
        r.key = key;
        r.ok = true;
        r.outputPath = std::move(path);
        return r;
    }
    static TaskResult failure(TaskKey key, ErrorCode code, std::string message) {
        TaskResult r;
        r.key = key;
        r.error = code;
        r.message = std::move(message);
        return r;
    }
};

} // namespace FrameFlow
