// FrameFlow core types
//
// This header defines the frame graph: file-backed streams addressed by frame
// index, the closed set of node kinds that map an output frame onto the input
// frames it needs, and the graph that owns the nodes, validates that the
// stream dependencies are acyclic and derives every stream's valid range.
// Scheduling and execution live in FrameFlowScheduler.hpp.
#pragma once
#include "FrameFlowTypes.hpp"
#include "FrameFlowStore.hpp"
#include "FrameFlowProcess.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace FrameFlow {

using Params = std::map<std::string, std::string>;
using Command = std::vector<std::string>;

// An ordered, file-backed sequence of frames. The path template is an fmt
// format string receiving the frame number (index + offset), e.g.
// "frames/img{0:04}.png". A template without a placeholder addresses the same
// file for every index.
class Stream {
public:
    Stream() = default;
    explicit Stream(std::string pathTemplate,
                    FrameIndex offset = 0,
                    std::shared_ptr<const FrameStore> store = defaultFrameStore());

    // Pure and deterministic; never touches the disk
    std::string pathFor(FrameIndex frame) const;
    bool exists(FrameIndex frame) const;
    // [low, high) of the frames available. Discovered once through the store
    // unless a fixed count was set.
    FrameRange availableRange() const;
    // Discovered frame indices (may contain gaps); [0, count) for fixed streams
    std::vector<FrameIndex> frames() const;

    void setFixedCount(FrameIndex count) { fixedCount = count; }
    FrameIndex count() const { return fixedCount; }
    const std::string& pathTemplate() const { return templ; }
    FrameIndex offset() const { return frameOffset; }
    const FrameStore& store() const { return *frameStore; }

private:
    std::string templ;
    FrameIndex frameOffset = 0;
    std::shared_ptr<const FrameStore> frameStore = defaultFrameStore();
    FrameIndex fixedCount = -1;
    mutable std::optional<std::vector<FrameIndex>> discovered;

    const std::vector<FrameIndex>& discover() const;
};

// How a node treats input frames requested outside a stream's valid range
enum class EdgePolicy { Clamp, Skip, Error };

EdgePolicy parseEdgePolicy(const std::string& name);
const char* edgePolicyName(EdgePolicy policy);

// Node kinds. Each one answers requiredInputs() differently; the scheduler
// never needs to know which one it is looking at.
struct SourceKind {};
struct PassThroughKind {};
struct WindowedKind {
    int width = 3; // odd
};
struct ResampleKind {
    double ratio = 1.0;
    FrameIndex offset = 0;
    FrameIndex length = -1; // -1: derived from the input
};
struct ConcatKind {
    FrameIndex blend = 0;
};
struct FadeKind {
    FrameIndex duration = 24;
    bool fadeIn = false;
    bool blur = false;
};

using NodeKind = std::variant<SourceKind, PassThroughKind, WindowedKind, ResampleKind, ConcatKind, FadeKind>;

// (input slot, frame) pair
struct InputRef {
    size_t input = 0;
    FrameIndex frame = 0;

    bool operator==(const InputRef& o) const { return input == o.input && frame == o.frame; }
};

// What producing one output frame takes: the input frames, the command
// (a key into Node::commands) and per-frame template variables.
struct FrameDemand {
    std::vector<InputRef> inputs;
    std::string command;
    Params vars;
    bool skipped = false;
};

struct Node {
    std::string name;
    std::string type;                // configuration type name, informational
    std::vector<std::string> inputs; // names of the producing nodes
    NodeKind kind = PassThroughKind{};
    Stream output;
    EdgePolicy edgePolicy = EdgePolicy::Error;
    Params params;                   // template values, tool paths included
    std::map<std::string, Command> commands; // "main", "copy", "blend"

    // Derived by Graph::link()
    FrameRange range;
    std::vector<FrameRange> inputRanges;

    bool isSource() const { return std::holds_alternative<SourceKind>(kind); }

    // Pure: the input frames and operation for one output frame. Throws
    // FlowError(OutOfRange) when the edge policy is Error.
    FrameDemand requiredInputs(FrameIndex frame) const;

    // Runs the external command for one frame and commits its output. Blocks
    // until the subprocess exits. The returned key carries the frame only; the
    // caller owns the node's graph index.
    TaskResult execute(FrameIndex frame,
                       const std::vector<std::string>& inputPaths,
                       CommandRunner& runner) const;

    // Expands the command template chosen by `demand`
    Command buildCommand(FrameIndex frame,
                         const FrameDemand& demand,
                         const std::vector<std::string>& inputPaths,
                         const std::string& outputPath) const;

    // Output range implied by the kind and the input ranges
    FrameRange computeRange() const;

private:
    bool resolveEdge(FrameIndex& frame, const FrameRange& valid, const std::string& what) const;
};

class Graph {
public:
    Graph() = default;

    // Inputs may name nodes added later; they are resolved by validate()
    size_t addNode(Node node);
    // Throws FlowError(InvalidGraph) for unknown inputs and
    // FlowError(CycleDetected) naming the cycle, e.g. "A -> B -> A"
    void validate() const;
    // validate(), then derive every stream's range in dependency order
    void link();
    bool linked() const { return isLinked; }

    size_t size() const { return nodes.size(); }
    const Node& node(size_t index) const { return nodes.at(index); }
    Node& node(size_t index) { return nodes.at(index); }
    const Node& node(const std::string& name) const { return nodes.at(indexOf(name)); }
    std::optional<size_t> find(const std::string& name) const;
    size_t indexOf(const std::string& name) const;
    // Graph index of the node feeding input slot `input` of `node`
    size_t inputNode(size_t node, size_t input) const;
    const std::vector<Node>& getNodes() const { return nodes; }

    // Producers before consumers
    std::vector<size_t> topologicalOrder() const;
    // Graphviz description of the stream edges
    std::string toDot() const;

private:
    std::vector<Node> nodes;
    std::unordered_map<std::string, size_t> nodeIndex;
    std::vector<std::vector<size_t>> inputIndices;
    bool isLinked = false;

    std::vector<std::vector<size_t>> resolveInputs() const;
};

} // namespace FrameFlow
