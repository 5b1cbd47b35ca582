// FrameFlowCore.cpp
//
// Implements streams, the per-kind frame mapping of nodes, per-frame command
// execution, and graph validation/linking.
#include "FrameFlowCore.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <functional>

namespace FrameFlow {

// ---------------------------------------------------------------------------
// Stream

Stream::Stream(std::string pathTemplate, FrameIndex offset, std::shared_ptr<const FrameStore> store)
    : templ(std::move(pathTemplate)), frameOffset(offset), frameStore(std::move(store)) {
    if (!frameStore) frameStore = defaultFrameStore();
}

std::string Stream::pathFor(FrameIndex frame) const {
    const FrameIndex number = frame + frameOffset;
    try {
        return fmt::vformat(templ, fmt::make_format_args(number));
    } catch (const fmt::format_error& e) {
        throw FlowError(ErrorCode::InvalidConfig, "bad path template '" + templ + "': " + e.what());
    }
}

bool Stream::exists(FrameIndex frame) const {
    return frameStore->exists(pathFor(frame));
}

const std::vector<FrameIndex>& Stream::discover() const {
    if (!discovered) discovered = frameStore->listFrames(*this);
    return *discovered;
}

FrameRange Stream::availableRange() const {
    if (fixedCount >= 0) return {0, fixedCount};
    const auto& found = discover();
    if (found.empty()) return {};
    return {found.front(), found.back() + 1};
}

std::vector<FrameIndex> Stream::frames() const {
    if (fixedCount >= 0) {
        std::vector<FrameIndex> all(static_cast<size_t>(fixedCount));
        for (FrameIndex i = 0; i < fixedCount; ++i) all[static_cast<size_t>(i)] = i;
        return all;
    }
    return discover();
}

// ---------------------------------------------------------------------------
// Edge policy

EdgePolicy parseEdgePolicy(const std::string& name) {
    if (name == "clamp") return EdgePolicy::Clamp;
    if (name == "skip") return EdgePolicy::Skip;
    if (name == "error") return EdgePolicy::Error;
    throw FlowError(ErrorCode::InvalidConfig, "unknown edge policy '" + name + "' (clamp|skip|error)");
}

const char* edgePolicyName(EdgePolicy policy) {
    switch (policy) {
        case EdgePolicy::Clamp: return "clamp";
        case EdgePolicy::Skip: return "skip";
        case EdgePolicy::Error: return "error";
    }
    return "error";
}

// ---------------------------------------------------------------------------
// Node

// Returns false when the frame has to be dropped (skip policy)
bool Node::resolveEdge(FrameIndex& frame, const FrameRange& valid, const std::string& what) const {
    if (valid.contains(frame)) return true;
    switch (edgePolicy) {
        case EdgePolicy::Clamp:
            if (valid.empty()) break;
            frame = std::clamp(frame, valid.begin, valid.end - 1);
            return true;
        case EdgePolicy::Skip:
            return false;
        case EdgePolicy::Error:
            break;
    }
    throw FlowError(ErrorCode::OutOfRange,
                    fmt::format("{}: frame {} of {} outside [{}, {})", name, frame, what, valid.begin, valid.end));
}

FrameDemand Node::requiredInputs(FrameIndex frame) const {
    FrameDemand demand;
    if (isSource()) return demand;

    if (inputRanges.size() != inputs.size() || inputs.empty()) {
        throw FlowError(ErrorCode::InvalidGraph, "node '" + name + "' has no linked inputs");
    }

    // The node's own range first; clamping moves the requested frame itself
    FrameIndex f = frame;
    if (!resolveEdge(f, range, "output")) {
        demand.skipped = true;
        return demand;
    }
    auto inputLabel = [&](size_t i) { return "input '" + inputs[i] + "'"; };

    if (std::holds_alternative<PassThroughKind>(kind) || std::holds_alternative<FadeKind>(kind)) {
        for (size_t i = 0; i < inputs.size(); ++i) {
            FrameIndex g = f;
            if (!resolveEdge(g, inputRanges[i], inputLabel(i))) {
                demand.skipped = true;
                demand.inputs.clear();
                return demand;
            }
            demand.inputs.push_back({i, g});
        }
        demand.command = "main";
        if (const auto* fade = std::get_if<FadeKind>(&kind)) {
            const FrameIndex length = inputRanges[0].size();
            const FrameIndex pos = f - inputRanges[0].begin;
            const FrameIndex start = fade->fadeIn ? 0 : length - fade->duration;
            const bool ramping = fade->fadeIn ? pos < fade->duration : pos >= start;
            if (!ramping || fade->duration <= 0) {
                demand.command = "copy";
            } else {
                const FrameIndex progress = (pos - start) * 100 / fade->duration;
                const FrameIndex brightness = fade->fadeIn ? progress : 100 - progress;
                const FrameIndex blurAmount = fade->fadeIn ? 100 - progress : progress;
                demand.vars["progress"] = std::to_string(progress);
                demand.vars["brightness"] = std::to_string(brightness);
                demand.vars["blurRadius"] = std::to_string(fade->blur ? blurAmount * 16 / 100 : 0);
            }
        }
    } else if (const auto* win = std::get_if<WindowedKind>(&kind)) {
        const FrameIndex half = win->width / 2;
        for (FrameIndex k = -half; k <= half; ++k) {
            FrameIndex g = f + k;
            if (resolveEdge(g, inputRanges[0], inputLabel(0))) demand.inputs.push_back({0, g});
        }
        if (demand.inputs.empty()) {
            demand.skipped = true;
            return demand;
        }
        demand.command = "main";
    } else if (const auto* rs = std::get_if<ResampleKind>(&kind)) {
        FrameIndex g = static_cast<FrameIndex>(std::floor(static_cast<double>(f) * rs->ratio)) + rs->offset;
        if (!resolveEdge(g, inputRanges[0], inputLabel(0))) {
            demand.skipped = true;
            return demand;
        }
        demand.inputs.push_back({0, g});
        demand.command = "main";
    } else if (const auto* cat = std::get_if<ConcatKind>(&kind)) {
        // Segment i starts where segment i-1 ends minus the blend overlap
        FrameIndex start = 0;
        FrameIndex previousStart = 0;
        for (size_t i = 0; i < inputs.size(); ++i) {
            const FrameIndex length = inputRanges[i].size();
            const bool last = i + 1 == inputs.size();
            const FrameIndex next = start + length - cat->blend;
            if (f < (last ? start + length : next)) {
                const FrameIndex local = f - start;
                if (i > 0 && local < cat->blend) {
                    const FrameIndex left = inputRanges[i - 1].begin + (f - previousStart);
                    const FrameIndex right = inputRanges[i].begin + local;
                    const double in = static_cast<double>(local) / static_cast<double>(cat->blend);
                    const double blurFactor = 1.0 - std::abs(in - 0.5) * 2.0;
                    demand.inputs.push_back({i - 1, left});
                    demand.inputs.push_back({i, right});
                    demand.command = "blend";
                    demand.vars["blendPercent"] = std::to_string(static_cast<int>(in * 100.0));
                    demand.vars["blurRadius"] = std::to_string(static_cast<int>(blurFactor * 16.0));
                } else {
                    demand.inputs.push_back({i, inputRanges[i].begin + local});
                    demand.command = "copy";
                }
                return demand;
            }
            previousStart = start;
            start = next;
        }
        throw FlowError(ErrorCode::OutOfRange, fmt::format("{}: frame {} past the end of the concatenation", name, f));
    }
    return demand;
}

FrameRange Node::computeRange() const {
    if (isSource()) return output.availableRange();
    if (inputRanges.empty()) return {};

    if (const auto* rs = std::get_if<ResampleKind>(&kind)) {
        if (rs->length >= 0) return {0, rs->length};
        const FrameIndex span = inputRanges[0].end - rs->offset;
        if (span <= 0 || rs->ratio <= 0.0) return {};
        return {0, static_cast<FrameIndex>(std::ceil(static_cast<double>(span) / rs->ratio))};
    }
    if (const auto* cat = std::get_if<ConcatKind>(&kind)) {
        FrameIndex total = 0;
        for (const auto& r : inputRanges) total += r.size();
        total -= cat->blend * static_cast<FrameIndex>(inputRanges.size() - 1);
        return {0, std::max<FrameIndex>(total, 0)};
    }
    // Pass-through, fade, windowed: frames present on every input
    FrameRange r = inputRanges.front();
    for (const auto& in : inputRanges) {
        r.begin = std::max(r.begin, in.begin);
        r.end = std::min(r.end, in.end);
    }
    if (r.empty()) return {};
    return r;
}

Command Node::buildCommand(FrameIndex frame,
                           const FrameDemand& demand,
                           const std::vector<std::string>& inputPaths,
                           const std::string& outputPath) const {
    auto cmdIt = commands.find(demand.command);
    if (cmdIt == commands.end() || cmdIt->second.empty()) {
        throw FlowError(ErrorCode::InvalidConfig, "node '" + name + "' has no '" + demand.command + "' command");
    }

    auto lookup = [&](const std::string& key, std::string& out) -> bool {
        if (key == "output") { out = outputPath; return true; }
        if (key == "frame") { out = std::to_string(frame); return true; }
        if (key.rfind("input", 0) == 0 && key != "inputs") {
            size_t slot = 0;
            if (key.size() > 5) {
                if (!std::all_of(key.begin() + 5, key.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) return false;
                slot = static_cast<size_t>(std::stoul(key.substr(5)));
            }
            if (slot >= inputPaths.size()) {
                throw FlowError(ErrorCode::InvalidConfig,
                                fmt::format("node '{}': command uses {{{}}} but the frame has {} input(s)", name, key, inputPaths.size()));
            }
            out = inputPaths[slot];
            return true;
        }
        auto v = demand.vars.find(key);
        if (v != demand.vars.end()) { out = v->second; return true; }
        auto p = params.find(key);
        if (p != params.end()) { out = p->second; return true; }
        return false;
    };
    auto isKeyChar = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };

    Command argv;
    for (const auto& arg : cmdIt->second) {
        if (arg == "{inputs}") {
            argv.insert(argv.end(), inputPaths.begin(), inputPaths.end());
            continue;
        }
        std::string expanded;
        size_t pos = 0;
        while (pos < arg.size()) {
            const size_t open = arg.find('{', pos);
            if (open == std::string::npos) { expanded.append(arg, pos, std::string::npos); break; }
            const size_t close = arg.find('}', open + 1);
            const std::string key = close == std::string::npos ? std::string() : arg.substr(open + 1, close - open - 1);
            if (key.empty() || !std::all_of(key.begin(), key.end(), isKeyChar)) {
                // Not a placeholder, keep the brace literally
                expanded.append(arg, pos, open - pos + 1);
                pos = open + 1;
                continue;
            }
            std::string value;
            if (!lookup(key, value)) {
                throw FlowError(ErrorCode::InvalidConfig,
                                fmt::format("node '{}': unknown placeholder {{{}}} in command", name, key));
            }
            expanded.append(arg, pos, open - pos);
            expanded += value;
            pos = close + 1;
        }
        argv.push_back(std::move(expanded));
    }
    return argv;
}

TaskResult Node::execute(FrameIndex frame, const std::vector<std::string>& inputPaths, CommandRunner& runner) const {
    const TaskKey key{0, frame};
    const FrameStore& store = output.store();
    std::string temporary;
    try {
        const std::string finalPath = output.pathFor(frame);
        if (isSource()) {
            if (output.exists(frame)) return TaskResult::success(key, finalPath);
            return TaskResult::failure(key, ErrorCode::MissingInput, "source frame missing: " + finalPath);
        }

        const FrameDemand demand = requiredInputs(frame);
        if (demand.skipped) {
            return TaskResult::failure(key, ErrorCode::OutOfRange,
                                       fmt::format("{}: frame {} skipped by edge policy", name, frame));
        }
        if (inputPaths.size() != demand.inputs.size()) {
            return TaskResult::failure(key, ErrorCode::MissingInput,
                                       fmt::format("{}: frame {} needs {} input frame(s), got {}",
                                                   name, frame, demand.inputs.size(), inputPaths.size()));
        }

        temporary = store.temporaryPathFor(finalPath);
        const Command argv = buildCommand(frame, demand, inputPaths, temporary);
        store.prepareOutput(finalPath);
        const int status = runner.run(argv);
        if (status != 0) {
            store.discard(temporary);
            return TaskResult::failure(key, ErrorCode::TransformFailed,
                                       fmt::format("{}: '{}' exited with status {} for frame {}", name, argv.front(), status, frame));
        }
        if (!store.commit(temporary, finalPath)) {
            return TaskResult::failure(key, ErrorCode::TransformFailed,
                                       fmt::format("{}: '{}' reported success but wrote no output for frame {}", name, argv.front(), frame));
        }
        return TaskResult::success(key, finalPath);
    } catch (const FlowError& e) {
        if (!temporary.empty()) store.discard(temporary);
        return TaskResult::failure(key, e.code(), e.what());
    } catch (const std::exception& e) {
        if (!temporary.empty()) store.discard(temporary);
        return TaskResult::failure(key, ErrorCode::TransformFailed, fmt::format("{}: frame {}: {}", name, frame, e.what()));
    }
}

// ---------------------------------------------------------------------------
// Graph

size_t Graph::addNode(Node node) {
    if (node.name.empty()) throw FlowError(ErrorCode::InvalidGraph, "node without a name");
    if (nodeIndex.count(node.name)) {
        throw FlowError(ErrorCode::InvalidGraph, "node '" + node.name + "' already exists");
    }
    const size_t index = nodes.size();
    nodeIndex.emplace(node.name, index);
    nodes.push_back(std::move(node));
    inputIndices.clear();
    isLinked = false;
    return index;
}

std::optional<size_t> Graph::find(const std::string& name) const {
    auto it = nodeIndex.find(name);
    if (it == nodeIndex.end()) return std::nullopt;
    return it->second;
}

size_t Graph::indexOf(const std::string& name) const {
    auto it = nodeIndex.find(name);
    if (it == nodeIndex.end()) throw FlowError(ErrorCode::InvalidGraph, "unknown node '" + name + "'");
    return it->second;
}

size_t Graph::inputNode(size_t node, size_t input) const {
    if (node < inputIndices.size()) return inputIndices[node].at(input);
    return indexOf(nodes.at(node).inputs.at(input));
}

std::vector<std::vector<size_t>> Graph::resolveInputs() const {
    std::vector<std::vector<size_t>> resolved(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (const auto& in : nodes[i].inputs) {
            auto it = nodeIndex.find(in);
            if (it == nodeIndex.end()) {
                throw FlowError(ErrorCode::InvalidGraph, "node '" + nodes[i].name + "' reads unknown node '" + in + "'");
            }
            resolved[i].push_back(it->second);
        }
    }
    return resolved;
}

void Graph::validate() const {
    const auto adjacency = resolveInputs();
    enum class Visit { Unvisited, InProgress, Done };
    std::vector<Visit> state(nodes.size(), Visit::Unvisited);
    std::vector<size_t> path;

    std::function<void(size_t)> visit = [&](size_t n) {
        state[n] = Visit::InProgress;
        path.push_back(n);
        for (size_t up : adjacency[n]) {
            if (state[up] == Visit::InProgress) {
                auto from = std::find(path.begin(), path.end(), up);
                std::string cycle;
                for (auto it = from; it != path.end(); ++it) cycle += nodes[*it].name + " -> ";
                cycle += nodes[up].name;
                throw FlowError(ErrorCode::CycleDetected, "cycle detected: " + cycle);
            }
            if (state[up] == Visit::Unvisited) visit(up);
        }
        path.pop_back();
        state[n] = Visit::Done;
    };
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (state[i] == Visit::Unvisited) visit(i);
    }
}

std::vector<size_t> Graph::topologicalOrder() const {
    const auto adjacency = resolveInputs();
    std::vector<size_t> order;
    std::vector<char> seen(nodes.size(), 0);
    std::function<void(size_t)> visit = [&](size_t n) {
        seen[n] = 1;
        for (size_t up : adjacency[n]) if (!seen[up]) visit(up);
        order.push_back(n);
    };
    for (size_t i = 0; i < nodes.size(); ++i) if (!seen[i]) visit(i);
    return order;
}

void Graph::link() {
    validate();
    inputIndices = resolveInputs();
    for (size_t n : topologicalOrder()) {
        Node& node = nodes[n];
        node.inputRanges.clear();
        for (size_t up : inputIndices[n]) node.inputRanges.push_back(nodes[up].range);

        if (const auto* cat = std::get_if<ConcatKind>(&node.kind)) {
            for (size_t i = 1; i < node.inputRanges.size(); ++i) {
                if (node.inputRanges[i].size() < cat->blend || node.inputRanges[i - 1].size() < cat->blend) {
                    throw FlowError(ErrorCode::InvalidGraph,
                                    fmt::format("{}: cross-blend of {} frames is longer than an input", node.name, cat->blend));
                }
            }
        }
        if (const auto* fade = std::get_if<FadeKind>(&node.kind)) {
            if (!node.inputRanges.empty() && fade->duration > node.inputRanges[0].size()) {
                throw FlowError(ErrorCode::InvalidGraph,
                                fmt::format("{}: fade of {} frames is longer than its input ({} frames)",
                                            node.name, fade->duration, node.inputRanges[0].size()));
            }
        }
        node.range = node.computeRange();
        if (node.isSource() && node.output.count() < 0 && node.range.empty()) {
            throw FlowError(ErrorCode::MissingInput,
                            fmt::format("source '{}' found no frames for {}", node.name, node.output.pathTemplate()));
        }
    }
    isLinked = true;
}

std::string Graph::toDot() const {
    std::string out = "digraph G {\n";
    for (const auto& n : nodes) {
        if (n.inputs.empty()) out += fmt::format("  \"{}\";\n", n.name);
        for (const auto& in : n.inputs) out += fmt::format("  \"{}\" -> \"{}\";\n", in, n.name);
    }
    out += "}\n";
    return out;
}

} // namespace FrameFlow
