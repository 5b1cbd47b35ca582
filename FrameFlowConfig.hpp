// FrameFlowConfig.hpp
//
// Builds a Graph from a JSON flow description:
//
//   { "workDir": "...", "tools": {"convert": "..."}, "sink": "...",
//     "edgePolicy": "error",
//     "nodes": [ {"name", "type", "inputs": [...], "params": {...},
//                 "output": "dir/{0:08}.png", "edgePolicy", "command": [...],
//                 "commands": {"copy": [...]}} ] }
//
// Node types: ImageSequence, StillImage (alias Image), EvaluateFrame,
// AddLabel, Crop, Resize, ChangeCanvasSize, Overlay, Merge, MergeTiled
// (columns x rows), Output, SubSequence, FadeIn, FadeOut, Concatenate,
// Blend, Resample and Transform (user supplied command).
#pragma once
#include "FrameFlowCore.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace FrameFlow {

struct Flow {
    Graph graph;
    std::string sink;
    std::string workDir;
    Params tools;
};

// Throws FlowError(InvalidConfig) naming the offending node
Flow loadFromJson(const nlohmann::json& json,
                  std::shared_ptr<const FrameStore> store = defaultFrameStore());
Flow loadFromFile(const std::string& path,
                  std::shared_ptr<const FrameStore> store = defaultFrameStore());

} // namespace FrameFlow
