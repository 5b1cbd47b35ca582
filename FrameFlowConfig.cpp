// FrameFlowConfig.cpp
//
// JSON flow loading. Each node type maps onto a node kind, an input arity and
// default command templates; parameters not consumed by the kind stay
// available as {placeholders} in the commands.
#include "FrameFlowConfig.hpp"
#include <fmt/core.h>
#include <fstream>
#include <limits>

namespace FrameFlow {

namespace {

constexpr size_t kUnlimited = std::numeric_limits<size_t>::max();

std::string signedOffset(long long v) {
    return v >= 0 ? fmt::format("+{}", v) : fmt::format("{}", v);
}

[[noreturn]] void configError(const std::string& node, const std::string& what) {
    if (node.empty()) throw FlowError(ErrorCode::InvalidConfig, "[Config] " + what);
    throw FlowError(ErrorCode::InvalidConfig, "[Config] node '" + node + "': " + what);
}

std::string scalarToString(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_float()) return fmt::format("{}", v.get<double>());
    return v.dump();
}

Command parseCommand(const std::string& node, const nlohmann::json& j) {
    if (!j.is_array() || j.empty()) configError(node, "command must be a non-empty array of strings");
    Command cmd;
    for (const auto& arg : j) {
        if (!arg.is_string()) configError(node, "command arguments must be strings");
        cmd.push_back(arg.get<std::string>());
    }
    return cmd;
}

// Typed parameter access with the node name in every error
struct ParamReader {
    const std::string& node;
    const nlohmann::json& params;

    bool has(const char* key) const { return params.is_object() && params.contains(key) && !params[key].is_null(); }

    long long getInt(const char* key, long long def) const {
        if (!has(key)) return def;
        if (!params[key].is_number_integer()) configError(node, fmt::format("'{}' must be an integer", key));
        return params[key].get<long long>();
    }
    long long requireInt(const char* key) const {
        if (!has(key)) configError(node, fmt::format("missing parameter '{}'", key));
        return getInt(key, 0);
    }
    double getDouble(const char* key, double def) const {
        if (!has(key)) return def;
        if (!params[key].is_number()) configError(node, fmt::format("'{}' must be a number", key));
        return params[key].get<double>();
    }
    bool getBool(const char* key, bool def) const {
        if (!has(key)) return def;
        if (!params[key].is_boolean()) configError(node, fmt::format("'{}' must be true or false", key));
        return params[key].get<bool>();
    }
    std::string getStr(const char* key, const std::string& def) const {
        if (!has(key)) return def;
        if (!params[key].is_string()) configError(node, fmt::format("'{}' must be a string", key));
        return params[key].get<std::string>();
    }
    std::string requireStr(const char* key) const {
        if (!has(key)) configError(node, fmt::format("missing parameter '{}'", key));
        return getStr(key, "");
    }
};

const Command kCopy = {"{convert}", "{input}", "{output}"};

// Applies the per-type defaults; returns the accepted input arity
std::pair<size_t, size_t> configureType(Node& node, const ParamReader& p, std::shared_ptr<const FrameStore> store) {
    const std::string& t = node.type;

    if (t == "ImageSequence") {
        node.kind = SourceKind{};
        node.output = Stream(p.requireStr("format"), p.getInt("offset", 0), store);
        node.output.setFixedCount(p.getInt("count", -1));
        return {0, 0};
    }
    if (t == "StillImage" || t == "Image") {
        node.kind = SourceKind{};
        node.output = Stream(p.requireStr("image"), 0, store);
        const long long duration = p.getInt("duration", 24);
        if (duration < 0) configError(node.name, "'duration' must not be negative");
        node.output.setFixedCount(duration);
        return {0, 0};
    }
    if (t == "AddLabel") {
        node.kind = PassThroughKind{};
        p.requireStr("label");
        if (!node.params.count("corner")) node.params["corner"] = "SouthWest";
        node.commands["main"] = {"{convert}", "{input}", "-fill", "white", "-undercolor", "#00000080",
                                 "-pointsize", "24", "-gravity", "{corner}", "-annotate", "+0+5",
                                 " {label} ", "{output}"};
        return {1, 1};
    }
    if (t == "Crop") {
        node.kind = PassThroughKind{};
        p.requireInt("hSize");
        p.requireInt("vSize");
        if (!node.params.count("hOffset")) node.params["hOffset"] = "0";
        if (!node.params.count("vOffset")) node.params["vOffset"] = "0";
        node.commands["main"] = {"{convert}", "{input}", "-crop", "{hSize}%x{vSize}%+{hOffset}+{vOffset}", "{output}"};
        return {1, 1};
    }
    if (t == "Resize") {
        node.kind = PassThroughKind{};
        if (p.getInt("maximumWidth", 256) < 1 || p.getInt("maximumHeight", 256) < 1) {
            configError(node.name, "maximum size must be positive");
        }
        if (!node.params.count("maximumWidth")) node.params["maximumWidth"] = "256";
        if (!node.params.count("maximumHeight")) node.params["maximumHeight"] = "256";
        node.commands["main"] = {"{convert}", "{input}", "-resize", "{maximumWidth}x{maximumHeight}", "{output}"};
        return {1, 1};
    }
    if (t == "ChangeCanvasSize") {
        node.kind = PassThroughKind{};
        const long long width = p.getInt("width", 256);
        const long long height = p.getInt("height", 256);
        if (width < 1 || height < 1) configError(node.name, "canvas size must be positive");
        node.params["width"] = std::to_string(width);
        node.params["height"] = std::to_string(height);
        // Shifts move the image away from the centre of the new canvas
        node.params["hShift"] = signedOffset(p.getInt("hShift", 0));
        node.params["vShift"] = signedOffset(p.getInt("vShift", 0));
        node.commands["main"] = {"{convert}", "{input}", "-gravity", "center", "-extent",
                                 "{width}x{height}{hShift}{vShift}", "{output}"};
        return {1, 1};
    }
    if (t == "Overlay") {
        node.kind = PassThroughKind{};
        p.requireStr("overlay");
        node.commands["main"] = {"{composite}", "{overlay}", "{input}", "{output}"};
        return {1, 1};
    }
    if (t == "EvaluateFrame") {
        const long long frame = p.requireInt("frame");
        const long long duration = p.getInt("duration", 24);
        if (frame < 0) configError(node.name, "'frame' must not be negative");
        if (duration < 0) configError(node.name, "'duration' must not be negative");
        node.kind = ResampleKind{0.0, frame, duration};
        node.commands["main"] = kCopy;
        return {1, 1};
    }
    if (t == "Merge") {
        node.kind = PassThroughKind{};
        node.commands["main"] = {"{convert}", "{inputs}", "+append", "{output}"};
        return {1, kUnlimited};
    }
    if (t == "MergeTiled") {
        const long long columns = p.getInt("columns", 2);
        const long long rows = p.getInt("rows", 2);
        if (columns < 1 || rows < 1) configError(node.name, "'columns' and 'rows' must be positive");
        node.kind = PassThroughKind{};
        node.commands["main"] = {"{montage}", "{inputs}", "-mode", "Concatenate", "-tile",
                                 fmt::format("{}x{}", columns, rows), "{output}"};
        return {1, static_cast<size_t>(columns * rows)};
    }
    if (t == "Output") {
        node.kind = PassThroughKind{};
        node.commands["main"] = {"{convert}", "-define", "png:color-type=2", "-depth", "8", "{input}", "PNG24:{output}"};
        return {1, 1};
    }
    if (t == "SubSequence") {
        const long long first = p.getInt("first", 0);
        const long long last = p.requireInt("last");
        if (first < 0 || last < first) configError(node.name, "need 0 <= first <= last");
        node.kind = ResampleKind{1.0, first, last - first};
        node.commands["main"] = kCopy;
        return {1, 1};
    }
    if (t == "FadeIn" || t == "FadeOut") {
        FadeKind fade;
        fade.fadeIn = t == "FadeIn";
        fade.duration = p.getInt(fade.fadeIn ? "fadeInDuration" : "fadeOutDuration", 24);
        fade.blur = p.getBool("blur", false);
        if (fade.duration < 0) configError(node.name, "fade duration must not be negative");
        node.kind = fade;
        node.commands["main"] = {"{convert}", "{input}", "-modulate", "{brightness}", "-blur", "0x{blurRadius}", "{output}"};
        node.commands["copy"] = kCopy;
        return {1, 1};
    }
    if (t == "Concatenate") {
        const long long blend = p.getInt("crossBlendDuration", 0);
        if (blend < 0) configError(node.name, "'crossBlendDuration' must not be negative");
        node.kind = ConcatKind{blend};
        node.commands["copy"] = kCopy;
        if (p.getBool("blur", true)) {
            node.commands["blend"] = {"{composite}", "-blur", "0x{blurRadius}", "-blend", "{blendPercent}%",
                                      "{input1}", "{input0}", "{output}"};
        } else {
            node.commands["blend"] = {"{composite}", "-blend", "{blendPercent}%", "{input1}", "{input0}", "{output}"};
        }
        return {1, kUnlimited};
    }
    if (t == "Blend") {
        const long long width = p.getInt("width", 3);
        if (width < 1 || width % 2 == 0) configError(node.name, "'width' must be odd and positive");
        node.kind = WindowedKind{static_cast<int>(width)};
        node.commands["main"] = {"{convert}", "{inputs}", "-evaluate-sequence", "mean", "{output}"};
        return {1, 1};
    }
    if (t == "Resample") {
        const double ratio = p.getDouble("ratio", 0.0);
        if (ratio <= 0.0) configError(node.name, "'ratio' must be positive");
        node.kind = ResampleKind{ratio, p.getInt("offset", 0), p.getInt("length", -1)};
        node.commands["main"] = kCopy;
        return {1, 1};
    }
    if (t == "Transform") {
        const std::string mapping = p.getStr("mapping", "identity");
        if (mapping == "identity") {
            node.kind = PassThroughKind{};
            return {1, kUnlimited};
        }
        if (mapping == "window") {
            const long long width = p.getInt("width", 3);
            if (width < 1 || width % 2 == 0) configError(node.name, "'width' must be odd and positive");
            node.kind = WindowedKind{static_cast<int>(width)};
            return {1, 1};
        }
        if (mapping == "constant") {
            const long long frame = p.requireInt("frame");
            const long long duration = p.getInt("duration", 24);
            if (frame < 0 || duration < 0) configError(node.name, "'frame' and 'duration' must not be negative");
            node.kind = ResampleKind{0.0, frame, duration};
            return {1, 1};
        }
        if (mapping == "resample") {
            const double ratio = p.getDouble("ratio", 1.0);
            if (ratio <= 0.0) configError(node.name, "'ratio' must be positive");
            node.kind = ResampleKind{ratio, p.getInt("offset", 0), p.getInt("length", -1)};
            return {1, 1};
        }
        configError(node.name, "unknown mapping '" + mapping + "' (identity|window|resample|constant)");
    }
    configError(node.name, "unknown node type '" + t + "'");
}

Node parseNode(const nlohmann::json& j, const Flow& flow, const std::string& defaultPolicy,
               std::shared_ptr<const FrameStore> store) {
    if (!j.is_object()) configError("", "every node must be an object");
    if (!j.contains("name") || !j["name"].is_string()) configError("", "node without a string 'name'");

    Node node;
    node.name = j["name"].get<std::string>();
    if (!j.contains("type") || !j["type"].is_string()) configError(node.name, "missing 'type'");
    node.type = j["type"].get<std::string>();

    if (j.contains("inputs") && !j["inputs"].is_null()) {
        if (!j["inputs"].is_array()) configError(node.name, "'inputs' must be an array of node names");
        for (const auto& in : j["inputs"]) {
            if (!in.is_string()) configError(node.name, "'inputs' must be an array of node names");
            node.inputs.push_back(in.get<std::string>());
        }
    }

    static const nlohmann::json kNoParams = nlohmann::json::object();
    const nlohmann::json& params = (j.contains("params") && !j["params"].is_null()) ? j["params"] : kNoParams;
    if (!params.is_object()) configError(node.name, "'params' must be an object");

    node.params = flow.tools;
    for (const auto& item : params.items()) node.params[item.key()] = scalarToString(item.value());

    const ParamReader reader{node.name, params};
    const auto arity = configureType(node, reader, store);
    if (node.inputs.size() < arity.first) {
        configError(node.name, fmt::format("needs at least {} input(s), got {}", arity.first, node.inputs.size()));
    }
    if (node.inputs.size() > arity.second) {
        configError(node.name, fmt::format("accepts at most {} input(s), got {}", arity.second, node.inputs.size()));
    }

    if (j.contains("command")) node.commands["main"] = parseCommand(node.name, j["command"]);
    if (j.contains("commands")) {
        if (!j["commands"].is_object()) configError(node.name, "'commands' must map names to argument arrays");
        for (const auto& item : j["commands"].items()) node.commands[item.key()] = parseCommand(node.name, item.value());
    }

    std::string policy = defaultPolicy;
    if (params.contains("edgePolicy")) policy = reader.getStr("edgePolicy", policy);
    if (j.contains("edgePolicy")) {
        if (!j["edgePolicy"].is_string()) configError(node.name, "'edgePolicy' must be a string");
        policy = j["edgePolicy"].get<std::string>();
    }
    try {
        node.edgePolicy = parseEdgePolicy(policy);
    } catch (const FlowError& e) {
        configError(node.name, e.what());
    }

    if (!node.isSource()) {
        if (node.commands.empty()) configError(node.name, "no command given");
        std::string templ = flow.workDir + "/" + node.name + "/{0:08}.png";
        if (j.contains("output")) {
            if (!j["output"].is_string()) configError(node.name, "'output' must be a path template string");
            templ = j["output"].get<std::string>();
        }
        if (templ.find('{') == std::string::npos) {
            configError(node.name, "output template '" + templ + "' has no frame placeholder");
        }
        node.output = Stream(templ, 0, store);
    }
    try {
        (void)node.output.pathFor(0);
    } catch (const FlowError& e) {
        configError(node.name, e.what());
    }
    return node;
}

Flow buildFlow(const nlohmann::json& json, std::shared_ptr<const FrameStore> store) {
    if (!json.is_object()) configError("", "flow must be a JSON object");
    Flow flow;
    flow.workDir = json.value("workDir", std::string("frameflow-work"));
    flow.tools = {{"convert", "convert"}, {"composite", "composite"}, {"montage", "montage"}};
    if (json.contains("tools")) {
        if (!json["tools"].is_object()) configError("", "'tools' must map tool names to executables");
        for (const auto& item : json["tools"].items()) flow.tools[item.key()] = scalarToString(item.value());
    }
    const std::string defaultPolicy = json.value("edgePolicy", std::string("error"));

    const auto nodes = json.find("nodes");
    if (nodes == json.end() || !nodes->is_array() || nodes->empty()) configError("", "no nodes specified");

    for (const auto& nj : *nodes) {
        Node node = parseNode(nj, flow, defaultPolicy, store);
        const std::string name = node.name;
        try {
            flow.graph.addNode(std::move(node));
        } catch (const FlowError& e) {
            configError(name, e.what());
        }
    }

    flow.sink = json.value("sink", std::string());
    if (flow.sink.empty()) flow.sink = flow.graph.node(flow.graph.size() - 1).name;
    if (!flow.graph.find(flow.sink)) configError("", "sink '" + flow.sink + "' is not a node");
    return flow;
}

} // namespace

Flow loadFromJson(const nlohmann::json& json, std::shared_ptr<const FrameStore> store) {
    try {
        return buildFlow(json, std::move(store));
    } catch (const nlohmann::json::exception& e) {
        configError("", e.what());
    }
}

Flow loadFromFile(const std::string& path, std::shared_ptr<const FrameStore> store) {
    std::ifstream f(path);
    if (!f.good()) configError("", "could not open flow file: " + path);
    nlohmann::json json;
    try {
        f >> json;
    } catch (const nlohmann::json::exception& e) {
        configError("", "could not parse " + path + ": " + e.what());
    }
    return loadFromJson(json, std::move(store));
}

} // namespace FrameFlow
