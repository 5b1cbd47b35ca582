// FrameFlowStore.cpp
//
// std::filesystem implementation of the frame store.
#include "FrameFlowStore.hpp"
#include "FrameFlowCore.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace FrameFlow {

bool LocalFrameStore::exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !ec;
}

// Every run of digits in a file name is a candidate frame number; a candidate
// is accepted only if formatting it back through the stream template yields
// the very same file name, which keeps the mapping bijective.
std::vector<FrameIndex> LocalFrameStore::listFrames(const Stream& stream) const {
    std::vector<FrameIndex> frames;
    const fs::path probe(stream.pathFor(0));
    fs::path dir = probe.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return frames;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        for (size_t i = 0; i < name.size();) {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) { ++i; continue; }
            size_t j = i;
            while (j < name.size() && std::isdigit(static_cast<unsigned char>(name[j]))) ++j;
            // Longer runs cannot be represented as a frame index anyway
            if (j - i <= 18) {
                const FrameIndex number = std::stoll(name.substr(i, j - i));
                const FrameIndex index = number - stream.offset();
                if (index >= 0 && fs::path(stream.pathFor(index)).filename().string() == name) {
                    frames.push_back(index);
                    break;
                }
            }
            i = j;
        }
    }
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    return frames;
}

void LocalFrameStore::prepareOutput(const std::string& path) const {
    const fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) return;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FlowError(ErrorCode::TransformFailed,
                        "cannot create output directory " + dir.string() + ": " + ec.message());
    }
}

// The extension is kept so that tools which pick the encoder from the file
// name still write the right format.
std::string LocalFrameStore::temporaryPathFor(const std::string& path) const {
    const fs::path p(path);
    fs::path tmp = p.parent_path() / (".partial-" + p.stem().string() + p.extension().string());
    return tmp.string();
}

bool LocalFrameStore::commit(const std::string& temporaryPath, const std::string& finalPath) const {
    std::error_code ec;
    if (!fs::is_regular_file(temporaryPath, ec) || fs::file_size(temporaryPath, ec) == 0 || ec) {
        discard(temporaryPath);
        return false;
    }
    fs::rename(temporaryPath, finalPath, ec);
    if (ec) {
        discard(temporaryPath);
        return false;
    }
    return true;
}

void LocalFrameStore::discard(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
}

std::shared_ptr<const FrameStore> defaultFrameStore() {
    static const std::shared_ptr<const FrameStore> store = std::make_shared<LocalFrameStore>();
    return store;
}

} // namespace FrameFlow
