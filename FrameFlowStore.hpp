// FrameFlowStore.hpp
//
// Filesystem collaborator for frame streams. Streams never touch the disk
// directly; existence checks, frame enumeration and the write-then-rename
// protocol for task outputs all go through a FrameStore so the scheduler can
// be exercised against any storage backend.
#pragma once
#include "FrameFlowTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace FrameFlow {

class Stream;

class FrameStore {
public:
    virtual ~FrameStore() = default;

    virtual bool exists(const std::string& path) const = 0;
    // Ordered indices of the frames of `stream` currently present
    virtual std::vector<FrameIndex> listFrames(const Stream& stream) const = 0;
    // Make sure the directory that will hold `path` exists
    virtual void prepareOutput(const std::string& path) const = 0;
    // Sibling path a task writes to before its output is committed
    virtual std::string temporaryPathFor(const std::string& path) const = 0;
    // Move a finished temporary into place; false when nothing usable was written
    virtual bool commit(const std::string& temporaryPath, const std::string& finalPath) const = 0;
    virtual void discard(const std::string& path) const = 0;
};

class LocalFrameStore : public FrameStore {
public:
    bool exists(const std::string& path) const override;
    std::vector<FrameIndex> listFrames(const Stream& stream) const override;
    void prepareOutput(const std::string& path) const override;
    std::string temporaryPathFor(const std::string& path) const override;
    bool commit(const std::string& temporaryPath, const std::string& finalPath) const override;
    void discard(const std::string& path) const override;
};

std::shared_ptr<const FrameStore> defaultFrameStore();

} // namespace FrameFlow
