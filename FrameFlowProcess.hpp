// FrameFlowProcess.hpp
//
// External command collaborator. Transforms are run as separate processes,
// one per frame; the exit status is the only success signal.
#pragma once
#include <string>
#include <vector>

namespace FrameFlow {

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Runs argv[0] with the given arguments and blocks until it exits.
    // Returns the exit status; must be callable from several threads at once.
    virtual int run(const std::vector<std::string>& argv) = 0;
};

// posix_spawnp + waitpid. Exec failures report 127, death by signal 128+N.
class ProcessRunner : public CommandRunner {
public:
    explicit ProcessRunner(bool quiet = false) : quiet(quiet) {}
    int run(const std::vector<std::string>& argv) override;

private:
    bool quiet; // send the child's stdout to /dev/null
};

} // namespace FrameFlow
