#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace wifiprov {

struct CommandResult {
    int exitCode = -1;
    std::string out;
    std::string err;
    bool timedOut = false;

    bool ok() const { return !timedOut && exitCode == 0; }
};

// Runs an external program. The argument vector is passed to the program
// as-is, without a shell, so SSIDs and passphrases need no quoting.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;
};

} // namespace wifiprov
