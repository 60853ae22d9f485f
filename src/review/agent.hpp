#pragma once

/*
    Handing review comments over to a coding agent.

    The payload is one block per unsent comment, separated by blank lines:

        src/main.cc:12: Why not reuse the buffer?

        src/main.cc:40: Missing error check.
*/

#include "review/comments.hpp"

#include <string>
#include <vector>

namespace diffreview {

// Empty when there is nothing unsent.
std::string
format_comments_for_agent(const std::vector<DiffComment>& comments);

class AgentSink {
   public:
    virtual ~AgentSink() = default;

    // Returns true once `payload` has been accepted.
    virtual bool
    deliver(const std::string& payload, const std::string& command) = 0;
};

// Runs `command` through the shell with the payload on its standard input. A command
// that can't be started or exits non-zero counts as a failed delivery.
class PipeAgentSink : public AgentSink {
   public:
    bool
    deliver(const std::string& payload, const std::string& command) override;
};

}  // namespace diffreview
