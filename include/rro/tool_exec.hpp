#pragma once

#include <string>
#include <vector>

namespace rro {

// ============================================================================
// Tool Execution Result
// ============================================================================

struct ToolResult {
    bool ok = false;            // Process was spawned and reaped
    int exit_code = -1;
    std::string error;          // Set when ok is false
    std::vector<std::string> stderr_lines;
};

// ============================================================================
// Tool Invoker
// ============================================================================

/**
 * Runs an external executable synchronously.
 *
 * Callers judge the outcome by the files the tool produced and by what it
 * wrote to stderr; the exit code is informational.
 */
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual ToolResult run(const std::string& executable,
                           const std::vector<std::string>& args) = 0;
};

/**
 * fork/exec implementation. stdout is discarded, stderr is captured and
 * split into lines. Blocks until the child exits; there is no timeout.
 */
class ProcessToolInvoker : public ToolInvoker {
public:
    ToolResult run(const std::string& executable,
                   const std::vector<std::string>& args) override;
};

// Render a command line for logging
std::string format_command(const std::string& executable,
                           const std::vector<std::string>& args);

} // namespace rro
