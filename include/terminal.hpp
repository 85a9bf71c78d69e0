#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include <filesystem>
#include <istream>
#include <string>

namespace Rampart {

/**
 * @class LineReader
 * @brief Source of operator answers for every interactive prompt.
 */
class LineReader
{
public:
    virtual ~LineReader() = default;

    /**
     * @brief Blocks until one line of input is available.
     *
     * @return The line, trimmed and lower-cased.
     * @throws AuditAborted when the input is closed.
     */
    virtual std::string readLine() = 0;
};

/**
 * @brief Reads operator answers from a stream (standard input in production).
 */
class StdinLineReader : public LineReader
{
public:
    explicit StdinLineReader(std::istream& in);
    std::string readLine() override;

private:
    std::istream& in_;
};

/**
 * @class ShellLauncher
 * @brief Spawns an interactive shell so the operator can inspect files by hand.
 */
class ShellLauncher
{
public:
    virtual ~ShellLauncher() = default;

    /**
     * @brief Runs a shell rooted at `directory` and waits for the operator to leave it.
     */
    virtual void openShell(const std::filesystem::path& directory) = 0;
};

/**
 * @brief ShellLauncher that forks the configured shell program.
 */
class ProcessShellLauncher : public ShellLauncher
{
public:
    explicit ProcessShellLauncher(std::string shell);
    void openShell(const std::filesystem::path& directory) override;

private:
    std::string shell_;
};

} // namespace Rampart

#endif // TERMINAL_HPP
