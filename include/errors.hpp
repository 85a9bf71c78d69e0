#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Rampart {

/**
 * @brief Process exit statuses used by the rampart binary.
 */
enum ExitCode : int {
    EXIT_OK            = 0,
    EXIT_NOT_FOUND     = 1, // requested or required targets missing upstream
    EXIT_AUDIT_ABORTED = 2, // operator stopped the run at a prompt
    EXIT_FATAL         = 3  // any other unrecoverable failure
};

/**
 * @class RampartError
 * @brief Base class of every fatal condition raised by the core.
 *
 * Each error knows the exit status the process terminates with when
 * it reaches main().
 */
class RampartError : public std::runtime_error
{
public:
    explicit RampartError(const std::string& message, int exitCode = EXIT_FATAL)
        : std::runtime_error(message), exitCode_(exitCode) {}

    int exitCode() const { return exitCode_; }

private:
    int exitCode_;
};

/**
 * @brief The configuration file exists but cannot be parsed.
 */
class ConfigError : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief The remote metadata source is unreachable or answered with malformed data.
 */
class ResolutionFailure : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief One or more target names are absent from the remote metadata.
 */
class PackagesNotFound : public RampartError
{
public:
    explicit PackagesNotFound(std::vector<std::string> names)
        : RampartError(describe(names), EXIT_NOT_FOUND), names_(std::move(names)) {}

    const std::vector<std::string>& names() const { return names_; }

private:
    static std::string describe(const std::vector<std::string>& names)
    {
        std::string message = "Need to install packages: [";
        for (size_t i = 0; i < names.size(); ++i) {
            message += (i > 0 ? ", \"" : "\"") + names[i] + "\"";
        }
        return message + "], but they are not found on the AUR.";
    }

    std::vector<std::string> names_;
};

/**
 * @brief An artifact's file name does not carry a supported archive suffix.
 */
class UnsupportedFormat : public RampartError
{
public:
    explicit UnsupportedFormat(const std::string& path)
        : RampartError("Archive " + path + " cannot be analyzed. "
                       "Only .tar.xz and .tar files are supported"),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief libarchive failed while walking an archive.
 */
class ArchiveReadError : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief The confined build of a package-base failed.
 */
class BuildFailure : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief A working directory could not be created, cleared, copied or moved into.
 */
class FilesystemError : public RampartError
{
public:
    FilesystemError(const std::string& message, const std::string& path)
        : RampartError(message + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Fetching or inspecting a recipe repository failed.
 */
class ReviewFailure : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief The system package manager refused a query or an installation.
 */
class PackageManagerFailure : public RampartError
{
public:
    using RampartError::RampartError;
};

/**
 * @brief The operator chose to abort at an audit or review prompt.
 *
 * Not a technical failure: a deliberate stop that must unwind the whole run.
 */
class AuditAborted : public RampartError
{
public:
    explicit AuditAborted(const std::string& message = "Exiting...")
        : RampartError(message, EXIT_AUDIT_ABORTED) {}
};

} // namespace Rampart

#endif // ERRORS_HPP
