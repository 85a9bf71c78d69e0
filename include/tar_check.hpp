#ifndef TAR_CHECK_HPP
#define TAR_CHECK_HPP

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Rampart {

class LineReader;
class ShellLauncher;

/**
 * @brief Archive containers the auditor can walk.
 */
enum class ArchiveFormat
{
    Tar,   // ".tar"
    TarXz  // ".tar.xz"
};

/**
 * @brief One member of an archive, with its danger classification.
 */
struct ArchiveMember
{
    std::string path;
    unsigned int mode = 0;   // permission bits, including setuid/setgid/sticky
    bool normal = false;     // not a directory entry and not hidden
    bool executable = false; // normal and any execute bit set
    bool privileged = false; // mode above 0777
};

/**
 * @brief Everything one audit pass learned about an archive.
 */
struct ArchiveInventory
{
    std::string archivePath;
    std::vector<ArchiveMember> members;
    std::optional<std::string> installScript; // contents of ".INSTALL"

    std::vector<std::string> normalFiles() const;
    std::vector<std::string> executableFiles() const;
    std::vector<std::string> privilegedFiles() const;
    bool hasInstallScript() const { return installScript && !installScript->empty(); }
};

/**
 * @brief Name of the member carrying the install-time script.
 */
inline constexpr const char* kInstallScriptName = ".INSTALL";

/**
 * @brief Maps a file name suffix to its container format.
 *
 * @return std::nullopt for anything that is neither ".tar" nor ".tar.xz".
 */
std::optional<ArchiveFormat> detectArchiveFormat(const std::string& path);

/**
 * @brief Classifies one member from its stored path and permission bits.
 *
 * @param path        Path as stored in the archive.
 * @param mode        Permission bits (07777 range).
 * @param isDirectory True when the entry's file type is a directory.
 */
ArchiveMember classifyMember(const std::string& path, unsigned int mode, bool isDirectory = false);

/**
 * @brief Reads every member header of an archive and captures ".INSTALL".
 *
 * @throws UnsupportedFormat if the suffix is not recognised.
 * @throws ArchiveReadError if libarchive cannot walk the file.
 */
ArchiveInventory scanArchive(const std::filesystem::path& archive);

/**
 * @class AuditSession
 * @brief Interactive approval loop over one scanned archive.
 *
 * Modelled as a small state machine. Every input moves the session out of
 * AwaitingInput into the state that input selects; Listing and Inspecting
 * fall back to AwaitingInput once their output is shown, Approved and
 * Aborted are terminal. Unrecognised input keeps the session in
 * AwaitingInput.
 */
class AuditSession
{
public:
    enum class State
    {
        AwaitingInput,
        Listing,
        Inspecting,
        Approved,
        Aborted
    };

    AuditSession(const ArchiveInventory& inventory, std::ostream& out, ShellLauncher& shell);

    State state() const { return state_; }

    /**
     * @brief Prints the banner and the options available for this archive.
     */
    void printMenu() const;

    /**
     * @brief Applies one operator answer.
     *
     * @return The state the answer selected. Listing and Inspecting are
     *         reported here even though the session is already back in
     *         AwaitingInput when this returns.
     */
    State handle(const std::string& input);

    /**
     * @brief Prompts until the operator approves or aborts.
     *
     * @throws AuditAborted when the operator aborts.
     */
    void run(LineReader& input);

private:
    const ArchiveInventory& inventory_;
    std::ostream& out_;
    ShellLauncher& shell_;
    State state_ = State::AwaitingInput;

    void printList(const std::vector<std::string>& paths) const;
};

/**
 * @class ArtifactAuditor
 * @brief Anything able to vet a build artifact before it may be installed.
 */
class ArtifactAuditor
{
public:
    virtual ~ArtifactAuditor() = default;

    /**
     * @brief Returns only when the artifact was approved.
     *
     * @throws UnsupportedFormat, ArchiveReadError or AuditAborted otherwise.
     */
    virtual void audit(const std::filesystem::path& artifact) = 0;
};

/**
 * @class ArchiveAuditor
 * @brief Scans an archive and walks the operator through an AuditSession.
 */
class ArchiveAuditor : public ArtifactAuditor
{
public:
    ArchiveAuditor(LineReader& input, ShellLauncher& shell, std::ostream& out);

    void audit(const std::filesystem::path& artifact) override;

private:
    LineReader& input_;
    ShellLauncher& shell_;
    std::ostream& out_;
};

} // namespace Rampart

#endif // TAR_CHECK_HPP
