/*******************************************************
 * tar_check.cpp
 *
 * Walks the members of a built package archive, sorts
 * them into danger classes (setuid/setgid, executable,
 * install script) and makes the operator sign off on
 * the archive before it can be installed.
 *******************************************************/

#include "tar_check.hpp"
#include "errors.hpp"
#include "terminal.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace Rampart {

namespace {

// Global constant for the libarchive read block size.
const size_t archiveBufferSize = 65536;

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string readMemberText(struct archive* a, const std::string& archivePath)
{
    std::string content;
    char buffer[8192];
    la_ssize_t n;
    while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(n));
    }
    if (n < 0) {
        throw ArchiveReadError("Failed to read INSTALL script from tar file " +
                               archivePath + ": " + archive_error_string(a));
    }
    return content;
}

} // namespace

// ---------------------------------------------------------------------------
// ArchiveInventory
// ---------------------------------------------------------------------------

std::vector<std::string> ArchiveInventory::normalFiles() const
{
    std::vector<std::string> paths;
    for (const auto& member : members) {
        if (member.normal) {
            paths.push_back(member.path);
        }
    }
    return paths;
}

std::vector<std::string> ArchiveInventory::executableFiles() const
{
    std::vector<std::string> paths;
    for (const auto& member : members) {
        if (member.executable) {
            paths.push_back(member.path);
        }
    }
    return paths;
}

std::vector<std::string> ArchiveInventory::privilegedFiles() const
{
    std::vector<std::string> paths;
    for (const auto& member : members) {
        if (member.privileged) {
            paths.push_back(member.path);
        }
    }
    return paths;
}

// ---------------------------------------------------------------------------
// Scanning
// ---------------------------------------------------------------------------

std::optional<ArchiveFormat> detectArchiveFormat(const std::string& path)
{
    if (endsWith(path, ".tar.xz")) {
        return ArchiveFormat::TarXz;
    }
    if (endsWith(path, ".tar")) {
        return ArchiveFormat::Tar;
    }
    return std::nullopt;
}

ArchiveMember classifyMember(const std::string& path, unsigned int mode, bool isDirectory)
{
    ArchiveMember member;
    member.path = path;
    member.mode = mode;

    bool directoryEntry = isDirectory || (!path.empty() && path.back() == '/');
    bool hidden         = !path.empty() && path.front() == '.';

    member.normal     = !directoryEntry && !hidden;
    member.executable = member.normal && (mode & 0111) != 0;
    member.privileged = mode > 0777;
    return member;
}

ArchiveInventory scanArchive(const fs::path& archivePath)
{
    const std::string pathStr = archivePath.string();
    std::optional<ArchiveFormat> format = detectArchiveFormat(pathStr);
    if (!format) {
        throw UnsupportedFormat(pathStr);
    }

    ArchiveReader reader(archive_read_new(), &archive_read_free);
    if (!reader) {
        throw ArchiveReadError("archive_read_new failed for " + pathStr);
    }
    struct archive* a = reader.get();

    archive_read_support_format_tar(a);
    if (*format == ArchiveFormat::TarXz) {
        archive_read_support_filter_xz(a);
    } else {
        archive_read_support_filter_none(a);
    }

    if (archive_read_open_filename(a, pathStr.c_str(), archiveBufferSize) != ARCHIVE_OK) {
        throw ArchiveReadError("cannot open archive " + pathStr + ", " +
                               archive_error_string(a));
    }

    ArchiveInventory inventory;
    inventory.archivePath = pathStr;

    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* rawPath = archive_entry_pathname(entry);
        if (!rawPath) {
            throw ArchiveReadError("Failed to extract tar file metadata for file in " + pathStr);
        }
        std::string path = rawPath;
        unsigned int mode = static_cast<unsigned int>(archive_entry_perm(entry));
        bool isDirectory  = archive_entry_filetype(entry) == AE_IFDIR;

        inventory.members.push_back(classifyMember(path, mode, isDirectory));

        if (path == kInstallScriptName) {
            inventory.installScript = readMemberText(a, pathStr);
        } else if (archive_read_data_skip(a) != ARCHIVE_OK) {
            throw ArchiveReadError("cannot access tar file in " + pathStr + ", " +
                                   archive_error_string(a));
        }
    }

    if (r != ARCHIVE_EOF) {
        throw ArchiveReadError("cannot access tar file in " + pathStr + ", " +
                               archive_error_string(a));
    }

    archive_read_close(a);
    log_debug("Scanned " + std::to_string(inventory.members.size()) +
              " members of " + pathStr);
    return inventory;
}

// ---------------------------------------------------------------------------
// AuditSession
// ---------------------------------------------------------------------------

AuditSession::AuditSession(const ArchiveInventory& inventory, std::ostream& out, ShellLauncher& shell)
    : inventory_(inventory), out_(out), shell_(shell)
{
}

void AuditSession::printMenu() const
{
    bool hasPrivileged = !inventory_.privilegedFiles().empty();

    if (!hasPrivileged) {
        out_ << "Package " << inventory_.archivePath << " has no SUID files.\n";
    }
    out_ << "[E]=list executable files, [L]=list all files, "
            "[T]=run shell to inspect, ";
    if (inventory_.hasInstallScript()) {
        out_ << "[I]=show install file, ";
    }
    if (hasPrivileged) {
        out_ << COLOR_ERROR << "!!! [S]=list SUID files!!!, " << COLOR_RESET;
    }
    out_ << "[O]=ok, proceed, [Q]=quit. " << std::flush;
}

void AuditSession::printList(const std::vector<std::string>& paths) const
{
    for (const auto& path : paths) {
        out_ << path << "\n";
    }
    out_ << std::flush;
}

AuditSession::State AuditSession::handle(const std::string& input)
{
    if (state_ == State::Approved || state_ == State::Aborted) {
        return state_;
    }

    if (input == "s" && !inventory_.privilegedFiles().empty()) {
        printList(inventory_.privilegedFiles());
        return State::Listing;
    }
    if (input == "e") {
        printList(inventory_.executableFiles());
        return State::Listing;
    }
    if (input == "l") {
        printList(inventory_.normalFiles());
        return State::Listing;
    }
    if (input == "i" && inventory_.hasInstallScript()) {
        out_ << *inventory_.installScript << std::endl;
        return State::Listing;
    }
    if (input == "t") {
        fs::path dir = fs::path(inventory_.archivePath).parent_path();
        if (dir.empty()) {
            dir = ".";
        }
        shell_.openShell(dir);
        return State::Inspecting;
    }
    if (input == "o") {
        state_ = State::Approved;
        return state_;
    }
    if (input == "q") {
        state_ = State::Aborted;
        return state_;
    }
    return State::AwaitingInput;
}

void AuditSession::run(LineReader& input)
{
    while (state_ == State::AwaitingInput) {
        printMenu();
        std::string answer = input.readLine();
        out_ << std::endl;
        handle(answer);
    }

    if (state_ == State::Aborted) {
        throw AuditAborted("Audit of " + inventory_.archivePath + " aborted, exiting...");
    }
}

// ---------------------------------------------------------------------------
// ArchiveAuditor
// ---------------------------------------------------------------------------

ArchiveAuditor::ArchiveAuditor(LineReader& input, ShellLauncher& shell, std::ostream& out)
    : input_(input), shell_(shell), out_(out)
{
}

void ArchiveAuditor::audit(const fs::path& artifact)
{
    ArchiveInventory inventory = scanArchive(artifact);
    AuditSession session(inventory, out_, shell_);
    session.run(input_);
    log_debug("Checked package tar file " + artifact.string());
}

} // namespace Rampart
