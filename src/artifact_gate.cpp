#include "artifact_gate.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "tar_check.hpp"
#include "utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace Rampart {

std::vector<std::string> buildWhitelist(const std::map<std::string, std::string>& targetVersions)
{
    std::vector<std::string> whitelist;
    whitelist.reserve(targetVersions.size());
    for (const auto& [target, version] : targetVersions) {
        whitelist.push_back(target + "-" + version);
    }
    return whitelist;
}

bool matchesWhitelist(const std::string& fileName, const std::vector<std::string>& whitelist)
{
    return std::any_of(whitelist.begin(), whitelist.end(),
                       [&](const std::string& prefix) {
                           return fileName.rfind(prefix, 0) == 0;
                       });
}

std::vector<fs::path> selectArtifacts(const fs::path& directory,
                                      const std::vector<std::string>& whitelist)
{
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw FilesystemError("Failed to read directory contents (" + ec.message() + ")",
                              directory.string());
    }

    std::vector<fs::path> selected;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (matchesWhitelist(it->path().filename().string(), whitelist)) {
            selected.push_back(it->path());
        }
    }
    if (ec) {
        throw FilesystemError("Failed to read directory contents (" + ec.message() + ")",
                              directory.string());
    }

    std::sort(selected.begin(), selected.end());
    return selected;
}

std::vector<fs::path> listCheckedArtifacts(const fs::path& directory)
{
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw FilesystemError("Failed to read 'checked_tars' directory (" + ec.message() + ")",
                              directory.string());
    }

    std::vector<fs::path> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw FilesystemError("Failed to access 'checked_tars' directory (" + ec.message() + ")",
                                  directory.string());
        }
        files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ---------------------------------------------------------------------------
// StagingArea
// ---------------------------------------------------------------------------

StagingArea::StagingArea(fs::path directory)
    : directory_(std::move(directory))
{
}

StagingArea::StagingArea(StagingArea&& other) noexcept
    : directory_(std::move(other.directory_)),
      admitted_(std::move(other.admitted_)),
      committed_(other.committed_),
      owns_(other.owns_)
{
    other.owns_ = false;
}

StagingArea::~StagingArea()
{
    if (owns_ && !committed_) {
        std::error_code ec;
        bool restored = true;
        for (auto it = admitted_.rbegin(); it != admitted_.rend(); ++it) {
            fs::rename(it->second, it->first, ec);
            if (ec) {
                log_warning("Failed to move " + it->second.string() + " back to " +
                            it->first.string() + ": " + ec.message());
                restored = false;
            }
        }
        if (!restored) {
            log_warning("Keeping incomplete checked dir " + directory_.string());
            return;
        }
        fs::remove_all(directory_, ec);
        if (ec) {
            log_warning("Failed to discard incomplete checked dir " +
                        directory_.string() + ": " + ec.message());
        }
    }
}

StagingArea StagingArea::acquireFresh(const fs::path& directory)
{
    std::error_code ec;
    fs::remove_all(directory, ec);
    if (ec) {
        throw FilesystemError("Failed to clean checked tar files dir (" + ec.message() + ")",
                              directory.string());
    }
    fs::create_directories(directory, ec);
    if (ec) {
        throw FilesystemError("Failed to create checked_tars dir (" + ec.message() + ")",
                              directory.string());
    }
    return StagingArea(directory);
}

fs::path StagingArea::admit(const fs::path& file)
{
    fs::path destination = directory_ / file.filename();
    std::error_code ec;
    fs::rename(file, destination, ec);
    if (ec) {
        throw FilesystemError("Failed to move build artifact " + file.string() +
                              " (" + ec.message() + ")", directory_.string());
    }
    admitted_.emplace_back(file, destination);
    return destination;
}

// ---------------------------------------------------------------------------
// ArtifactGate
// ---------------------------------------------------------------------------

ArtifactGate::ArtifactGate(const Layout& layout, ArtifactAuditor& auditor)
    : layout_(layout), auditor_(auditor)
{
}

std::vector<fs::path> ArtifactGate::checkAndMove(const std::string& pkgbase,
                                                 const std::vector<std::string>& whitelist)
{
    log_debug("checking tars for package " + pkgbase);
    fs::path buildDir = layout_.buildDir(pkgbase);

    std::vector<fs::path> candidates = selectArtifacts(buildDir, whitelist);
    log_debug("Files filtered for tar checking: " + std::to_string(candidates.size()));

    for (const auto& file : candidates) {
        auditor_.audit(file);
    }
    log_debug("all package (tar) files checked, moving them");

    StagingArea staging = StagingArea::acquireFresh(layout_.checkedTarsDir(pkgbase));
    std::vector<fs::path> moved;
    for (const auto& file : candidates) {
        moved.push_back(staging.admit(file));
    }
    staging.commit();
    return moved;
}

} // namespace Rampart
