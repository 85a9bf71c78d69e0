#ifndef REVIEW_HPP
#define REVIEW_HPP

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Rampart {

class Config;
class LineReader;
class ShellLauncher;

/**
 * @class RecipeReviewer
 * @brief Makes sure a human looked at a recipe before it is ever built.
 */
class RecipeReviewer
{
public:
    virtual ~RecipeReviewer() = default;

    /**
     * @brief Fetches and reviews the recipe of `pkgbase` into `reviewDir`.
     *
     * Calling it again for an unchanged, already reviewed recipe is a no-op.
     *
     * @throws ReviewFailure if the recipe cannot be fetched.
     * @throws AuditAborted if the operator rejects it.
     */
    virtual void review(const std::string& pkgbase, const std::filesystem::path& reviewDir) = 0;
};

/**
 * @class GitRecipeReviewer
 * @brief RecipeReviewer over git checkouts of "<git_url><pkgbase>.git".
 *
 * The reviewed commit is recorded in .git/rampart-reviewed so later runs
 * only prompt when upstream changed.
 */
class GitRecipeReviewer : public RecipeReviewer
{
public:
    GitRecipeReviewer(const Config& config, LineReader& input, ShellLauncher& shell, std::ostream& out);

    void review(const std::string& pkgbase, const std::filesystem::path& reviewDir) override;

    /**
     * @brief Commit recorded by the last successful review, if any.
     */
    static std::optional<std::string> reviewedCommit(const std::filesystem::path& reviewDir);

    /**
     * @brief Records `commit` as reviewed.
     */
    static void markReviewed(const std::filesystem::path& reviewDir, const std::string& commit);

private:
    std::string gitUrl_;
    LineReader& input_;
    ShellLauncher& shell_;
    std::ostream& out_;

    void fetch(const std::string& pkgbase, const std::filesystem::path& reviewDir) const;
    std::string headCommit(const std::filesystem::path& reviewDir) const;
    void runGit(const std::vector<std::string>& args, const std::filesystem::path& reviewDir) const;
};

} // namespace Rampart

#endif // REVIEW_HPP
