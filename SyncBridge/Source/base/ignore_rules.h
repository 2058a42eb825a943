// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef IGNORE_RULES_H_5019283740192837
#define IGNORE_RULES_H_5019283740192837

#include <memory>
#include <optional>
#include <vector>
#include <zen/file_error.h>
#include <zen/thread.h>


namespace sb
{
const Zchar IGNORE_FILE_NAME[] = Zstr(".ftpignore");

//used if no ignore file exists
extern const char* const defaultIgnorePatterns[];


/*  gitignore-style exclusion:
        - one pattern per line, '#' starts a comment, blank lines are skipped
        - trailing '/': folder-only; also excludes everything below the folder
        - '*' and '?' do not match '/', "**" does
        - no '/' (except trailing): match at any depth; otherwise anchored at root (leading '/' optional)
        - leading '!': re-include; the last matching pattern wins                                   */
class IgnoreRules
{
public:
    IgnoreRules() {}
    explicit IgnoreRules(const std::vector<std::string_view>& patterns);

    static IgnoreRules parse(const std::string_view fileContent);
    static IgnoreRules getDefault();

    //relPath: '/'-separated relative to local root
    bool isIgnored(const Zstring& relPath, bool isFolder) const;

    size_t size() const { return rules_.size(); }

private:
    struct Rule
    {
        Zstring mask;
        bool negated    = false;
        bool folderOnly = false;
        bool anchored   = false;
    };
    static bool matchesRule(const Rule& rule, const Zstring& relPath, bool isFolder);

    std::vector<Rule> rules_;
};

//any path component starting with '.'
bool isHiddenPath(const Zstring& relPath);


//rules of one local root: reloaded when the ignore file's modification time changes; thread-safe
class IgnoreRulesLoader
{
public:
    explicit IgnoreRulesLoader(const Zstring& localRoot) : localRoot_(localRoot) {}

    std::shared_ptr<const IgnoreRules> getRules(); //throw FileError

private:
    struct CacheEntry
    {
        std::optional<time_t> modTime; //no value: ignore file not existing
        std::shared_ptr<const IgnoreRules> rules;
    };

    const Zstring localRoot_;
    zen::Protected<std::optional<CacheEntry>> cache_;
};
}

#endif //IGNORE_RULES_H_5019283740192837
