// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ignore_rules.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_path.h>

using namespace zen;
using namespace sb;


const char* const sb::defaultIgnorePatterns[] =
{
    //version control
    ".git/", ".svn/", ".hg/",
    //OS files
    ".DS_Store", "Thumbs.db", "desktop.ini",
    //dependencies
    "node_modules/", "vendor/", "bower_components/",
    //build/cache
    "coverage/", ".cache/", "storage/", "bootstrap/cache/",
    //IDE/editor
    ".idea/", ".vscode/", "*.swp", "*.swo",
    //logs
    "*.log", "npm-debug.log*",
    nullptr
};


namespace
{
//"true" if path or any parent path matches the mask
//'*' and '?' do not match '/'; "**" matches anything
bool matchesMask(const Zchar* path, const Zchar* const pathEnd, const Zchar* mask /*0-terminated*/)
{
    for (;; ++mask, ++path)
    {
        const Zchar m = *mask;
        switch (m)
        {
            case 0:
                return path == pathEnd || *path == FILE_NAME_SEPARATOR; //"full" or parent path match

            case Zstr('?'): //should not match FILE_NAME_SEPARATOR
                if (path == pathEnd || *path == FILE_NAME_SEPARATOR)
                    return false;
                break;

            case Zstr('*'):
                if (mask[1] == Zstr('*')) // "**"
                {
                    mask += 2;
                    while (*mask == Zstr('*'))
                        ++mask;

                    if (*mask == FILE_NAME_SEPARATOR) // "**/": zero or more folders
                    {
                        ++mask;
                        for (;;)
                        {
                            if (matchesMask(path, pathEnd, mask))
                                return true;
                            path = std::find(path, pathEnd, FILE_NAME_SEPARATOR);
                            if (path == pathEnd)
                                return false;
                            ++path;
                        }
                    }
                    for (;; ++path)
                    {
                        if (matchesMask(path, pathEnd, mask))
                            return true;
                        if (path == pathEnd)
                            return false;
                    }
                }

                ++mask;
                for (;; ++path) //single '*' stays inside the current path component
                {
                    if (matchesMask(path, pathEnd, mask))
                        return true;
                    if (path == pathEnd || *path == FILE_NAME_SEPARATOR)
                        return false;
                }

            default:
                if (path == pathEnd || *path != m)
                    return false;
        }
    }
}


bool matchesMaskAnyDepth(const Zstring& relPath, const Zstring& mask, bool anchored)
{
    const Zchar* const pathEnd = relPath.c_str() + relPath.size();

    for (const Zchar* it = relPath.c_str();;) //try at each path component
    {
        if (matchesMask(it, pathEnd, mask.c_str()))
            return true;
        if (anchored)
            return false;

        it = std::find(it, pathEnd, FILE_NAME_SEPARATOR);
        if (it == pathEnd)
            return false;
        ++it;
    }
}
}


IgnoreRules::IgnoreRules(const std::vector<std::string_view>& patterns)
{
    for (std::string_view pattern : patterns)
    {
        pattern = trimCpy(pattern);
        if (pattern.empty() || startsWith(pattern, '#'))
            continue;

        Rule rule;
        if (startsWith(pattern, '!'))
        {
            rule.negated = true;
            pattern.remove_prefix(1);
        }
        if (endsWith(pattern, '/'))
        {
            rule.folderOnly = true;
            while (endsWith(pattern, '/'))
                pattern.remove_suffix(1);
        }
        if (contains(pattern, '/'))
        {
            rule.anchored = true;
            while (startsWith(pattern, '/'))
                pattern.remove_prefix(1);
        }
        if (pattern.empty())
            continue;

        rule.mask = utfTo<Zstring>(pattern);
        rules_.push_back(std::move(rule));
    }
}


IgnoreRules IgnoreRules::parse(const std::string_view fileContent)
{
    std::vector<std::string_view> lines;
    split(fileContent, '\n', [&](const std::string_view line) { lines.push_back(line); }); //trimCpy() removes '\r'
    return IgnoreRules(lines);
}


IgnoreRules IgnoreRules::getDefault()
{
    std::vector<std::string_view> patterns;
    for (const char* const* it = defaultIgnorePatterns; *it; ++it)
        patterns.push_back(*it);
    return IgnoreRules(patterns);
}


bool IgnoreRules::matchesRule(const Rule& rule, const Zstring& relPath, bool isFolder)
{
    if (rule.folderOnly)
    {
        //a folder-only mask must match the folder or one of its parents: test the closest folder
        if (isFolder)
            return matchesMaskAnyDepth(relPath, rule.mask, rule.anchored);

        if (const std::optional<Zstring> parentPath = getParentFolderPath(relPath))
            return matchesMaskAnyDepth(*parentPath, rule.mask, rule.anchored);
        return false;
    }
    return matchesMaskAnyDepth(relPath, rule.mask, rule.anchored);
}


bool IgnoreRules::isIgnored(const Zstring& relPath, bool isFolder) const
{
    bool ignored = false;
    for (const Rule& rule : rules_)
        if (rule.negated == ignored) //only a rule that could change the result needs evaluation
            if (matchesRule(rule, relPath, isFolder))
                ignored = !rule.negated;
    return ignored;
}


bool sb::isHiddenPath(const Zstring& relPath)
{
    bool hidden = false;
    split(relPath, FILE_NAME_SEPARATOR, [&](const ZstringView itemName)
    {
        if (startsWith(itemName, Zstr('.')))
            hidden = true;
    });
    return hidden;
}


std::shared_ptr<const IgnoreRules> IgnoreRulesLoader::getRules() //throw FileError
{
    const Zstring filePath = appendPath(localRoot_, IGNORE_FILE_NAME);

    std::optional<time_t> modTime;
    if (const std::optional<FileDetails> details = getFileDetailsIfExists(filePath)) //throw FileError
        modTime = details->modTime;

    std::shared_ptr<const IgnoreRules> cachedRules = cache_.access([&](const std::optional<CacheEntry>& entry)
    {
        return entry && entry->modTime == modTime ? entry->rules : nullptr;
    });
    if (cachedRules)
        return cachedRules;

    //ignore file present => defaults are *not* added: the file controls everything
    auto rules = std::make_shared<const IgnoreRules>(modTime ?
                                                     IgnoreRules::parse(getFileContent(filePath, nullptr /*notifyUnbufferedIO*/)) : //throw FileError
                                                     IgnoreRules::getDefault());

    cache_.access([&](std::optional<CacheEntry>& entry) { entry = CacheEntry{modTime, rules}; });
    return rules;
}
