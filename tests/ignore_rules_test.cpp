// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/ignore_rules.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;


TEST(IgnoreRules, DefaultPatterns)
{
    const IgnoreRules rules = IgnoreRules::getDefault();

    EXPECT_TRUE(rules.isIgnored(Zstr("node_modules"), true));
    EXPECT_TRUE(rules.isIgnored(Zstr("node_modules/lib/index.js"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("src/node_modules/x/y.js"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("vendor/autoload.php"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("storage/logs/today.txt"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("bootstrap/cache/services.php"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("app.log"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("logs/npm-debug.log.1"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("src/.main.c.swp"), false));
    EXPECT_TRUE(rules.isIgnored(Zstr("images/Thumbs.db"), false));

    EXPECT_FALSE(rules.isIgnored(Zstr("index.html"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("src/app.js"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("src/bootstrap/cache/x.php"), false)); //anchored at root
    EXPECT_FALSE(rules.isIgnored(Zstr("vendor"), false)); //folder-only pattern vs. file
}


TEST(IgnoreRules, NegationLastMatchWins)
{
    const IgnoreRules rules({"*.log", "!important.log"});

    EXPECT_TRUE (rules.isIgnored(Zstr("debug.log"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("important.log"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("sub/important.log"), false));

    const IgnoreRules reversed({"!important.log", "*.log"});
    EXPECT_TRUE(reversed.isIgnored(Zstr("important.log"), false));
}


TEST(IgnoreRules, AnchoredPatterns)
{
    const IgnoreRules rules({"/build", "docs/**/draft.md"});

    EXPECT_TRUE (rules.isIgnored(Zstr("build"), true));
    EXPECT_TRUE (rules.isIgnored(Zstr("build/out.o"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("src/build/out.o"), false));

    EXPECT_TRUE (rules.isIgnored(Zstr("docs/draft.md"), false));
    EXPECT_TRUE (rules.isIgnored(Zstr("docs/a/b/draft.md"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("other/docs/draft.md"), false));
}


TEST(IgnoreRules, FolderOnlyPatterns)
{
    const IgnoreRules rules({"tmp/"});

    EXPECT_TRUE (rules.isIgnored(Zstr("tmp"), true));
    EXPECT_FALSE(rules.isIgnored(Zstr("tmp"), false));
    EXPECT_TRUE (rules.isIgnored(Zstr("tmp/a.txt"), false));
    EXPECT_TRUE (rules.isIgnored(Zstr("a/tmp/b/c.txt"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("tmpfile.txt"), false));
}


TEST(IgnoreRules, Wildcards)
{
    const IgnoreRules rules({"file?.txt", "*.bak"});

    EXPECT_TRUE (rules.isIgnored(Zstr("file1.txt"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("file10.txt"), false));
    EXPECT_TRUE (rules.isIgnored(Zstr("a/b/c.bak"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("c.bak.txt"), false));
}


TEST(IgnoreRules, ParseSkipsCommentsAndBlankLines)
{
    const IgnoreRules rules = IgnoreRules::parse("# comment\r\n\r\n*.tmp\r\n   \n!keep.tmp\n");
    EXPECT_EQ(rules.size(), 2u);
    EXPECT_TRUE (rules.isIgnored(Zstr("x.tmp"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("keep.tmp"), false));
    EXPECT_FALSE(rules.isIgnored(Zstr("# comment"), false));
}


TEST(IgnoreRules, HiddenPaths)
{
    EXPECT_TRUE (isHiddenPath(Zstr(".ftpignore")));
    EXPECT_TRUE (isHiddenPath(Zstr(".git/config")));
    EXPECT_TRUE (isHiddenPath(Zstr("a/.hidden/b.txt")));
    EXPECT_FALSE(isHiddenPath(Zstr("a/b.txt")));
    EXPECT_FALSE(isHiddenPath(Zstr("a/b.c/d")));
}


TEST(IgnoreRulesLoader, DefaultsWithoutIgnoreFile)
{
    TempFolder root;
    IgnoreRulesLoader loader(root.path());

    const std::shared_ptr<const IgnoreRules> rules = loader.getRules();
    EXPECT_EQ(rules->size(), IgnoreRules::getDefault().size());
    EXPECT_TRUE(rules->isIgnored(Zstr("app.log"), false));

    EXPECT_EQ(loader.getRules(), rules); //cached
}


TEST(IgnoreRulesLoader, IgnoreFileReplacesDefaults)
{
    TempFolder root;
    writeFile(root / IGNORE_FILE_NAME, "*.bak\n", 1'700'000'000);

    IgnoreRulesLoader loader(root.path());
    const std::shared_ptr<const IgnoreRules> rules = loader.getRules();

    EXPECT_TRUE (rules->isIgnored(Zstr("x.bak"), false));
    EXPECT_FALSE(rules->isIgnored(Zstr("app.log"), false));
    EXPECT_EQ(loader.getRules(), rules);

    //reloaded after modification
    writeFile(root / IGNORE_FILE_NAME, "*.log\n", 1'700'000'100);

    const std::shared_ptr<const IgnoreRules> rules2 = loader.getRules();
    EXPECT_NE(rules2, rules);
    EXPECT_FALSE(rules2->isIgnored(Zstr("x.bak"), false));
    EXPECT_TRUE (rules2->isIgnored(Zstr("app.log"), false));
}
