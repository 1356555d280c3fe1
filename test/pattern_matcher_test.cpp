#include <catch2/catch_test_macros.hpp>
#include "pattern_matcher.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST_CASE("PatternMatcher constructor adds default patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Default ignore patterns work") {
        REQUIRE(matcher.isIgnored(".git/config"));
        REQUIRE(matcher.isIgnored("node_modules/package.json"));
        REQUIRE(matcher.isIgnored("web/node_modules/react/index.js"));
        REQUIRE(matcher.isIgnored("build/main.o"));
        REQUIRE(matcher.isIgnored("bin/app.exe"));
        REQUIRE(matcher.isIgnored("lib/libfoo.so"));
        REQUIRE(matcher.isIgnored("__pycache__/module.pyc"));
        REQUIRE(matcher.isIgnored(".venv/lib/site.py"));
        REQUIRE(matcher.isIgnored("static/app.min.js"));
        REQUIRE(matcher.isIgnored(".DS_Store"));
    }

    SECTION("Non-ignored files are not matched") {
        REQUIRE_FALSE(matcher.isIgnored("src/main.cpp"));
        REQUIRE_FALSE(matcher.isIgnored("README.md"));
        REQUIRE_FALSE(matcher.isIgnored("LICENSE"));
        REQUIRE_FALSE(matcher.isIgnored("src/utils/helper.h"));
        REQUIRE_FALSE(matcher.isIgnored("src/builder.py"));
    }

    SECTION("An explicit list replaces the defaults") {
        PatternMatcher custom(std::vector<std::string>{"*.log"});
        REQUIRE(custom.isIgnored("server.log"));
        REQUIRE_FALSE(custom.isIgnored("node_modules/package.json"));
        REQUIRE(custom.ignorePatterns() == std::vector<std::string>{"*.log"});
    }
}

TEST_CASE("PatternMatcher can add custom patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Adding wildcard patterns") {
        matcher.addIgnorePattern("*.txt");
        REQUIRE(matcher.isIgnored("file.txt"));
        REQUIRE(matcher.isIgnored("path/to/file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.md"));
    }

    SECTION("Adding directory patterns") {
        matcher.addIgnorePattern("generated/**");
        REQUIRE(matcher.isIgnored("generated/main.cpp"));
        REQUIRE(matcher.isIgnored("generated/obj/main.o"));
        REQUIRE_FALSE(matcher.isIgnored("src/generated.cpp"));
    }

    SECTION("Adding specific file patterns") {
        matcher.addIgnorePattern("src/secret.key");
        REQUIRE(matcher.isIgnored("src/secret.key"));
        REQUIRE_FALSE(matcher.isIgnored("secret.key"));
        REQUIRE_FALSE(matcher.isIgnored("src/not_secret.key"));
    }

    SECTION("Comma-separated exclude lists") {
        matcher.setExcludePatterns("*.log, docs/ ,tmp");
        REQUIRE(matcher.isIgnored("app.log"));
        REQUIRE(matcher.isIgnored("docs", true));
        REQUIRE(matcher.isIgnored("tmp/cache.py"));
    }
}

TEST_CASE("PatternMatcher properly converts patterns to regex", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("* wildcard") {
        matcher.addIgnorePattern("*.cpp");
        REQUIRE(matcher.isIgnored("main.cpp"));
        REQUIRE(matcher.isIgnored("helper.cpp"));
        REQUIRE_FALSE(matcher.isIgnored("main.h"));
        // A matching directory ignores everything below it
        REQUIRE(matcher.isIgnored("main.cpp/something"));
    }

    SECTION("? wildcard") {
        matcher.addIgnorePattern("file?.txt");
        REQUIRE(matcher.isIgnored("file1.txt"));
        REQUIRE(matcher.isIgnored("fileA.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file12.txt"));
    }

    SECTION("** wildcard") {
        matcher.addIgnorePattern("src/**/test");
        REQUIRE(matcher.isIgnored("src/test"));
        REQUIRE(matcher.isIgnored("src/foo/test"));
        REQUIRE(matcher.isIgnored("src/foo/bar/test"));
        REQUIRE(matcher.isIgnored("src/test/foo"));
        REQUIRE_FALSE(matcher.isIgnored("foo/test"));
        REQUIRE_FALSE(matcher.isIgnored("src/testing"));
    }

    SECTION("Regex characters are literal") {
        matcher.addIgnorePattern("a+b(1).py");
        REQUIRE(matcher.isIgnored("a+b(1).py"));
        REQUIRE_FALSE(matcher.isIgnored("aab1.py"));
    }
}

TEST_CASE("PatternMatcher follows gitignore rules", "[PatternMatcher]") {
    PatternMatcher matcher(std::vector<std::string>{});

    SECTION("Trailing slash matches directories only") {
        matcher.addIgnorePattern("cache/");
        REQUIRE(matcher.isIgnored("cache", true));
        REQUIRE(matcher.isIgnored("cache/data.json"));
        REQUIRE_FALSE(matcher.isIgnored("cache"));
    }

    SECTION("Leading slash anchors at the root") {
        matcher.addIgnorePattern("/config.py");
        REQUIRE(matcher.isIgnored("config.py"));
        REQUIRE_FALSE(matcher.isIgnored("app/config.py"));
    }

    SECTION("Negation re-includes a path") {
        matcher.addIgnorePattern("*.json");
        matcher.addIgnorePattern("!package.json");
        REQUIRE(matcher.isIgnored("data.json"));
        REQUIRE_FALSE(matcher.isIgnored("package.json"));
        REQUIRE_FALSE(matcher.isIgnored("web/package.json"));
    }

    SECTION("Loading a .gitignore file") {
        const fs::path tempDir = fs::temp_directory_path() / "cartographer_gitignore_test";
        fs::create_directories(tempDir);
        {
            std::ofstream file(tempDir / ".gitignore");
            file << "# comment\n\n*.tmp\n  coverage/  \n!keep.tmp\n";
        }

        REQUIRE(matcher.loadGitignore(tempDir / ".gitignore") == 3);
        REQUIRE(matcher.isIgnored("a.tmp"));
        REQUIRE_FALSE(matcher.isIgnored("keep.tmp"));
        REQUIRE(matcher.isIgnored("coverage", true));

        fs::remove_all(tempDir);
    }

    SECTION("A missing .gitignore adds nothing") {
        REQUIRE(matcher.loadGitignore("/non/existent/.gitignore") == 0);
    }
}

TEST_CASE("PatternMatcher include patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Without include patterns everything not ignored is processed") {
        REQUIRE_FALSE(matcher.hasIncludePatterns());
        REQUIRE(matcher.shouldProcess("src/app.py"));
        REQUIRE_FALSE(matcher.shouldProcess("node_modules/x.js"));
    }

    SECTION("File name patterns") {
        matcher.setIncludePatterns("*.py,*.go");
        REQUIRE(matcher.hasIncludePatterns());
        REQUIRE(matcher.shouldProcess("src/app.py"));
        REQUIRE(matcher.shouldProcess("cmd/main.go"));
        REQUIRE_FALSE(matcher.shouldProcess("web/index.js"));
    }

    SECTION("Path patterns") {
        matcher.addIncludePattern("src/**");
        REQUIRE(matcher.shouldProcess("src/deep/module.rs"));
        REQUIRE_FALSE(matcher.shouldProcess("tests/module.rs"));
    }

    SECTION("Ignore patterns win over include patterns") {
        matcher.addIncludePattern("*.js");
        REQUIRE_FALSE(matcher.shouldProcess("node_modules/lib/index.js"));
    }
}
