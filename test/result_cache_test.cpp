#include <catch2/catch_test_macros.hpp>
#include "result_cache.hpp"
#include "run_context.hpp"
#include "fingerprint.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

ParseResult sampleResult() {
    ParseResult result;
    result.imports = {"os"};
    result.functions.push_back({"main", "app.py", 1, {"argv"}});
    return result;
}

} // namespace

TEST_CASE("ResultCache keeps results in memory", "[ResultCache]") {
    ResultCache cache;
    const std::string fp = fingerprint("def main(argv): pass\n");

    REQUIRE_FALSE(cache.isPersistent());
    REQUIRE_FALSE(cache.get(fp, Language::Python).has_value());

    cache.put(fp, Language::Python, sampleResult());

    auto cached = cache.get(fp, Language::Python);
    REQUIRE(cached.has_value());
    REQUIRE(cached->imports == std::vector<std::string>{"os"});
    REQUIRE(cached->functions[0].name == "main");

    SECTION("Results are per language") {
        REQUIRE_FALSE(cache.get(fp, Language::Ruby).has_value());
    }

    SECTION("Flushing an in-memory cache writes nothing") {
        REQUIRE(cache.flush() == 0);
    }

    SECTION("Clear drops every entry") {
        cache.clear();
        REQUIRE_FALSE(cache.get(fp, Language::Python).has_value());
    }
}

TEST_CASE("ResultCache getOrCompute computes once", "[ResultCache]") {
    ResultCache cache;
    const std::string fp = fingerprint("x");
    int calls = 0;
    auto compute = [&]() {
        ++calls;
        return sampleResult();
    };

    bool hit = true;
    cache.getOrCompute(fp, Language::Python, compute, hit);
    REQUIRE_FALSE(hit);
    REQUIRE(calls == 1);

    const ParseResult again = cache.getOrCompute(fp, Language::Python, compute, hit);
    REQUIRE(hit);
    REQUIRE(calls == 1);
    REQUIRE(again.functions.size() == 1);

    SECTION("Failures store nothing") {
        const std::string other = fingerprint("y");
        auto failing = []() -> ParseResult { throw std::runtime_error("boom"); };
        REQUIRE_THROWS_AS(cache.getOrCompute(other, Language::Python, failing, hit), std::runtime_error);
        REQUIRE_FALSE(cache.get(other, Language::Python).has_value());
    }
}

TEST_CASE("ResultCache persists entries across instances", "[ResultCache]") {
    const fs::path cacheDir = fs::temp_directory_path() / "cartographer_cache_test";
    fs::remove_all(cacheDir);

    const std::string fp = fingerprint("import os\n");

    {
        ResultCache cache(cacheDir);
        REQUIRE(cache.isPersistent());
        cache.put(fp, Language::Python, sampleResult());
        REQUIRE(cache.flush() == 1);
        // Nothing left to write
        REQUIRE(cache.flush() == 0);
    }

    REQUIRE(fs::exists(ResultCache(cacheDir).entryPath(fp)));
    REQUIRE(ResultCache(cacheDir).entryPath(fp).parent_path().filename() == fp.substr(0, 2));

    SECTION("A new instance reads the entry") {
        ResultCache cache(cacheDir);
        auto cached = cache.get(fp, Language::Python);
        REQUIRE(cached.has_value());
        REQUIRE(cached->functions[0].params == std::vector<std::string>{"argv"});
    }

    SECTION("Corrupt entries are misses") {
        {
            std::ofstream file(ResultCache(cacheDir).entryPath(fp), std::ios::trunc);
            file << "{ not json";
        }
        ResultCache cache(cacheDir);
        REQUIRE_FALSE(cache.get(fp, Language::Python).has_value());
    }

    SECTION("Entries with another format version are misses") {
        {
            std::ofstream file(ResultCache(cacheDir).entryPath(fp), std::ios::trunc);
            file << R"({"version": 999, "fingerprint": ")" << fp << R"(", "languages": {}})";
        }
        ResultCache cache(cacheDir);
        REQUIRE_FALSE(cache.get(fp, Language::Python).has_value());
    }

    SECTION("Clear removes the directory") {
        ResultCache cache(cacheDir);
        cache.clear();
        REQUIRE_FALSE(fs::exists(cacheDir));
    }

    fs::remove_all(cacheDir);
}

TEST_CASE("RunContext tracks counters and warnings", "[RunContext]") {
    SECTION("Without a cache") {
        RunContext context;
        REQUIRE(context.cache() == nullptr);

        context.recordParse();
        context.recordParse();
        context.recordCacheHit();
        context.recordParseFailure();
        REQUIRE(context.parseInvocations() == 2);
        REQUIRE(context.cacheHits() == 1);
        REQUIRE(context.cacheMisses() == 0);
        REQUIRE(context.parseFailures() == 1);

        REQUIRE_FALSE(context.isCancelled());
        context.cancel();
        REQUIRE(context.isCancelled());

        context.addWarning("first");
        context.addWarning("second");
        REQUIRE(context.warnings() == std::vector<std::string>{"first", "second"});

        context.finish();
        REQUIRE(context.isFinished());
    }

    SECTION("Finishing flushes the cache") {
        const fs::path cacheDir = fs::temp_directory_path() / "cartographer_context_test";
        fs::remove_all(cacheDir);

        auto cache = std::make_shared<ResultCache>(cacheDir);
        RunContext context(cache);
        const std::string fp = fingerprint("z");
        context.cache()->put(fp, Language::Go, ParseResult{});

        context.finish();
        REQUIRE(fs::exists(cache->entryPath(fp)));

        // Finishing twice is harmless
        context.finish();
        REQUIRE(context.isFinished());

        fs::remove_all(cacheDir);
    }
}

TEST_CASE("ResultCache skips entries that cannot be stored as JSON", "[ResultCache]") {
    const fs::path cacheDir = fs::temp_directory_path() / "cartographer_cache_utf8_test";
    fs::remove_all(cacheDir);

    ParseResult latin1;
    latin1.imports = {"caf\xe9.h"};
    const std::string badFp = fingerprint("#include \"caf\xe9.h\"\n");
    const std::string goodFp = fingerprint("import os\n");

    ResultCache cache(cacheDir);
    cache.put(badFp, Language::C, latin1);
    cache.put(goodFp, Language::Python, sampleResult());

    size_t written = 0;
    REQUIRE_NOTHROW(written = cache.flush());
    REQUIRE(written == 1);
    REQUIRE(fs::exists(cache.entryPath(goodFp)));
    REQUIRE_FALSE(fs::exists(cache.entryPath(badFp)));

    // Still served from memory for the rest of the run
    REQUIRE(cache.get(badFp, Language::C).has_value());
    REQUIRE_FALSE(ResultCache(cacheDir).get(badFp, Language::C).has_value());

    fs::remove_all(cacheDir);
}
