#include <catch2/catch_test_macros.hpp>
#include "file_record.hpp"
#include <stdexcept>

TEST_CASE("countLines counts a trailing fragment", "[FileRecord]") {
    REQUIRE(countLines("") == 0);
    REQUIRE(countLines("one") == 1);
    REQUIRE(countLines("one\n") == 1);
    REQUIRE(countLines("one\ntwo") == 2);
    REQUIRE(countLines("one\ntwo\n\n") == 3);
}

TEST_CASE("Confidence and entry reason names", "[FileRecord]") {
    REQUIRE(confidenceName(Confidence::Exact) == "exact");
    REQUIRE(confidenceName(Confidence::Heuristic) == "heuristic");
    REQUIRE(confidenceName(Confidence::Unresolved) == "unresolved");

    REQUIRE(confidenceFromName("heuristic") == Confidence::Heuristic);
    REQUIRE_THROWS_AS(confidenceFromName("maybe"), std::invalid_argument);

    REQUIRE(entryReasonName(EntryReason::NamePattern) == "name_pattern");
    REQUIRE(entryReasonName(EntryReason::GraphShape) == "graph_shape");
}

TEST_CASE("ImportEdge resolution state follows its target", "[FileRecord]") {
    ImportEdge edge;
    edge.source = "a.py";
    edge.token = "b";
    REQUIRE_FALSE(edge.resolved());

    edge.target = "b.py";
    REQUIRE(edge.resolved());
}

TEST_CASE("ParseResult survives JSON conversion", "[FileRecord]") {
    ParseResult result;
    result.imports = {"os", "./util"};
    result.functions.push_back({"main", "old/app.py", 3, {"argv"}});
    result.classes.push_back({"Server", "old/app.py", 10, {"Base"}, 2});

    const auto j = toJson(result);
    REQUIRE(j["functions"][0]["name"] == "main");
    REQUIRE(j["classes"][0]["methods"] == 2);
    REQUIRE_FALSE(j["functions"][0].contains("file"));

    const ParseResult restored = parseResultFromJson(j, "new/app.py");
    REQUIRE(restored.imports == result.imports);
    REQUIRE(restored.functions.size() == 1);
    REQUIRE(restored.functions[0].file == "new/app.py");
    REQUIRE(restored.functions[0].params == std::vector<std::string>{"argv"});
    REQUIRE(restored.classes[0].bases == std::vector<std::string>{"Base"});
    REQUIRE(restored.classes[0].methodCount == 2);

    SECTION("Malformed documents throw") {
        nlohmann::json broken = {{"imports", "not a list"}};
        REQUIRE_THROWS_AS(parseResultFromJson(broken, "x.py"), nlohmann::json::exception);
    }
}

TEST_CASE("applyParseResult rebinds declaring files", "[FileRecord]") {
    ParseResult result;
    result.functions.push_back({"run", "", 1, {}});
    result.classes.push_back({"Job", "", 2, {}, 0});

    FileRecord record;
    record.path = "jobs/runner.py";
    applyParseResult(record, result);

    REQUIRE(record.functions[0].file == "jobs/runner.py");
    REQUIRE(record.classes[0].file == "jobs/runner.py");
}
