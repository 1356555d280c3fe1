#include <catch2/catch_test_macros.hpp>
#include "structural_parser.hpp"
#include <algorithm>
#include <string>

namespace {

const FunctionEntry* findFunction(const ParseResult& result, const std::string& name) {
    auto it = std::find_if(result.functions.begin(), result.functions.end(),
        [&](const FunctionEntry& entry) { return entry.name == name; });
    return it == result.functions.end() ? nullptr : &*it;
}

const ClassEntry* findClass(const ParseResult& result, const std::string& name) {
    auto it = std::find_if(result.classes.begin(), result.classes.end(),
        [&](const ClassEntry& entry) { return entry.name == name; });
    return it == result.classes.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("StructuralParser extracts Python structure", "[StructuralParser]") {
    const std::string source =
        "import os\n"
        "import sys, json as j\n"
        "from .util import helper\n"
        "from ..pkg.mod import x\n"
        "\n"
        "class Foo(Base, metaclass=Meta):\n"
        "    def __init__(self, a, b=2):\n"
        "        pass\n"
        "\n"
        "    def run(self):\n"
        "        return 1\n"
        "\n"
        "def top(x, *args, **kwargs):\n"
        "    pass\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Python, "pkg/foo.py");

    REQUIRE(result.imports == std::vector<std::string>{"os", "sys", "json", ".util", "..pkg.mod"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "__init__");
    REQUIRE(result.functions[0].line == 7);
    REQUIRE(result.functions[0].file == "pkg/foo.py");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"self", "a", "b"});
    REQUIRE(result.functions[1].name == "run");
    REQUIRE(result.functions[2].name == "top");
    REQUIRE(result.functions[2].params == std::vector<std::string>{"x", "args", "kwargs"});

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Foo");
    REQUIRE(result.classes[0].line == 6);
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Base"});
    REQUIRE(result.classes[0].methodCount == 2);
}

TEST_CASE("StructuralParser extracts JavaScript structure", "[StructuralParser]") {
    const std::string source =
        "import { a, b } from \"./util\";\n"
        "import React from 'react';\n"
        "const fs = require(\"fs\");\n"
        "\n"
        "export function main(argv) {\n"
        "  return a(argv);\n"
        "}\n"
        "\n"
        "const helper = (x, y) => x + y;\n"
        "\n"
        "class Widget extends Base {\n"
        "  render() {\n"
        "    return 1;\n"
        "  }\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::JavaScript, "src/app.js");

    REQUIRE(result.imports == std::vector<std::string>{"./util", "react", "fs"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "main");
    REQUIRE(result.functions[0].line == 5);
    REQUIRE(result.functions[0].params == std::vector<std::string>{"argv"});
    REQUIRE(result.functions[1].name == "helper");
    REQUIRE(result.functions[1].params == std::vector<std::string>{"x", "y"});
    REQUIRE(result.functions[2].name == "render");
    REQUIRE(result.functions[2].line == 12);

    const ClassEntry* widget = findClass(result, "Widget");
    REQUIRE(widget != nullptr);
    REQUIRE(widget->line == 11);
    REQUIRE(widget->bases == std::vector<std::string>{"Base"});
    REQUIRE(widget->methodCount == 1);
}

TEST_CASE("StructuralParser joins multi-line JavaScript imports", "[StructuralParser]") {
    const std::string source =
        "import {\n"
        "  first,\n"
        "  second,\n"
        "} from \"../shared/names\";\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::TypeScript);
    REQUIRE(result.imports == std::vector<std::string>{"../shared/names"});
}

TEST_CASE("StructuralParser extracts C++ structure", "[StructuralParser]") {
    const std::string source =
        "#include <vector>\n"
        "#include \"util.hpp\"\n"
        "\n"
        "class Shape : public Base {\n"
        "public:\n"
        "    virtual double area() const;\n"
        "    void draw() {\n"
        "    }\n"
        "};\n"
        "\n"
        "double Shape::area() const {\n"
        "    return 0;\n"
        "}\n"
        "\n"
        "int main(int argc, char** argv) {\n"
        "    return 0;\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Cpp, "src/shape.cpp");

    REQUIRE(result.imports == std::vector<std::string>{"vector", "util.hpp"});

    // A declaration without a body is not a function header
    REQUIRE(findFunction(result, "area") == nullptr);
    REQUIRE(findFunction(result, "draw") != nullptr);
    REQUIRE(findFunction(result, "Shape::area") != nullptr);

    const FunctionEntry* mainFunction = findFunction(result, "main");
    REQUIRE(mainFunction != nullptr);
    REQUIRE(mainFunction->line == 15);
    REQUIRE(mainFunction->params == std::vector<std::string>{"argc", "argv"});

    const ClassEntry* shape = findClass(result, "Shape");
    REQUIRE(shape != nullptr);
    REQUIRE(shape->bases == std::vector<std::string>{"Base"});
    // draw() in the body plus Shape::area() outside it
    REQUIRE(shape->methodCount == 2);
}

TEST_CASE("StructuralParser extracts Go structure", "[StructuralParser]") {
    const std::string source =
        "package main\n"
        "\n"
        "import (\n"
        "\t\"fmt\"\n"
        "\t\"example.com/app/util\"\n"
        ")\n"
        "\n"
        "type Server struct {\n"
        "\taddr string\n"
        "}\n"
        "\n"
        "func (s *Server) Start(port int) error {\n"
        "\treturn nil\n"
        "}\n"
        "\n"
        "func main() {\n"
        "\tfmt.Println(\"hi\")\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Go, "main.go");

    REQUIRE(result.imports == std::vector<std::string>{"fmt", "example.com/app/util"});

    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "Start");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"port"});
    REQUIRE(result.functions[1].name == "main");
    REQUIRE(result.functions[1].params.empty());

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Server");
    REQUIRE(result.classes[0].methodCount == 1);
}

TEST_CASE("StructuralParser extracts Ruby structure", "[StructuralParser]") {
    const std::string source =
        "require 'json'\n"
        "require_relative 'lib/helper'\n"
        "\n"
        "class Greeter < Base\n"
        "  def greet(name)\n"
        "    puts name\n"
        "  end\n"
        "\n"
        "  def done?\n"
        "    true\n"
        "  end\n"
        "end\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Ruby, "greeter.rb");

    REQUIRE(result.imports == std::vector<std::string>{"json", "./lib/helper"});
    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "greet");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"name"});
    REQUIRE(result.functions[1].name == "done?");

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Base"});
    REQUIRE(result.classes[0].methodCount == 2);
}

TEST_CASE("StructuralParser ignores comments and strings", "[StructuralParser]") {
    StructuralParser parser;

    SECTION("Python comments and docstrings") {
        const std::string source =
            "# import hidden\n"
            "\"\"\"\n"
            "def not_a_function():\n"
            "\"\"\"\n"
            "import shown\n";
        const ParseResult result = parser.parse(source, Language::Python);
        REQUIRE(result.imports == std::vector<std::string>{"shown"});
        REQUIRE(result.functions.empty());
    }

    SECTION("Block comments in brace languages") {
        const std::string source =
            "/* function ghost() {\n"
            "} */\n"
            "// import x from './commented'\n"
            "function real() {\n"
            "}\n";
        const ParseResult result = parser.parse(source, Language::JavaScript);
        REQUIRE(result.imports.empty());
        REQUIRE(result.functions.size() == 1);
        REQUIRE(result.functions[0].name == "real");
        REQUIRE(result.functions[0].line == 4);
    }
}

TEST_CASE("StructuralParser records duplicate imports once", "[StructuralParser]") {
    StructuralParser parser;
    const ParseResult result = parser.parse("import os\nimport os\nimport re\n", Language::Python);
    REQUIRE(result.imports == std::vector<std::string>{"os", "re"});
}

TEST_CASE("StructuralParser degrades gracefully", "[StructuralParser]") {
    StructuralParser parser;

    SECTION("Malformed source yields what can be recognized") {
        const std::string source =
            "def broken(:\n"
            "    pass\n";
        const ParseResult result = parser.parse(source, Language::Python);
        REQUIRE(result.imports.empty());
        REQUIRE(result.functions.empty());
        REQUIRE(result.classes.empty());
    }

    SECTION("Empty content") {
        const ParseResult result = parser.parse("", Language::Go);
        REQUIRE(result.imports.empty());
        REQUIRE(result.functions.empty());
    }

    SECTION("NUL bytes are not source text") {
        const std::string binary("import os\0\0", 11);
        REQUIRE_THROWS_AS(parser.parse(binary, Language::Python, "bad.py"), ParseError);
    }

    SECTION("Languages without a parser are inert") {
        const ParseResult result = parser.parse("# Title\nimport nothing\n", Language::Markdown);
        REQUIRE(result.imports.empty());
        REQUIRE(parser.invocationCount() == 0);
    }
}

TEST_CASE("StructuralParser counts invocations", "[StructuralParser]") {
    StructuralParser parser;
    REQUIRE(parser.invocationCount() == 0);

    parser.parse("x = 1\n", Language::Python);
    parser.parse("let x = 1;\n", Language::JavaScript);
    REQUIRE(parser.invocationCount() == 2);

    parser.resetInvocationCount();
    REQUIRE(parser.invocationCount() == 0);
}

TEST_CASE("StructuralParser splits parameter lists", "[StructuralParser]") {
    SECTION("Name-first parameters") {
        REQUIRE(StructuralParser::parameterNames("a: int, b: Map<K, V> = {}", ParamStyle::NameFirst) ==
                std::vector<std::string>{"a", "b"});
        REQUIRE(StructuralParser::parameterNames("mut self, other: &Self", ParamStyle::NameFirst) ==
                std::vector<std::string>{"self", "other"});
        REQUIRE(StructuralParser::parameterNames("   ", ParamStyle::NameFirst).empty());
    }

    SECTION("Type-first parameters") {
        REQUIRE(StructuralParser::parameterNames("const std::string& name, int count = 3", ParamStyle::TypeFirst) ==
                std::vector<std::string>{"name", "count"});
        REQUIRE(StructuralParser::parameterNames("void", ParamStyle::TypeFirst).empty());
    }
}

TEST_CASE("StructuralParser extracts Java structure", "[StructuralParser]") {
    const std::string source =
        "package com.example.app;\n"
        "\n"
        "import java.util.List;\n"
        "import static org.junit.Assert.*;\n"
        "\n"
        "public class Service extends Base implements Runnable, Closeable {\n"
        "    public Service(int port) {\n"
        "    }\n"
        "\n"
        "    public void run() {\n"
        "        helper(1);\n"
        "    }\n"
        "\n"
        "    private static List<String> names(String prefix, int limit) {\n"
        "        return null;\n"
        "    }\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Java);

    REQUIRE(result.imports == std::vector<std::string>{"java.util.List", "org.junit.Assert.*"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "Service");
    REQUIRE(result.functions[0].line == 7);
    REQUIRE(result.functions[0].params == std::vector<std::string>{"port"});
    REQUIRE(result.functions[1].name == "run");
    REQUIRE(result.functions[1].params.empty());
    REQUIRE(result.functions[2].name == "names");
    REQUIRE(result.functions[2].params == std::vector<std::string>{"prefix", "limit"});
    REQUIRE(findFunction(result, "helper") == nullptr);

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Service");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Base", "Runnable", "Closeable"});
    REQUIRE(result.classes[0].methodCount == 3);
}

TEST_CASE("StructuralParser extracts C structure", "[StructuralParser]") {
    const std::string source =
        "#include <stdio.h>\n"
        "#include \"util.h\"\n"
        "\n"
        "struct point {\n"
        "    int x;\n"
        "    int y;\n"
        "};\n"
        "\n"
        "static int add(int a, int b)\n"
        "{\n"
        "    return a + b;\n"
        "}\n"
        "\n"
        "int main(void) {\n"
        "    puts(\"hi\");\n"
        "    return 0;\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::C);

    REQUIRE(result.imports == std::vector<std::string>{"stdio.h", "util.h"});

    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "add");
    REQUIRE(result.functions[0].line == 9);
    REQUIRE(result.functions[0].params == std::vector<std::string>{"a", "b"});
    REQUIRE(result.functions[1].name == "main");
    REQUIRE(result.functions[1].params.empty());

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "point");
    REQUIRE(result.classes[0].bases.empty());
    REQUIRE(result.classes[0].methodCount == 0);
}

TEST_CASE("StructuralParser extracts C# structure", "[StructuralParser]") {
    const std::string source =
        "using System;\n"
        "using System.Collections.Generic;\n"
        "\n"
        "namespace Demo\n"
        "{\n"
        "    public class Repo : BaseRepo, IDisposable\n"
        "    {\n"
        "        public Repo(string name)\n"
        "        {\n"
        "        }\n"
        "\n"
        "        public int Count(string key) => 0;\n"
        "\n"
        "        public void Dispose()\n"
        "        {\n"
        "        }\n"
        "    }\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::CSharp);

    REQUIRE(result.imports == std::vector<std::string>{"System", "System.Collections.Generic"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "Repo");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"name"});
    REQUIRE(result.functions[1].name == "Count");
    REQUIRE(result.functions[1].line == 12);
    REQUIRE(result.functions[1].params == std::vector<std::string>{"key"});
    REQUIRE(result.functions[2].name == "Dispose");

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Repo");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"BaseRepo", "IDisposable"});
    REQUIRE(result.classes[0].methodCount == 3);
}

TEST_CASE("StructuralParser extracts Kotlin structure", "[StructuralParser]") {
    const std::string source =
        "package app\n"
        "\n"
        "import kotlinx.coroutines.launch\n"
        "import app.util.Strings\n"
        "\n"
        "open class Worker(val id: Int) : Base(id), Runnable {\n"
        "    override fun run() {\n"
        "    }\n"
        "\n"
        "    fun schedule(delay: Long, retries: Int = 3): Boolean {\n"
        "        return true\n"
        "    }\n"
        "}\n"
        "\n"
        "fun main(args: Array<String>) {\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Kotlin);

    REQUIRE(result.imports == std::vector<std::string>{"kotlinx.coroutines.launch", "app.util.Strings"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "run");
    REQUIRE(result.functions[1].name == "schedule");
    REQUIRE(result.functions[1].params == std::vector<std::string>{"delay", "retries"});
    REQUIRE(result.functions[2].name == "main");
    REQUIRE(result.functions[2].line == 15);
    REQUIRE(result.functions[2].params == std::vector<std::string>{"args"});

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Worker");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Base", "Runnable"});
    REQUIRE(result.classes[0].methodCount == 2);
}

TEST_CASE("StructuralParser extracts Scala structure", "[StructuralParser]") {
    const std::string source =
        "package demo\n"
        "\n"
        "import scala.collection.mutable\n"
        "import demo.util.Helpers\n"
        "\n"
        "class Cache(size: Int) extends Base with Logging {\n"
        "  def get(key: String): Option[String] = {\n"
        "    None\n"
        "  }\n"
        "\n"
        "  override def toString: String = \"Cache\"\n"
        "}\n"
        "\n"
        "object Main {\n"
        "  def main(args: Array[String]): Unit = {\n"
        "  }\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Scala);

    REQUIRE(result.imports == std::vector<std::string>{"scala.collection.mutable", "demo.util.Helpers"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "get");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"key"});
    REQUIRE(result.functions[1].name == "toString");
    REQUIRE(result.functions[1].params.empty());
    REQUIRE(result.functions[2].name == "main");
    REQUIRE(result.functions[2].params == std::vector<std::string>{"args"});

    REQUIRE(result.classes.size() == 2);
    const ClassEntry* cache = findClass(result, "Cache");
    REQUIRE(cache != nullptr);
    REQUIRE(cache->bases == std::vector<std::string>{"Base", "Logging"});
    REQUIRE(cache->methodCount == 2);
    const ClassEntry* main = findClass(result, "Main");
    REQUIRE(main != nullptr);
    REQUIRE(main->methodCount == 1);
}

TEST_CASE("StructuralParser extracts Rust structure", "[StructuralParser]") {
    const std::string source =
        "use std::collections::HashMap;\n"
        "use crate::config::Settings;\n"
        "mod routes;\n"
        "\n"
        "pub struct Server {\n"
        "    port: u16,\n"
        "}\n"
        "\n"
        "impl Server {\n"
        "    pub fn new(port: u16) -> Self {\n"
        "        Server { port }\n"
        "    }\n"
        "\n"
        "    pub fn start(&self, host: &str) {\n"
        "    }\n"
        "}\n"
        "\n"
        "impl Default for Server {\n"
        "    fn default() -> Self {\n"
        "        Server::new(8080)\n"
        "    }\n"
        "}\n"
        "\n"
        "fn main() {\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Rust);

    REQUIRE(result.imports == std::vector<std::string>{"std::collections::HashMap", "crate::config::Settings", "./routes"});

    SECTION("Constructors named like keywords are kept") {
        const FunctionEntry* ctor = findFunction(result, "new");
        REQUIRE(ctor != nullptr);
        REQUIRE(ctor->line == 10);
        REQUIRE(ctor->params == std::vector<std::string>{"port"});

        const FunctionEntry* fallback = findFunction(result, "default");
        REQUIRE(fallback != nullptr);
        REQUIRE(fallback->line == 19);
        REQUIRE(fallback->params.empty());
    }

    SECTION("Receivers count as parameters") {
        const FunctionEntry* start = findFunction(result, "start");
        REQUIRE(start != nullptr);
        REQUIRE(start->params == std::vector<std::string>{"self", "host"});
    }

    SECTION("impl blocks attach methods to the struct") {
        REQUIRE(result.functions.size() == 4);
        REQUIRE(result.classes.size() == 1);
        REQUIRE(result.classes[0].name == "Server");
        REQUIRE(result.classes[0].methodCount == 3);
    }
}

TEST_CASE("StructuralParser extracts Swift structure", "[StructuralParser]") {
    const std::string source =
        "import Foundation\n"
        "import UIKit\n"
        "\n"
        "class ViewModel: BaseModel, Observable {\n"
        "    func load(id: Int, force: Bool) {\n"
        "    }\n"
        "\n"
        "    private func lock() {\n"
        "    }\n"
        "}\n"
        "\n"
        "extension ViewModel {\n"
        "    func refresh() {\n"
        "    }\n"
        "}\n"
        "\n"
        "func helper(_ value: String) -> String {\n"
        "    return value\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Swift);

    REQUIRE(result.imports == std::vector<std::string>{"Foundation", "UIKit"});

    REQUIRE(result.functions.size() == 4);
    REQUIRE(result.functions[0].name == "load");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"id", "force"});
    REQUIRE(result.functions[1].name == "lock");
    REQUIRE(result.functions[1].line == 8);
    REQUIRE(result.functions[2].name == "refresh");
    REQUIRE(result.functions[3].name == "helper");
    REQUIRE(result.functions[3].params == std::vector<std::string>{"value"});

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "ViewModel");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"BaseModel", "Observable"});
    // Two in the body, one from the extension
    REQUIRE(result.classes[0].methodCount == 3);
}

TEST_CASE("StructuralParser extracts Dart structure", "[StructuralParser]") {
    const std::string source =
        "import 'package:flutter/material.dart';\n"
        "import 'src/utils.dart';\n"
        "\n"
        "class Counter extends Base with Logger implements Comparable {\n"
        "  int value = 0;\n"
        "\n"
        "  void increment(int step) {\n"
        "    value += step;\n"
        "  }\n"
        "\n"
        "  int compareTo(Counter other) => value - other.value;\n"
        "}\n"
        "\n"
        "void main() {\n"
        "  runApp(Counter());\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Dart);

    REQUIRE(result.imports == std::vector<std::string>{"package:flutter/material.dart", "src/utils.dart"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "increment");
    REQUIRE(result.functions[0].params == std::vector<std::string>{"step"});
    REQUIRE(result.functions[1].name == "compareTo");
    REQUIRE(result.functions[1].params == std::vector<std::string>{"other"});
    REQUIRE(result.functions[2].name == "main");
    REQUIRE(findFunction(result, "runApp") == nullptr);

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Counter");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Base", "Logger", "Comparable"});
    REQUIRE(result.classes[0].methodCount == 2);
}

TEST_CASE("StructuralParser extracts PHP structure", "[StructuralParser]") {
    const std::string source =
        "<?php\n"
        "namespace App\\Http;\n"
        "\n"
        "use App\\Models\\User;\n"
        "require_once 'helpers.php';\n"
        "\n"
        "class UserController extends Controller implements Jsonable\n"
        "{\n"
        "    public function show($id, $format = 'json')\n"
        "    {\n"
        "        return $id;\n"
        "    }\n"
        "\n"
        "    private static function build(array $data) {\n"
        "    }\n"
        "}\n"
        "\n"
        "function helper($x) {\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Php);

    REQUIRE(result.imports == std::vector<std::string>{"App\\Models\\User", "./helpers.php"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "show");
    REQUIRE(result.functions[0].line == 9);
    REQUIRE(result.functions[0].params == std::vector<std::string>{"id", "format"});
    REQUIRE(result.functions[1].name == "build");
    REQUIRE(result.functions[1].params == std::vector<std::string>{"data"});
    REQUIRE(result.functions[2].name == "helper");
    REQUIRE(result.functions[2].params == std::vector<std::string>{"x"});

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "UserController");
    REQUIRE(result.classes[0].bases == std::vector<std::string>{"Controller", "Jsonable"});
    REQUIRE(result.classes[0].methodCount == 2);
}

TEST_CASE("StructuralParser extracts Lua structure", "[StructuralParser]") {
    const std::string source =
        "local json = require(\"dkjson\")\n"
        "local util = require \"app.util\"\n"
        "\n"
        "local M = {}\n"
        "\n"
        "function M.greet(name, greeting)\n"
        "  return greeting .. name\n"
        "end\n"
        "\n"
        "local function helper(x)\n"
        "  return x\n"
        "end\n"
        "\n"
        "M.run = function(opts)\n"
        "end\n"
        "\n"
        "return M\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Lua);

    REQUIRE(result.imports == std::vector<std::string>{"dkjson", "app.util"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "M.greet");
    REQUIRE(result.functions[0].line == 6);
    REQUIRE(result.functions[0].params == std::vector<std::string>{"name", "greeting"});
    REQUIRE(result.functions[1].name == "helper");
    REQUIRE(result.functions[1].params == std::vector<std::string>{"x"});
    REQUIRE(result.functions[2].name == "M.run");
    REQUIRE(result.functions[2].params == std::vector<std::string>{"opts"});

    REQUIRE(result.classes.empty());
}

TEST_CASE("StructuralParser extracts shell structure", "[StructuralParser]") {
    const std::string source =
        "#!/bin/bash\n"
        "source ./lib/common.sh\n"
        ". ./config.sh\n"
        "\n"
        "setup() {\n"
        "  echo \"setting up\"\n"
        "}\n"
        "\n"
        "function deploy {\n"
        "  if [ -n \"$1\" ]; then\n"
        "    setup\n"
        "  fi\n"
        "}\n"
        "\n"
        "function cleanup() {\n"
        "}\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Shell);

    REQUIRE(result.imports == std::vector<std::string>{"./lib/common.sh", "./config.sh"});

    REQUIRE(result.functions.size() == 3);
    REQUIRE(result.functions[0].name == "setup");
    REQUIRE(result.functions[0].line == 5);
    REQUIRE(result.functions[1].name == "deploy");
    REQUIRE(result.functions[1].line == 9);
    REQUIRE(result.functions[2].name == "cleanup");
    REQUIRE(result.functions[2].line == 15);
    for (const auto& function : result.functions) {
        REQUIRE(function.params.empty());
    }
}

TEST_CASE("StructuralParser treats Python member imports as sibling modules", "[StructuralParser]") {
    const std::string source =
        "from . import helper, util as u\n"
        "from .. import *\n"
        "from . import (models)\n"
        "from .pkg import thing\n";

    StructuralParser parser;
    const ParseResult result = parser.parse(source, Language::Python, "app/main.py");

    REQUIRE(result.imports == std::vector<std::string>{".helper", ".util", "..", ".models", ".pkg"});
}

TEST_CASE("StructuralParser survives very long lines", "[StructuralParser]") {
    StructuralParser parser;
    ParseResult result;

    SECTION("A huge comment between a header and its body") {
        const std::string source =
            "int main(void)\n"
            "/* " + std::string(40000, 'x') + " */\n"
            "{ return 0; }\n"
            "\n"
            "int other(int a) {\n"
            "  return a;\n"
            "}\n";
        REQUIRE_NOTHROW(result = parser.parse(source, Language::C));
        const FunctionEntry* other = findFunction(result, "other");
        REQUIRE(other != nullptr);
        REQUIRE(other->line == 5);
        REQUIRE(other->params == std::vector<std::string>{"a"});
    }

    SECTION("Minified lines after an open header") {
        std::string source = "int f()\n";
        for (int i = 0; i < 3; ++i) {
            source += std::string(30000, 'x') + "\n";
        }
        REQUIRE_NOTHROW(result = parser.parse(source, Language::C));
        REQUIRE(result.imports.empty());
    }

    SECTION("A multi-line import with enormous names") {
        std::string source = "import {\n";
        for (int i = 0; i < 20; ++i) {
            source += "  " + std::string(3000, 'a') + std::to_string(i) + ",\n";
        }
        source += "} from './big';\n";
        source += "import x from './small';\n";
        REQUIRE_NOTHROW(result = parser.parse(source, Language::TypeScript));
        REQUIRE(std::find(result.imports.begin(), result.imports.end(), "./small") != result.imports.end());
    }

    SECTION("Long lines inside a keyword block") {
        const std::string source =
            "class Store\n"
            "  DATA = \"" + std::string(30000, 'z') + "\"\n"
            "  def fetch(key)\n"
            "  end\n"
            "end\n";
        REQUIRE_NOTHROW(result = parser.parse(source, Language::Ruby));
        REQUIRE(findFunction(result, "fetch") != nullptr);
        REQUIRE(findClass(result, "Store") != nullptr);
    }
}
