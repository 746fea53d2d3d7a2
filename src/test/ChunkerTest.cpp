#include "TestSupport.hpp"

#include "text_utils.hpp"

using namespace code_context;
using code_context::testing::numbered_lines;
using code_context::testing::run;

namespace {

// Fragments must tile [1, line_count] in order and rebuild the input text.
void assert_partition(const std::vector<Fragment>& fragments, const std::string& content) {
    assert(!fragments.empty());
    const int line_count = static_cast<int>(split_lines(content).size());

    int expected_start = 1;
    std::string rebuilt;
    std::set<std::string> ids;
    for (size_t i = 0; i < fragments.size(); ++i) {
        const auto& f = fragments[i];
        assert(f.start_line == expected_start);
        assert(f.end_line >= f.start_line);
        assert(ids.insert(f.id).second && "fragment ids must be unique");
        if (i > 0) rebuilt += '\n';
        rebuilt += f.content;
        expected_start = f.end_line + 1;
    }
    assert(fragments.back().end_line == line_count);
    assert(rebuilt == content);
}

std::string typescript_file_with_function_at_line_10() {
    std::string content;
    for (int i = 1; i <= 80; ++i) {
        if (i > 1) content += '\n';
        if (i == 10) content += "export function foo() {";
        else content += "  statement " + std::to_string(i) + ";";
    }
    return content;
}

} // namespace

int main() {
    run("leading lines become an 'other' fragment before the first function", [] {
        const auto content = typescript_file_with_function_at_line_10();
        auto fragments = CodeChunker::chunk(content, "typescript");

        assert(fragments.size() == 2);
        assert(fragments[0].kind == FragmentKind::Other);
        assert(fragments[0].start_line == 1 && fragments[0].end_line == 9);
        assert(fragments[1].kind == FragmentKind::Function);
        assert(fragments[1].start_line == 10 && fragments[1].end_line == 80);
        assert(fragments[1].content.rfind("export function foo() {", 0) == 0);
        assert(fragments[0].id == "chunk_1" && fragments[1].id == "chunk_2");
        assert_partition(fragments, content);
    });

    run("python classes and indented methods split the file", [] {
        const std::string content =
            "import os\n"
            "from typing import List\n"
            "\n"
            "class Foo:\n"
            "    def bar(self):\n"
            "        return 1\n"
            "\n"
            "def baz():\n"
            "    pass";
        auto fragments = CodeChunker::chunk(content, "python");

        assert(fragments.size() == 4);
        assert(fragments[0].kind == FragmentKind::Other && fragments[0].end_line == 3);
        assert(fragments[1].kind == FragmentKind::Class && fragments[1].start_line == 4 && fragments[1].end_line == 4);
        assert(fragments[2].kind == FragmentKind::Function && fragments[2].start_line == 5 && fragments[2].end_line == 7);
        assert(fragments[3].kind == FragmentKind::Function && fragments[3].start_line == 8 && fragments[3].end_line == 9);
        // Indentation is kept in the fragment text.
        assert(fragments[2].content.rfind("    def bar(self):", 0) == 0);
        assert_partition(fragments, content);
    });

    run("file without boundaries is a single 'other' fragment", [] {
        const std::string content = "# Title\n\nSome prose without code.";
        auto fragments = CodeChunker::chunk(content, "markdown");
        assert(fragments.size() == 1);
        assert(fragments[0].kind == FragmentKind::Other);
        assert(fragments[0].start_line == 1 && fragments[0].end_line == 3);
        assert(fragments[0].content == content);
    });

    run("empty and trailing-newline content still partition", [] {
        auto empty = CodeChunker::chunk("", "typescript");
        assert(empty.size() == 1);
        assert(empty[0].start_line == 1 && empty[0].end_line == 1);

        const std::string trailing = "def a():\n    pass\n";
        auto fragments = CodeChunker::chunk(trailing, "python");
        assert(fragments.size() == 1);
        assert(fragments[0].kind == FragmentKind::Function);
        assert(fragments[0].end_line == 3);
        assert_partition(fragments, trailing);
    });

    run("unknown languages use the generic keywords", [] {
        const std::string content =
            "use std::fmt;\n"
            "struct Point {\n"
            "    x: i32,\n"
            "}\n"
            "fn main() {\n"
            "    println!(\"hi\");\n"
            "}";
        auto fragments = CodeChunker::chunk(content, "rust");
        assert(fragments.size() == 3);
        assert(fragments[1].kind == FragmentKind::Class && fragments[1].start_line == 2);
        assert(fragments[2].kind == FragmentKind::Function && fragments[2].start_line == 5);
        assert_partition(fragments, content);
    });

    run("first matching pattern wins when several match", [] {
        // Matches both the C function pattern and the struct pattern.
        auto fragments = CodeChunker::chunk("struct Foo() {\n}", "cpp");
        assert(fragments.size() == 1);
        assert(fragments[0].kind == FragmentKind::Function);

        auto typed = CodeChunker::chunk("export type Id = string;", "typescript");
        assert(typed[0].kind == FragmentKind::Interface);
    });

    run("chunking is deterministic and covers generated inputs", [] {
        const std::vector<std::pair<std::string, std::string>> samples = {
            {numbered_lines(50), "java"},
            {"public class A {\n  public void run() {\n  }\n}\n", "java"},
            {"int main() {\n  return 0;\n}\nclass X {};\n", "cpp"},
            {"class A:\n  pass\nclass B:\n  pass", "python"},
            {"\n\n\n", "typescript"},
            {"const handler = async (req) => {\n};\ninterface Props {}\n", "javascript"},
        };
        for (const auto& [content, language] : samples) {
            auto first = CodeChunker::chunk(content, language);
            auto second = CodeChunker::chunk(content, language);
            assert(first.size() == second.size());
            for (size_t i = 0; i < first.size(); ++i) {
                assert(first[i].start_line == second[i].start_line);
                assert(first[i].end_line == second[i].end_line);
                assert(first[i].kind == second[i].kind);
            }
            assert_partition(first, content);
        }
    });

    run("dependencies and exports are deduplicated in first-seen order", [] {
        const std::string content =
            "import { a } from './a';\n"
            "import b from \"./b\";\n"
            "const c = require('c');\n"
            "import { a as a2 } from './a';\n"
            "export function foo() {}\n"
            "export class Bar {}\n"
            "export default function main() {}\n"
            "export const x = 1;\n"
            "export function foo() {}";
        auto deps = CodeChunker::extract_dependencies(content, "typescript");
        assert((deps == std::vector<std::string>{"./a", "./b", "c"}));

        auto exports = CodeChunker::extract_exports(content, "typescript");
        assert((exports == std::vector<std::string>{"foo", "Bar", "main", "x"}));

        auto py = CodeChunker::extract_dependencies("import os\nfrom typing import List\nimport os", "python");
        assert((py == std::vector<std::string>{"os", "typing"}));

        auto java = CodeChunker::extract_dependencies("import java.util.List;\nclass A {}", "java");
        assert((java == std::vector<std::string>{"java.util.List"}));

        assert(CodeChunker::extract_dependencies("#include <vector>", "cpp").empty());
        assert(CodeChunker::extract_exports("def f(): pass", "python").empty());
    });

    run("language detection and path filtering", [] {
        assert(CodeChunker::detect_language("src/App.TSX") == "typescript");
        assert(CodeChunker::detect_language("lib/util.py") == "python");
        assert(CodeChunker::detect_language("include/x.h") == "c");
        assert(CodeChunker::detect_language("Makefile") == "text");

        assert(CodeChunker::should_process_file("src/main.ts"));
        assert(!CodeChunker::should_process_file("node_modules/pkg/index.js"));
        assert(!CodeChunker::should_process_file("logs/server.log"));
        assert(!CodeChunker::should_process_file(".git/config"));
        assert(!CodeChunker::should_process_file("dist/bundle.js"));
    });

    run("make_source_file fills the record", [] {
        auto file = make_source_file("f1", "web/app.ts",
                                     "import x from './x';\nexport function app() {\n  return x;\n}", "s1");
        assert(file.id == "f1");
        assert(file.belongs_to("s1"));
        assert(file.language == "typescript");
        assert(file.fragments.size() == 2);
        assert(file.dependencies.size() == 1 && file.dependencies[0] == "./x");
        assert(file.exports.size() == 1 && file.exports[0] == "app");
        assert(file.line_count() == 4);
        assert(file.uploaded_at > 0);
        assert(file.embedded_fragment_count() == 0);
    });

    run("megabyte-long single lines are chunked without matching the whole line", [] {
        const std::string minified = "import { a } from 'x';" + std::string(1 << 20, 'a');
        auto js = CodeChunker::chunk(minified, "javascript");
        assert(js.size() == 1);
        assert(js[0].kind == FragmentKind::Other);
        assert(js[0].content.size() == minified.size());
        assert((CodeChunker::extract_dependencies(minified, "javascript") == std::vector<std::string>{"x"}));
        assert(CodeChunker::extract_exports(minified, "javascript").empty());

        const std::string table(1 << 20, 'A');
        auto cpp = CodeChunker::chunk(table, "cpp");
        assert(cpp.size() == 1);
        assert(cpp[0].start_line == 1 && cpp[0].end_line == 1);

        auto file = make_source_file("big", "bundle.min.js", minified + "\nfunction after() {}");
        assert(file.fragments.size() == 2);
        assert(file.fragments[1].kind == FragmentKind::Function && file.fragments[1].start_line == 2);
    });

    run("text helpers respect UTF-8 boundaries", [] {
        const std::string accented = "a\xC3\xA9" "b"; // "aéb"
        assert(utf8_length(accented) == 3);
        assert(utf8_prefix(accented, 2) == "a\xC3\xA9");
        assert(utf8_prefix(accented, 1) == "a");
        assert(utf8_prefix(accented, 0).empty());
        assert(utf8_prefix(accented, 10) == accented);
        assert(sanitize_utf8("ok\xC3") == "ok?");
        assert(sanitize_utf8(accented) == accented);
        assert((split_lines("a\n") == std::vector<std::string>{"a", ""}));
        assert(trim("  x \t") == "x");
    });

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
