#include "catch2_custom.hpp"

#include <refcheck/checks.hpp>
#include <refcheck/privilege/credentials.hpp>
#include <refcheck/process/command.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace refcheck;

namespace {

ExecOptions test_options() {
    ExecOptions opts;
    opts.credentials = Credentials::current();
    opts.env = Environment{{"PATH", "/usr/bin:/bin"}, {"LC_ALL", "C"}};
    return opts;
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out{path};
    out << contents;
}

/// Shell stands in for the Python interpreter
CheckTools shell_tools() {
    return {.interpreter = {"sh"}, .pylint = {"true"}, .mypy = {"true"}};
}

} // namespace

TEST_CASE("contains_flag looks for the flag in the script's output") {
    TempDir dir;
    write_file(dir / "solve.py", "echo 'here it is: FLAG{abc}'\n");

    REQUIRE(contains_flag("FLAG{abc}", dir / "solve.py", false, test_options(), shell_tools()));
    REQUIRE_FALSE(contains_flag("FLAG{xyz}", dir / "solve.py", true, test_options(), shell_tools()));
}

TEST_CASE("contains_flag requires a clean exit") {
    TempDir dir;
    write_file(dir / "solve.py", "echo FLAG{abc}; exit 1\n");

    REQUIRE_FALSE(contains_flag("FLAG{abc}", dir / "solve.py", true, test_options(), shell_tools()));
}

TEST_CASE("Linters pass on silence and fail on output") {
    TempDir dir;
    write_file(dir / "main.py", "print('hi')\n");

    CheckTools tools = shell_tools();
    REQUIRE(run_pylint({dir / "main.py"}, test_options(), tools));
    REQUIRE(run_mypy({dir / "main.py"}, test_options(), tools));

    // echo prints its arguments, like a linter reporting on each file
    tools.pylint = {"echo", "main.py:1:0: C0114"};
    tools.mypy = {"echo", "error: Missing return statement"};
    REQUIRE_FALSE(run_pylint({dir / "main.py"}, test_options(), tools));
    REQUIRE_FALSE(run_mypy({dir / "main.py"}, test_options(), tools));
}

TEST_CASE("Linters have nothing to do without files") {
    CheckTools tools{.interpreter = {"sh"}, .pylint = {"/nonexistent/pylint"}, .mypy = {"/nonexistent/mypy"}};

    REQUIRE(run_pylint({}, test_options(), tools));
    REQUIRE(run_mypy({}, test_options(), tools));
}

TEST_CASE("Python files are found recursively, hidden ones skipped") {
    TempDir dir;
    write_file(dir / "main.py", "");
    write_file(dir / "pkg" / "util.py", "");
    write_file(dir / ".hidden.py", "");
    write_file(dir / "notes.txt", "");

    std::vector<std::filesystem::path> found = find_python_files(dir.get_path());

    REQUIRE(found.size() == 2);
    REQUIRE(found[0].string() == (dir / "main.py").string());
    REQUIRE(found[1].string() == (dir / "pkg" / "util.py").string());

    REQUIRE(find_python_files(dir / "missing").empty());
}

TEST_CASE("check_all_python_files runs both linters") {
    TempDir dir;
    write_file(dir / "src" / "main.py", "");

    CheckTools tools = shell_tools();

    SECTION("No Python files") {
        TempDir empty;
        tools.pylint = {"/nonexistent/pylint"};
        REQUIRE(check_all_python_files(empty.get_path(), test_options(), tools));
    }

    SECTION("Both pass") {
        REQUIRE(check_all_python_files(dir.get_path(), test_options(), tools));
    }

    SECTION("A failing pylint does not skip mypy") {
        std::filesystem::path marker = dir / "mypy_ran";
        tools.pylint = {"echo", "style issue"};
        tools.mypy = {"sh", "-c", "touch " + marker.string(), "sh"};

        REQUIRE_FALSE(check_all_python_files(dir.get_path(), test_options(), tools));
        REQUIRE(std::filesystem::exists(marker));
    }
}
