#include "catch2_custom.hpp"

#include "output/result_file.hpp"

#include <refcheck/exceptions.hpp>
#include <refcheck/grading_session.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace refcheck;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in_file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};
}

} // namespace

TEST_CASE("Serialized records keep group order and field order") {
    std::vector<GroupReport> reports{{.name = "A", .success = true, .score = std::nullopt},
                                     {.name = "B", .success = false, .score = 0.5}};

    REQUIRE(ResultFile::serialize(reports) ==
            R"([{"name":"A","success":true,"score":null},{"name":"B","success":false,"score":0.5}])");
}

TEST_CASE("An empty run is an empty array") {
    REQUIRE(ResultFile::serialize({}) == "[]");
}

TEST_CASE("Write replaces the previous record") {
    TempDir dir;
    ResultFile file{dir / "nested" / "results.json"};

    file.write(std::vector<GroupReport>{{.name = "old", .success = false, .score = std::nullopt}});
    file.write(std::vector<GroupReport>{{.name = "new", .success = true, .score = 1.0}});

    REQUIRE(read_file(file.get_path()) == R"([{"name":"new","success":true,"score":1.0}])");

    // No temporaries are left behind
    REQUIRE(std::distance(std::filesystem::directory_iterator{dir / "nested"}, std::filesystem::directory_iterator{}) ==
            1);
}

TEST_CASE("Removing a missing record is fine") {
    TempDir dir;
    ResultFile file{dir / "results.json"};

    REQUIRE_NOTHROW(file.remove());

    file.write({});
    REQUIRE(std::filesystem::exists(file.get_path()));

    file.remove();
    REQUIRE_FALSE(std::filesystem::exists(file.get_path()));
}

TEST_CASE("Unwritable destinations raise HarnessError") {
    TempDir dir;
    std::filesystem::create_directories(dir / "results.json");

    REQUIRE_THROWS_AS(ResultFile{dir / "results.json"}.write({}), HarnessError);
}
