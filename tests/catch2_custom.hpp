#pragma once

#include "output/sink.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <unistd.h>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// String formatting without being able to see non-graphical chars is VERY annoying
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_all.hpp>         // IWYU pragma: export
#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

template <fmt::formattable T>
// inverse of Catch2's conditions as to not cause ambiguity
    requires(!is_range<T>::value && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch

/// Collects everything written to it, for inspecting serializer output
class StringSink : public refcheck::Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }

    void flush() override { ++num_flushes_; }

    const std::string& get_contents() const noexcept { return buffer_; }

    int get_num_flushes() const noexcept { return num_flushes_; }

private:
    std::string buffer_;
    int num_flushes_ = 0;
};

/// A fresh directory under the system temp dir, removed (with its contents) on destruction
class TempDir
{
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "refcheck-test-XXXXXX").string();

        if (::mkdtemp(pattern.data()) == nullptr) {
            FAIL("mkdtemp failed");
        }

        path_ = pattern;
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    const std::filesystem::path& get_path() const noexcept { return path_; }

    std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};
