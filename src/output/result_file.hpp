#pragma once

#include <refcheck/grading_session.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace refcheck {

/// The record of a run, consumed by the grading pipeline.
///
/// A JSON array of ``{"name": string, "success": bool, "score": number|null}``, one entry
/// per group in registration order.
class ResultFile
{
public:
    static constexpr std::string_view DEFAULT_PATH = "/var/lib/refcheck/test_results.json";

    explicit ResultFile(std::filesystem::path path);

    /// Remove the file if it exists. Throws ``HarnessError`` if it exists but cannot be removed.
    void remove() const;

    /// Replace the file with a record of ``reports``.
    /// The file is written next to its destination and renamed over it, so readers never see
    /// a partial record. Throws ``HarnessError`` on failure.
    void write(std::span<const GroupReport> reports) const;

    const std::filesystem::path& get_path() const noexcept { return path_; }

    /// The JSON text ``write`` puts into the file
    static std::string serialize(std::span<const GroupReport> reports);

private:
    std::filesystem::path path_;
};

} // namespace refcheck
