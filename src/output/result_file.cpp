#include "output/result_file.hpp"

#include <refcheck/exceptions.hpp>
#include <refcheck/grading_session.hpp>
#include <refcheck/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace refcheck {

ResultFile::ResultFile(std::filesystem::path path)
    : path_{std::move(path)} {}

void ResultFile::remove() const {
    std::error_code err;
    std::filesystem::remove(path_, err);

    if (err) {
        throw HarnessError(fmt::format("[!] Failed to remove old results at {}: {}", path_.string(), err.message()));
    }
}

std::string ResultFile::serialize(std::span<const GroupReport> reports) {
    // ordered: keep "name", "success", "score" in that order
    nlohmann::ordered_json record = nlohmann::ordered_json::array();

    for (const GroupReport& report : reports) {
        nlohmann::ordered_json entry;
        entry["name"] = report.name;
        entry["success"] = report.success;
        entry["score"] = report.score ? nlohmann::ordered_json(*report.score) : nlohmann::ordered_json(nullptr);

        record.push_back(std::move(entry));
    }

    return record.dump();
}

void ResultFile::write(std::span<const GroupReport> reports) const {
    std::error_code err;

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), err);

        if (err) {
            throw HarnessError(
                fmt::format("[!] Failed to create directory for results at {}: {}", path_.string(), err.message()));
        }
    }

    std::filesystem::path tmp_path = path_;
    tmp_path += fmt::format(".tmp.{}", ::getpid());

    {
        std::ofstream out_file{tmp_path, std::ios::binary | std::ios::trunc};
        out_file << serialize(reports);
        out_file.close();

        if (!out_file) {
            std::filesystem::remove(tmp_path, err);
            throw HarnessError(fmt::format("[!] Failed to write results to {}", tmp_path.string()));
        }
    }

    std::filesystem::rename(tmp_path, path_, err);

    if (err) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw HarnessError(fmt::format("[!] Failed to move results into place at {}: {}", path_.string(), err.message()));
    }

    LOG_DEBUG("Wrote {} group results to {}", reports.size(), path_.string());
}

} // namespace refcheck
