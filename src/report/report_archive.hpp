#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ReportEntry
{
    std::string filename;
    std::string id;
    std::string format; // File extension
    std::chrono::system_clock::time_point created;
    uintmax_t size = 0;
};

// Directory of generated reports, named inspection_report_<id>.<ext>
class ReportArchive
{
public:
    explicit ReportArchive(std::string directory);

    const std::string &directory() const { return directory_; }

    // Create the directory when missing
    bool ensureDirectory(std::string &error) const;

    // Unique id for a report created at time: YYYYMMDD_HHMMSS, then _2, _3 ...
    std::string allocateId(std::chrono::system_clock::time_point time);

    std::string pathFor(const std::string &id, const std::string &extension) const;

    // Newest first, missing directory -> empty list
    std::vector<ReportEntry> list() const;

    // Path of an existing report, false when the id is malformed or the file does not exist
    bool locate(const std::string &id, const std::string &format, std::string &path) const;

    // Digits, letters and '_' only, so an id can never leave the directory
    static bool isValidId(const std::string &id);

    static constexpr const char *FILE_PREFIX = "inspection_report_";

private:
    bool idTaken(const std::string &id) const;

    std::string directory_;
    mutable std::mutex mutex_;
    std::set<std::string> issued_;
};
