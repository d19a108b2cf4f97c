#include "report_archive.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sys/stat.h>

using namespace std;
namespace fs = std::filesystem;

ReportArchive::ReportArchive(string directory)
    : directory_(move(directory))
{
}

bool ReportArchive::ensureDirectory(string &error) const
{
    error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
    {
        error = "Cannot create reports directory " + directory_ + ": " + ec.message();
        return false;
    }
    return true;
}

bool ReportArchive::isValidId(const string &id)
{
    if (id.empty() || id.size() > 64)
        return false;
    return all_of(id.begin(), id.end(), [](unsigned char c)
                  { return isalnum(c) || c == '_'; });
}

string ReportArchive::pathFor(const string &id, const string &extension) const
{
    return (fs::path(directory_) / (string(FILE_PREFIX) + id + "." + extension)).string();
}

bool ReportArchive::idTaken(const string &id) const
{
    if (issued_.count(id))
        return true;

    // Any format of the same id counts
    error_code ec;
    for (const auto &entry : fs::directory_iterator(directory_, ec))
    {
        if (entry.path().stem().string() == FILE_PREFIX + id)
            return true;
    }
    return false;
}

string ReportArchive::allocateId(chrono::system_clock::time_point time)
{
    lock_guard<mutex> lock(mutex_);

    string base = timefmt::toCompactId(time);
    string id = base;
    for (int n = 2; idTaken(id); n++)
        id = base + "_" + to_string(n);

    issued_.insert(id);
    return id;
}

vector<ReportEntry> ReportArchive::list() const
{
    vector<ReportEntry> entries;

    error_code ec;
    if (!fs::is_directory(directory_, ec))
        return entries;

    for (const auto &entry : fs::directory_iterator(directory_, ec))
    {
        if (!entry.is_regular_file(ec))
            continue;

        string filename = entry.path().filename().string();
        if (filename.rfind(FILE_PREFIX, 0) != 0)
            continue;

        ReportEntry report;
        report.filename = filename;
        report.id = entry.path().stem().string().substr(string(FILE_PREFIX).size());
        report.format = entry.path().extension().string();
        if (!report.format.empty() && report.format[0] == '.')
            report.format.erase(0, 1);

        struct stat info;
        if (stat(entry.path().c_str(), &info) == 0)
        {
            report.size = static_cast<uintmax_t>(info.st_size);
            report.created = chrono::system_clock::from_time_t(info.st_mtime);
        }
        else
        {
            log_debug("Cannot stat " + filename);
        }
        entries.push_back(report);
    }

    sort(entries.begin(), entries.end(), [](const ReportEntry &a, const ReportEntry &b)
         {
        if (a.created != b.created)
            return a.created > b.created;
        return a.filename > b.filename; });
    return entries;
}

bool ReportArchive::locate(const string &id, const string &format, string &path) const
{
    if (!isValidId(id) || !isValidId(format))
        return false;

    string candidate = pathFor(id, format);
    error_code ec;
    if (!fs::is_regular_file(candidate, ec))
        return false;

    path = candidate;
    return true;
}
