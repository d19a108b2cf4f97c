#include "report_renderer.hpp"
#include "communication/json_codec.hpp"
#include <fstream>

using namespace std;
using json = nlohmann::json;

bool JsonReportRenderer::render(const InspectionReport &report, const string &path, string &error) const
{
    ofstream file(path);
    if (!file.is_open())
    {
        error = "Cannot open " + path + " for writing";
        return false;
    }

    try
    {
        json j = report;
        file << j.dump(2) << '\n';
    }
    catch (const json::exception &e)
    {
        error = string("JSON encoding failed: ") + e.what();
        return false;
    }

    if (!file.good())
    {
        error = "Write to " + path + " failed";
        return false;
    }
    return true;
}
