#include "defect_classes.hpp"
#include <unordered_map>

using namespace std;

namespace defect_classes
{
    Severity severityOf(const string &class_name)
    {
        static const unordered_map<string, Severity> table = {
            {"leak", Severity::CRITICAL},
            {"crack", Severity::HIGH},
            {"corrosion", Severity::HIGH},
            {"rust", Severity::MEDIUM},
            {"foreign_object", Severity::MEDIUM},
            {"sediment", Severity::LOW},
        };

        auto it = table.find(class_name);
        return it != table.end() ? it->second : Severity::UNKNOWN;
    }

    string severityToString(Severity severity)
    {
        switch (severity)
        {
        case Severity::CRITICAL:
            return "Critical";
        case Severity::HIGH:
            return "High";
        case Severity::MEDIUM:
            return "Medium";
        case Severity::LOW:
            return "Low";
        default:
            return "Unknown";
        }
    }

    cv::Scalar colorOf(const string &class_name)
    {
        static const unordered_map<string, cv::Scalar> table = {
            {"foreign_object", cv::Scalar(0, 0, 255)},
            {"crack", cv::Scalar(0, 165, 255)},
            {"rust", cv::Scalar(0, 140, 255)},
            {"corrosion", cv::Scalar(0, 255, 255)},
            {"sediment", cv::Scalar(139, 69, 19)},
            {"leak", cv::Scalar(255, 0, 0)},
        };

        auto it = table.find(class_name);
        return it != table.end() ? it->second : cv::Scalar(0, 255, 0);
    }

    const vector<string> &defaultClassNames()
    {
        static const vector<string> names = {"foreign_object", "crack", "rust", "corrosion", "sediment", "leak"};
        return names;
    }

} // namespace defect_classes
