#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Known defect classes of the inspection model, their severity and overlay color
namespace defect_classes
{
    enum class Severity
    {
        CRITICAL,
        HIGH,
        MEDIUM,
        LOW,
        UNKNOWN
    };

    // leak -> CRITICAL, crack/corrosion -> HIGH, rust/foreign_object -> MEDIUM,
    // sediment -> LOW, anything else -> UNKNOWN
    Severity severityOf(const std::string &class_name);

    // "Critical", "High", "Medium", "Low", "Unknown"
    std::string severityToString(Severity severity);

    // BGR overlay color, green for classes outside the table
    cv::Scalar colorOf(const std::string &class_name);

    // Default class list in model output order
    const std::vector<std::string> &defaultClassNames();

} // namespace defect_classes
