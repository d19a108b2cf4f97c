#pragma once
#include <string>
#include "inspection_report.hpp"

// Turns an assembled report into a file
class ReportRenderer
{
public:
    virtual ~ReportRenderer() = default;

    // Request name, e.g. "json"
    virtual std::string format() const = 0;

    // File extension without the dot
    virtual std::string extension() const = 0;

    // Write the report to path, false with error filled on failure
    virtual bool render(const InspectionReport &report, const std::string &path, std::string &error) const = 0;
};

// Pretty printed JSON document with metadata, detections and summary
class JsonReportRenderer : public ReportRenderer
{
public:
    std::string format() const override { return "json"; }
    std::string extension() const override { return "json"; }
    bool render(const InspectionReport &report, const std::string &path, std::string &error) const override;
};
