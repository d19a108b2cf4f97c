#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "postprocess/defect_classes.hpp"
#include "report/report_assembler.hpp"
#include "utils/logging.hpp"

using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{
    Detection detection(const string &name, float confidence)
    {
        Detection det;
        det.class_name = name;
        det.confidence = confidence;
        det.bbox = BoundingBox{10, 10, 50, 60};
        det.frame_sequence = 1;
        det.timestamp = chrono::system_clock::now();
        return det;
    }

    // Fresh directory under the system temp dir, removed on scope exit
    struct TempDir
    {
        fs::path path;

        TempDir()
        {
            path = fs::temp_directory_path() / ("pipescope_reports_" + to_string(getpid()) + "_" + to_string(counter()++));
            fs::remove_all(path);
        }
        ~TempDir()
        {
            error_code ec;
            fs::remove_all(path, ec);
        }

        static int &counter()
        {
            static int n = 0;
            return n;
        }
    };

    struct Fixture
    {
        TempDir dir;
        shared_ptr<DetectionStore> store = make_shared<DetectionStore>();
        shared_ptr<ReportArchive> archive = make_shared<ReportArchive>(dir.path.string());
        ReportAssembler assembler{store, archive};

        Fixture()
        {
            logging::setLogLevel(logging::LogLevel::ERROR);
            assembler.registerRenderer(make_unique<JsonReportRenderer>());
        }
    };
}

TEST_CASE("severity table")
{
    using namespace defect_classes;
    CHECK(severityToString(severityOf("leak")) == "Critical");
    CHECK(severityToString(severityOf("crack")) == "High");
    CHECK(severityToString(severityOf("corrosion")) == "High");
    CHECK(severityToString(severityOf("rust")) == "Medium");
    CHECK(severityToString(severityOf("foreign_object")) == "Medium");
    CHECK(severityToString(severityOf("sediment")) == "Low");
    CHECK(severityToString(severityOf("bird")) == "Unknown");
}

TEST_CASE("assemble fills summary and severities for present classes only")
{
    auto report = ReportAssembler::assemble("20240301_142205", chrono::system_clock::now(), ReportMetadata{"Line 4", "kim", ""},
                                            {detection("crack", 0.8f), detection("leak", 0.6f), detection("crack", 0.7f)});
    CHECK(report.summary.total_detections == 3);
    CHECK(report.summary.by_class.at("crack") == 2);
    CHECK(report.severity_by_class.size() == 2);
    CHECK(report.severity_by_class.at("leak") == "Critical");
    CHECK(report.severity_by_class.count("rust") == 0);
    CHECK(report.metadata.location == "Line 4");
}

TEST_CASE("generate writes a json report into the archive")
{
    Fixture f;
    string session = f.store->currentSession();
    f.store->append(session, {detection("crack", 0.8f), detection("rust", 0.6f)});

    GeneratedReport result;
    PipelineError err = f.assembler.generate(session, ReportMetadata{"Sector 7", "J. Doe", "weekly"}, "json", result);
    REQUIRE_FALSE(err);
    CHECK(result.total_detections == 2);
    CHECK(result.filename == "inspection_report_" + result.id + ".json");
    REQUIRE(fs::exists(result.path));

    ifstream file(result.path);
    json doc = json::parse(file);
    CHECK(doc["metadata"]["location"] == "Sector 7");
    CHECK(doc["metadata"]["report_id"] == result.id);
    CHECK(doc["metadata"]["total_detections"] == 2);
    CHECK(doc["detections"].size() == 2);
    CHECK(doc["summary"]["by_class"]["rust"] == 1);
    CHECK(doc["severity_by_class"]["crack"] == "High");

    // Generation copies, the history is untouched
    CHECK(f.store->size(session) == 2);
}

TEST_CASE("generate rejects unknown formats and empty histories")
{
    Fixture f;
    string session = f.store->currentSession();
    GeneratedReport result;

    PipelineError empty = f.assembler.generate(session, ReportMetadata(), "json", result);
    CHECK(empty.code == ErrorCode::INVALID_ARGUMENT);
    CHECK(empty.message == "No detections available for report generation");
    CHECK_FALSE(fs::exists(f.dir.path));

    f.store->append(session, {detection("crack", 0.8f)});
    PipelineError pdf = f.assembler.generate(session, ReportMetadata(), "pdf", result);
    CHECK(pdf.category() == ErrorCategory::REQUEST);
    CHECK_FALSE(f.assembler.hasRenderer("pdf"));
}

TEST_CASE("reports generated within one second get distinct ids")
{
    Fixture f;
    string session = f.store->currentSession();
    f.store->append(session, {detection("crack", 0.8f)});

    auto now = chrono::system_clock::now();
    string first = f.archive->allocateId(now);
    string second = f.archive->allocateId(now);
    CHECK(second == first + "_2");
    CHECK(f.archive->allocateId(now) == first + "_3");

    GeneratedReport a, b;
    REQUIRE_FALSE(f.assembler.generate(session, ReportMetadata(), "json", a));
    REQUIRE_FALSE(f.assembler.generate(session, ReportMetadata(), "json", b));
    CHECK(a.id != b.id);
}

TEST_CASE("archive lists and locates reports")
{
    Fixture f;
    CHECK(f.archive->list().empty());

    string session = f.store->currentSession();
    f.store->append(session, {detection("leak", 0.9f)});
    GeneratedReport result;
    REQUIRE_FALSE(f.assembler.generate(session, ReportMetadata(), "json", result));

    // Unrelated files are ignored
    ofstream(f.dir.path / "notes.txt") << "x";

    auto entries = f.archive->list();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].id == result.id);
    CHECK(entries[0].format == "json");
    CHECK(entries[0].size > 0);

    string path;
    CHECK(f.archive->locate(result.id, "json", path));
    CHECK(path == result.path);
    CHECK_FALSE(f.archive->locate("20000101_000000", "json", path));
    CHECK_FALSE(f.archive->locate("../etc/passwd", "json", path));
    CHECK_FALSE(f.archive->locate(result.id, "../json", path));
}

TEST_CASE("report ids are restricted to a safe alphabet")
{
    CHECK(ReportArchive::isValidId("20240301_142205_2"));
    CHECK_FALSE(ReportArchive::isValidId(""));
    CHECK_FALSE(ReportArchive::isValidId("a/b"));
    CHECK_FALSE(ReportArchive::isValidId(".."));
    CHECK_FALSE(ReportArchive::isValidId(string(65, 'a')));
}
