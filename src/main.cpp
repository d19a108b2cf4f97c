#include "backend/backend_factory.hpp"
#include "communication/api_server.hpp"
#include "communication/stream_broadcaster.hpp"
#include "history/detection_store.hpp"
#include "pipeline/pipeline_controller.hpp"
#include "report/report_archive.hpp"
#include "report/report_assembler.hpp"
#include "report/report_renderer.hpp"
#include "utils/args.hpp"
#include "utils/config.hpp"
#include "utils/debug.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"
#include <memory>
#include <string>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  // Defaults -> config file -> environment -> flags
  AppConfig config;
  string error;
  if (!loadConfig(argc, argv, config, error))
  {
    log_error(error);
    return 1;
  }

  // set log level from configuration
  logging::LogLevel level = logging::LogLevel::INFO;
  if (!logging::parseLogLevel(config.logging.level, level))
    log_warning("Unknown log level '" + config.logging.level + "', using info");
  logging::setLogLevel(level);
  logging::setShowTimestamp(config.logging.timestamps);
  if (!config.logging.file.empty() && !logging::setFileLogging(true, config.logging.file))
    log_error("Cannot write log file " + config.logging.file + ", logging to console only");

  // Print startup and configuration information
  debug::printStartup("PipeScope", version);
  debug::printConfig(config);

  SourceDescriptor source;
  BackendDescriptor backend;
  if (!config.sourceDescriptor(source, error) || !config.backendDescriptor(backend, error))
  {
    log_error(error);
    return 1;
  }

  auto store = make_shared<DetectionStore>();
  auto broadcaster = make_shared<StreamBroadcaster>(config.stream.queue_depth, config.stream.jpeg_quality);
  auto controller = make_shared<PipelineController>(store, broadcaster, config.pipelineSettings());

  PipelineError configured = controller->configure(source, backend);
  if (configured)
  {
    log_error(configured.message);
    return 1;
  }

  auto archive = make_shared<ReportArchive>(config.reports_dir);
  auto reports = make_shared<ReportAssembler>(store, archive);
  reports->registerRenderer(make_unique<JsonReportRenderer>());

  ApiServerSettings server_settings;
  server_settings.host = config.server.host;
  server_settings.port = config.server.port;
  server_settings.worker_threads = config.server.worker_threads;
  server_settings.ping_interval_s = config.server.ping_interval_s;
  server_settings.version = version;

  ApiServer server(controller, store, broadcaster, reports, archive, server_settings);
  if (!server.start())
    return 1;

  // Start the pipeline right away if requested, otherwise wait for /api/pipeline/start
  if (config.autostart)
  {
    PipelineError err = controller->start();
    if (err)
      log_error("Autostart failed (" + errorCategoryToString(err.category()) + "): " + err.message);
  }

  signals::setupSignalHandlers();
  signals::waitForShutdown();

  PipelineError stopped = controller->stop();
  if (stopped && !stopped.is(ErrorCode::NOT_RUNNING))
    log_warning(stopped.message);
  server.stop();

  log_info("PipeScope shut down");
  return 0;
}
