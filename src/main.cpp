/**
 * @file main.cpp
 * @brief Entry point for the cinecut command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - export: render a project to MP4/GIF
 *
 *          - preview: render one composed frame to PNG
 *
 * @note SIGINT/SIGTERM cancel a running export. Exit status is 0 on
 *       success, 1 on failure and 130 on cancellation.
 */

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include "cinecut/cancellation.hpp"
#include "cinecut/export_pipeline.hpp"
#include "cinecut/export_settings.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/preview.hpp"
#include "cinecut/project.hpp"

using namespace cinecut;

namespace {

constexpr int EXIT_CANCELLED = 130;

CancellationToken g_cancel;

extern "C" void handle_signal(int) { g_cancel.cancel(); }

void print_usage() {
  LOG_WARN("Usage: cinecut export <project.json> <output> [--format mp4|gif] "
           "[--resolution 720p|1080p|2k] [--fps N] [--quality low|medium|high]");
  LOG_WARN("       cinecut preview <project.json> <sourceTime> <out.png> "
           "[--resolution 720p|1080p|2k]");
}

/**
 * @brief Apply --format/--resolution/--fps/--quality on top of the
 *        project's export block.
 * @return false on an unknown flag or value (logged)
 */
bool parse_export_flags(int argc, char *argv[], int first,
                        ExportSettings &settings) {
  for (int i = first; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      LOG_ERROR("Missing value for {}", flag);
      return false;
    }
    const std::string value = argv[++i];

    bool ok = true;
    if (flag == "--format") {
      ok = parse_export_format(value, settings.format);
    } else if (flag == "--resolution") {
      ok = parse_resolution(value, settings.resolution);
    } else if (flag == "--quality") {
      ok = parse_quality(value, settings.quality);
    } else if (flag == "--fps") {
      char *end = nullptr;
      long fps = std::strtol(value.c_str(), &end, 10);
      ok = end && *end == '\0' && fps > 0 && fps <= 240;
      if (ok)
        settings.fps = static_cast<int>(fps);
    } else {
      LOG_ERROR("Unknown option: {}", flag);
      return false;
    }

    if (!ok) {
      LOG_ERROR("Invalid value for {}: {}", flag, value);
      return false;
    }
  }
  return true;
}

int run_export(int argc, char *argv[]) {
  if (argc < 4) {
    print_usage();
    return 1;
  }
  const std::string project_path = argv[2];
  const std::string output_path = argv[3];

  ExportJob job;
  if (!load_project(project_path, job.project))
    return 1;

  job.settings = job.project.export_settings;
  if (!parse_export_flags(argc, argv, 4, job.settings)) {
    print_usage();
    return 1;
  }
  job.output_path = output_path;
  job.cancel = &g_cancel;
  job.on_progress = [](const ExportProgress &p) {
    LOG_INFO("[Progress] {}% {}", p.progress, p.stage);
  };

  LOG_INFO("cinecut - Export");
  LOG_INFO("Project: {}", project_path);
  LOG_INFO("Output: {} ({}, {}, {}fps, {} quality)", output_path,
           to_string(job.settings.format), to_string(job.settings.resolution),
           job.settings.fps, to_string(job.settings.quality));

  ExportPipeline pipeline(std::move(job));
  const ExportResult result = pipeline.run();

  if (result.success)
    return 0;
  return result.cancelled ? EXIT_CANCELLED : 1;
}

int run_preview(int argc, char *argv[]) {
  if (argc < 5) {
    print_usage();
    return 1;
  }
  const std::string project_path = argv[2];
  char *end = nullptr;
  const double source_time = std::strtod(argv[3], &end);
  if (!end || *end != '\0' || source_time < 0) {
    LOG_ERROR("Invalid source time: {}", argv[3]);
    return 1;
  }
  const std::string png_path = argv[4];

  Project project;
  if (!load_project(project_path, project))
    return 1;

  ExportSettings settings = project.export_settings;
  if (!parse_export_flags(argc, argv, 5, settings)) {
    print_usage();
    return 1;
  }

  return write_preview_png(project, source_time, settings.resolution, png_path)
             ? 0
             : 1;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  try {
    if (command == "export")
      return run_export(argc, argv);
    if (command == "preview")
      return run_preview(argc, argv);
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  LOG_ERROR("Unknown command: {}", command);
  print_usage();
  return 1;
}
