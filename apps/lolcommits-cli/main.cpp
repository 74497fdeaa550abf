/**
 * lolcommits-cli: capture a webcam frame for a git commit, composite it and save it.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/lolcommits_cli --sha <sha> --message <msg> --repo <name> [options]
 * Inspect a saved image: ./build/lolcommits_cli --inspect <file.png>
 */

#include <lolcommits/app/config.hpp>
#include <lolcommits/app/logging.hpp>
#include <lolcommits/app/pipeline_runner.hpp>
#ifdef LOLCOMMITS_HAS_TBB
#include <lolcommits/app/pipeline_runner_tbb.hpp>
#endif
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/io/output_path.hpp>
#include <lolcommits/io/png_metadata.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <lolcommits/vision/frame_source.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

namespace la = lolcommits::app;
namespace lc = lolcommits::core;
namespace lv = lolcommits::vision;

void print_usage() {
  std::cout << "Usage: lolcommits_cli --sha <sha> --message <msg> [options]\n"
            << "  --config <path>        Config file (key=value); default: built-in\n"
            << "  --sha <sha>            Commit SHA (required)\n"
            << "  --message <msg>        Full commit message (required)\n"
            << "  --repo <name>          Repository name\n"
            << "  --branch <name>        Branch name\n"
            << "  --author <name>        Commit author\n"
            << "  --timestamp <ts>       \"YYYY-mm-dd HH:MM:SS\" (default: now)\n"
            << "  --files-changed <n>    Diff stats\n"
            << "  --insertions <n>\n"
            << "  --deletions <n>\n"
            << "  --input <path>         Use an image file instead of the camera\n"
            << "  --output <path>        Output file (default: {images_dir}/{repo}-{time}-{sha}.png)\n"
            << "  --backend <type>       Override segmenter: mock | onnx\n"
            << "  --model <path>         Override model path (required for --backend onnx)\n"
            << "  --chyron / --no-chyron Force the text overlay on or off\n"
            << "  --quiet                A busy camera is not an error\n"
            << "  --inspect <png>        Print the commit metadata stored in an image and exit\n"
            << "\nLog level: log_level= in config, or SPDLOG_LEVEL=debug in the environment.\n";
}

int fail(std::string_view stage, std::string_view reason) {
  std::cerr << "lolcommits: " << stage << " failed: " << reason << "\n";
  return 1;
}

int inspect(const std::filesystem::path& path) {
  auto commit = lolcommits::io::load_commit_metadata(path);
  if (!commit) {
    return fail("inspect", lc::to_string(lc::PipelineError::ArtifactDecodeError));
  }
  std::cout << "revision:  " << commit->sha << "\n"
            << "repo:      " << commit->repo_name << "\n"
            << "branch:    " << commit->branch_name << "\n"
            << "timestamp: " << commit->timestamp << "\n"
            << "type:      " << commit->commit_type << "\n";
  if (!commit->scope.empty()) std::cout << "scope:     " << commit->scope << "\n";
  if (commit->author) std::cout << "author:    " << *commit->author << "\n";
  if (!commit->stats.empty()) std::cout << "diff:      " << commit->diff_stats_string() << "\n";
  std::cout << "message:   " << commit->message << "\n";
  return 0;
}

std::uint32_t parse_count(const std::string& flag, const std::string& value) {
  const unsigned long n = std::stoul(value);
  if (n > UINT32_MAX) throw std::out_of_range(flag);
  return static_cast<std::uint32_t>(n);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string output_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string inspect_path;
  std::optional<bool> chyron_override;
  bool quiet = false;

  lc::CommitMetadata commit;
  bool have_sha = false;
  bool have_message = false;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      const bool has_value = i + 1 < argc;
      if (arg == "--config" && has_value) {
        config_path = argv[++i];
      } else if (arg == "--sha" && has_value) {
        commit.sha = argv[++i];
        have_sha = true;
      } else if (arg == "--message" && has_value) {
        commit.message = argv[++i];
        have_message = true;
      } else if (arg == "--repo" && has_value) {
        commit.repo_name = argv[++i];
      } else if (arg == "--branch" && has_value) {
        commit.branch_name = argv[++i];
      } else if (arg == "--author" && has_value) {
        commit.author = argv[++i];
      } else if (arg == "--timestamp" && has_value) {
        commit.timestamp = argv[++i];
      } else if (arg == "--files-changed" && has_value) {
        commit.stats.files_changed = parse_count(arg, argv[++i]);
      } else if (arg == "--insertions" && has_value) {
        commit.stats.insertions = parse_count(arg, argv[++i]);
      } else if (arg == "--deletions" && has_value) {
        commit.stats.deletions = parse_count(arg, argv[++i]);
      } else if (arg == "--input" && has_value) {
        input_path = argv[++i];
      } else if (arg == "--output" && has_value) {
        output_path = argv[++i];
      } else if (arg == "--backend" && has_value) {
        backend_override = argv[++i];
      } else if (arg == "--model" && has_value) {
        model_override = argv[++i];
      } else if (arg == "--inspect" && has_value) {
        inspect_path = argv[++i];
      } else if (arg == "--chyron") {
        chyron_override = true;
      } else if (arg == "--no-chyron") {
        chyron_override = false;
      } else if (arg == "--quiet" || arg == "-q") {
        quiet = true;
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown or incomplete argument: " << arg << "\n";
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception& e) {
    return fail("arguments", e.what());
  }

  la::PipelineConfig cfg;
  try {
    cfg = config_path.empty() ? la::default_config() : la::load_config(config_path);
  } catch (const std::exception& e) {
    return fail("config", e.what());
  }
  la::init_logging(cfg.log_level);

  if (!inspect_path.empty()) {
    return inspect(inspect_path);
  }

  if (!have_sha || !have_message) {
    std::cerr << "--sha and --message are required\n";
    print_usage();
    return 1;
  }

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = la::SegmenterBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = la::SegmenterBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }
  if (chyron_override) {
    cfg.enable_chyron = *chyron_override;
  }

  commit.commit_type = lc::parse_commit_type(commit.message);
  commit.scope = lc::parse_commit_scope(commit.message);
  if (commit.timestamp.empty()) {
    commit.timestamp = lolcommits::io::format_commit_timestamp(std::chrono::system_clock::now());
  }

  if (auto valid = la::validate_config(cfg); !valid) {
    return fail("config", lc::to_string(valid.error()));
  }

  auto segmenter = la::make_segmenter(cfg);
  if (!segmenter) {
    return fail("segmentation", lc::to_string(segmenter.error()));
  }

  la::PipelineDeps deps;
  deps.segmenter = *segmenter;
  if (cfg.enable_chyron) {
    auto resolver = lv::FontconfigFontResolver::create();
    if (!resolver) return fail("chyron", lc::to_string(resolver.error()));
    deps.font_resolver = *resolver;
  }

  std::unique_ptr<lv::IFrameSource> source;
  if (!input_path.empty()) {
    source = std::make_unique<lv::ImageFileFrameSource>(input_path);
  } else {
    source = std::make_unique<lv::CameraFrameSource>(la::camera_options(cfg));
  }
  deps.frame_source = source.get();

  la::StageTimingCallback timing_cb = [](std::size_t index, std::string_view name, double ms) {
    spdlog::debug("stage {} ({}) took {:.2f} ms", index, name, ms);
  };

  std::optional<std::filesystem::path> output;
  if (!output_path.empty()) output = output_path;

#ifdef LOLCOMMITS_HAS_TBB
  auto result = la::run_lolcommit_tbb(cfg, deps, std::move(commit), output, &timing_cb);
#else
  auto result = la::run_lolcommit(cfg, deps, std::move(commit), output, &timing_cb);
#endif

  if (!result) {
    if (quiet && result.error().error == lc::PipelineError::DeviceBusy) {
      spdlog::info("camera busy, skipping lolcommit");
      return 0;
    }
    return fail(result.error().stage, lc::to_string(result.error().error));
  }

  std::cout << result->string() << "\n";
  return 0;
}
