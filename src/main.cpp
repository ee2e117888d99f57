#include "driver/chunk_driver.hpp"
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include "build/build_error.hpp"
#include "build/piece_commitment.hpp"
#include "config/config.hpp"
#include "feeder/segment_tool.hpp"
#include "logger/logger.hpp"
#include "partition/types.hpp"
#include "store/store.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_CANCELLED = 130;

struct ProgramOptions {
  std::string command;
  slicer::config::ChunkOptions chunk;
  // commp arguments
  std::string archive_path;
  bool rename{false};
  bool add_padding{false};
  // logging
  std::string log_file;
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage:\n"
            << "  " << program_name << " chunk [options] <input path>\n"
            << "  " << program_name << " commp [--rename] [--add-padding] <archive>\n"
            << "Chunk options:\n"
            << "  --graph-name <name>              Slice name prefix (required)\n"
            << "  --car-dir <dir>                  Output directory, must exist (required)\n"
            << "  --config, -c <file>              Capacity config file (JSON)\n"
            << "  --slice-size <size>              Capacity when no config file is given, e.g. 18GiB\n"
            << "  --capacity-step <bytes>          Capacity increment per run, 0 disables (default 1)\n"
            << "  --parallel <n>                   Worker threads (default 2)\n"
            << "  --parent-path <dir>              Entry names are relative to this path\n"
            << "  --calc-commp[=false]             Compute piece commitments (default true)\n"
            << "  --save-manifest[=false]          Write manifest.csv when not computing commitments (default true)\n"
            << "  --rename                         Drop the .car suffix of committed archives\n"
            << "  --add-padding                    Zero-pad archives to the piece payload size\n"
            << "  --random-rename-source-file      Anonymize entry names\n"
            << "  --random-select-file[=false]     Shuffle input files (default true)\n"
            << "  --shuffle-seed <n>               Reproducible shuffle\n"
            << "  --skip-filename[=false]          Leave names out of the manifest detail (default true)\n"
            << "  --loop                           Repeat every 60 seconds until interrupted\n"
            << "  --video-path <file>              Source video for supplementary segments\n"
            << "  --video-output-path <dir>        Segment directory (default: input path)\n"
            << "  --video-reserve <size>           Bytes reserved per slice for video segments\n"
            << "  --video-step-ms <ms>             Start offset advance per segment (default 1)\n"
            << "  --base-rename <name>             Segment file name prefix (default: random)\n"
            << "  --base-limit <n>                 First segment counter value (default 0)\n"
            << "  --manifest-db <file>             JSON manifest repository\n"
            << "Common options:\n"
            << "  --log-file <file>                Also log to this file\n"
            << "  --log-level <level>              trace, debug, info, warning, error, fatal\n"
            << "Example: " << program_name << " chunk --graph-name dataset --car-dir ./out -c slicer.json ./data\n";
}

// Accepts "--flag", "--flag=true" and "--flag=false"
bool parse_bool_flag(const std::string& argument, const std::string& flag, bool& target) {
  if (argument == flag || argument == flag + "=true") {
    target = true;
    return true;
  }
  if (argument == flag + "=false") {
    target = false;
    return true;
  }
  return false;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  if (argc < 2) {
    print_usage(argv[0]);
    return options;
  }
  options.command = argv[1];
  if (options.command != "chunk" && options.command != "commp") {
    std::cerr << "Error: Unknown command: " << options.command << '\n';
    print_usage(argv[0]);
    return options;
  }

  auto& chunk = options.chunk;
  const std::vector<std::pair<std::string, bool*>> bool_flags = {
    {"--calc-commp", &chunk.calc_commp},
    {"--save-manifest", &chunk.save_manifest},
    {"--rename", &options.rename},
    {"--add-padding", &options.add_padding},
    {"--random-rename-source-file", &chunk.random_rename_source_file},
    {"--random-select-file", &chunk.random_select_file},
    {"--skip-filename", &chunk.skip_filename},
    {"--loop", &chunk.loop},
  };
  const std::unordered_map<std::string, std::string> aliases = {{"-c", "--config"}};

  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string flag(argv[i]);
    if (aliases.count(flag)) {
      flag = aliases.at(flag);
    }

    bool matched = false;
    for (const auto& entry : bool_flags) {
      if (parse_bool_flag(flag, entry.first, *entry.second)) {
        matched = true;
        break;
      }
    }
    if (matched) {
      continue;
    }
    if (flag.rfind("--", 0) != 0) {
      positional.push_back(flag);
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    try {
      if (flag == "--graph-name") {
        chunk.graph_name = value;
      } else if (flag == "--car-dir") {
        chunk.car_dir = value;
      } else if (flag == "--config") {
        chunk.config_path = value;
      } else if (flag == "--slice-size") {
        chunk.slice_size = slicer::config::parse_size(value);
      } else if (flag == "--capacity-step") {
        chunk.capacity_step = std::stoll(value);
      } else if (flag == "--parallel") {
        const long long parallel = std::stoll(value);
        chunk.parallel = parallel > 0 ? static_cast<std::size_t>(parallel) : 0;
      } else if (flag == "--parent-path") {
        chunk.parent_path = value;
      } else if (flag == "--shuffle-seed") {
        chunk.shuffle_seed = std::stoull(value);
      } else if (flag == "--video-path") {
        chunk.video_path = value;
      } else if (flag == "--video-output-path") {
        chunk.video_output_path = value;
      } else if (flag == "--video-reserve") {
        chunk.video_reserve = slicer::config::parse_size(value);
      } else if (flag == "--video-step-ms") {
        chunk.video_step_ms = std::stoll(value);
      } else if (flag == "--base-rename") {
        chunk.base_rename = value;
      } else if (flag == "--base-limit") {
        chunk.base_limit = std::stoll(value);
      } else if (flag == "--manifest-db") {
        chunk.manifest_db = value;
      } else if (flag == "--log-file") {
        options.log_file = value;
      } else if (flag == "--log-level") {
        options.log_level = value;
      } else {
        std::cerr << "Error: Unknown argument: " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value '" << value << "' for " << flag << ": " << e.what() << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (positional.size() != 1) {
    std::cerr << "Error: Expected exactly one path argument\n";
    print_usage(argv[0]);
    return options;
  }
  if (options.command == "chunk") {
    std::string input = positional.front();
    while (input.size() > 1 && input.back() == '/') {
      input.pop_back();
    }
    chunk.input_path = input;
    chunk.rename = options.rename;
    chunk.add_padding = options.add_padding;
    if (chunk.config_path.empty() && chunk.slice_size == 0) {
      std::cerr << "Error: Either --config or --slice-size is required\n";
      print_usage(argv[0]);
      return options;
    }
  } else {
    options.archive_path = positional.front();
  }

  options.valid = true;
  return options;
}

// Computes the piece commitment of an existing archive, optionally padding and renaming it
int run_commp(const ProgramOptions& options) {
  const std::filesystem::path archive_path(options.archive_path);
  if (!std::filesystem::is_regular_file(archive_path)) {
    std::cerr << "Error: Archive not found: " << archive_path.string() << '\n';
    return EXIT_ERROR;
  }

  slicer::build::CommitmentResult result;
  {
    std::ifstream in(archive_path, std::ios::binary);
    if (!in) {
      std::cerr << "Error: Cannot open archive: " << archive_path.string() << '\n';
      return EXIT_ERROR;
    }
    result = slicer::build::PieceCommitment::compute(in);
  }

  slicer::store::ArchiveStore archives(archive_path.has_parent_path() ? archive_path.parent_path()
                                                                      : std::filesystem::path("."));
  const std::string key = archive_path.filename().string();
  if (options.add_padding) {
    archives.pad(key, slicer::build::PieceCommitment::unpadded_size(result.piece_size));
  }
  if (options.rename) {
    archives.rename(key, result.commitment_id);
  }

  std::cout << "PieceCID: " << result.commitment_id << ", PieceSize: " << result.piece_size << std::endl;
  return EXIT_OK;
}

int run_chunk(const ProgramOptions& options) {
  slicer::partition::CancellationToken cancel;

  // SIGINT and SIGTERM request a cooperative stop
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([&cancel](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(warning) << "Received signal " << signal_number << ", stopping after the current file";
      cancel.cancel();
    }
  });
  std::thread signal_thread([&signals_context] { signals_context.run(); });

  int status = EXIT_OK;
  try {
    slicer::feeder::FfmpegSegmentTool segment_tool;
    slicer::driver::ChunkDriver driver(options.chunk, segment_tool);
    auto report = driver.run(cancel);
    std::cout << "files: " << report.files << ", skipped: " << report.skipped
              << ", slices: " << report.slices << std::endl;
    status = report.cancelled ? EXIT_CANCELLED : EXIT_OK;
  } catch (const slicer::config::ConfigError& e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    status = EXIT_ERROR;
  } catch (const slicer::build::BuildError& e) {
    BOOST_LOG_TRIVIAL(error) << "Build failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    status = EXIT_ERROR;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunking failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    status = EXIT_ERROR;
  }

  signals.cancel();
  signals_context.stop();
  signal_thread.join();
  return status;
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return EXIT_ERROR;
  }

  try {
    slicer::logging::init_logging(options.log_file, slicer::logging::parse_severity(options.log_level));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_ERROR;
  }

  if (options.command == "commp") {
    try {
      return run_commp(options);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << '\n';
      return EXIT_ERROR;
    }
  }
  return run_chunk(options);
}
