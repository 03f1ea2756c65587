// Repository: Retrovue-camgate
// Component: Standalone Snapshot Harness
// Purpose: Feeds an H.264/H.265 elementary stream through a DecodeWorker and
//          writes the rate-gated JPEG snapshots to disk.
// Copyright (c) 2025 RetroVue
//
// This binary is for testing and diagnostics only. It stands in for the
// network layer (producer) and the async consumer (EventLoop on main).

#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
}

#include "camgate/buffer/FrameRecord.hpp"
#include "camgate/config/WorkerConfig.hpp"
#include "camgate/decode/FFmpegCodecs.hpp"
#include "camgate/runtime/EventLoop.hpp"
#include "camgate/time/Clock.hpp"
#include "camgate/util/Errors.hpp"
#include "camgate/util/Logger.hpp"
#include "camgate/worker/DecodeWorker.hpp"

namespace {

using camgate::buffer::CodecId;
using camgate::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input_path;
  CodecId codec = CodecId::kH264;
  int64_t interval_ms = 1000;
  int quality = 2;
  std::string out_dir = ".";
  int channel = 0;
  int fps = 25;
  bool no_hw = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --input PATH [OPTIONS]\n"
            << "\n"
            << "Decodes an Annex-B H.264/H.265 elementary stream through the\n"
            << "camgate decode worker and writes rate-gated JPEG snapshots.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --input PATH         Elementary stream file (required)\n"
            << "  --codec h264|h265    Stream codec (default: h264)\n"
            << "  --interval-ms N      Minimum spacing between snapshots (default: 1000)\n"
            << "  --quality 1|2|3      LOW, MEDIUM, HIGH (default: 2)\n"
            << "  --out-dir DIR        Output directory (default: .)\n"
            << "  --channel N          Channel id stamped on records (default: 0)\n"
            << "  --fps N              Producer pacing in packets/s (default: 25)\n"
            << "  --no-hw              Disable VAAPI probing\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --input cam.h265 --codec h265 --interval-ms 500 \\\n"
            << "      --quality 3 --out-dir /tmp/snaps\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--input" && i + 1 < argc) {
        args.input_path = argv[++i];
      } else if (arg == "--codec" && i + 1 < argc) {
        std::string codec = argv[++i];
        if (codec == "h264") {
          args.codec = CodecId::kH264;
        } else if (codec == "h265" || codec == "hevc") {
          args.codec = CodecId::kH265;
        } else {
          args.error = "Unknown codec: " + codec;
          return args;
        }
      } else if (arg == "--interval-ms" && i + 1 < argc) {
        args.interval_ms = std::stoll(argv[++i]);
      } else if (arg == "--quality" && i + 1 < argc) {
        args.quality = std::stoi(argv[++i]);
      } else if (arg == "--out-dir" && i + 1 < argc) {
        args.out_dir = argv[++i];
      } else if (arg == "--channel" && i + 1 < argc) {
        args.channel = std::stoi(argv[++i]);
      } else if (arg == "--fps" && i + 1 < argc) {
        args.fps = std::stoi(argv[++i]);
      } else if (arg == "--no-hw") {
        args.no_hw = true;
      } else {
        args.error = "Unknown or incomplete argument: " + arg;
        return args;
      }
    }
  } catch (const std::logic_error& e) {
    args.error = std::string("Invalid numeric argument: ") + e.what();
    return args;
  }

  if (args.input_path.empty()) {
    args.error = "--input is required";
    return args;
  }
  if (args.fps <= 0) {
    args.error = "--fps must be positive";
    return args;
  }
  args.valid = true;
  return args;
}

// =============================================================================
// Producer: split the elementary stream into packets and push them paced.
// =============================================================================
struct ProducerResult {
  uint64_t packets = 0;
  uint64_t keyframes = 0;
  std::string error;
};

ProducerResult ProduceFromFile(const CliArgs& args, camgate::worker::DecodeWorker& worker) {
  ProducerResult result;

  std::ifstream in(args.input_path, std::ios::binary);
  if (!in) {
    result.error = "cannot open input " + args.input_path;
    return result;
  }
  std::vector<uint8_t> stream((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());

  const AVCodecID codec_id =
      args.codec == CodecId::kH265 ? AV_CODEC_ID_HEVC : AV_CODEC_ID_H264;
  AVCodecParserContext* parser = av_parser_init(codec_id);
  const AVCodec* codec = avcodec_find_decoder(codec_id);
  AVCodecContext* parse_ctx = codec ? avcodec_alloc_context3(codec) : nullptr;
  if (!parser || !parse_ctx) {
    if (parser) av_parser_close(parser);
    avcodec_free_context(&parse_ctx);
    result.error = "cannot create bitstream parser";
    return result;
  }

  camgate::SystemClock clock;
  const auto pace = std::chrono::microseconds(1'000'000 / args.fps);

  auto push = [&](const uint8_t* data, int size) {
    camgate::buffer::FrameRecord record;
    record.media_kind = camgate::buffer::MediaKind::kVideo;
    record.codec_id = args.codec;
    record.payload.assign(data, data + size);
    record.timestamp = clock.NowMs();
    record.channel = args.channel;
    record.is_keyframe = parser->key_frame == 1;
    if (record.is_keyframe) result.keyframes++;
    result.packets++;
    worker.PushVideoFrame(std::move(record));
    std::this_thread::sleep_for(pace);
  };

  const uint8_t* data = stream.data();
  size_t remaining = stream.size();
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    uint8_t* out_data = nullptr;
    int out_size = 0;
    // A null/zero input flushes the last buffered packet.
    int used = av_parser_parse2(parser, parse_ctx, &out_data, &out_size,
                                remaining > 0 ? data : nullptr,
                                static_cast<int>(remaining),
                                AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
    if (used < 0) {
      result.error = "bitstream parser failed";
      break;
    }
    data += used;
    remaining -= static_cast<size_t>(used);
    if (out_size > 0) {
      push(out_data, out_size);
    } else if (remaining == 0) {
      break;
    }
  }

  av_parser_close(parser);
  avcodec_free_context(&parse_ctx);
  return result;
}

bool EnsureDirectory(const std::string& dir) {
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (!EnsureDirectory(args.out_dir)) {
    std::cerr << "Error: cannot create output directory " << args.out_dir << "\n";
    return 1;
  }

  camgate::config::DecodeWorkerConfig config;
  config.frame_interval_ms = args.interval_ms;
  config.enable_audio = false;
  config.enable_hw_accel = !args.no_hw;
  try {
    config.jpeg_quality = camgate::config::JpegQualityFor(
        camgate::config::VideoQualityFromInt(args.quality));
  } catch (const camgate::ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  auto loop = std::make_shared<camgate::runtime::EventLoop>();
  auto codecs = std::make_shared<camgate::decode::FFmpegCodecFactory>(
      camgate::config::ToCodecConfig(config));

  uint64_t written = 0;
  const std::string out_dir = args.out_dir;
  auto on_snapshot = [&written, out_dir](const std::vector<uint8_t>& jpeg,
                                         int64_t timestamp_ms, int channel) {
    std::ostringstream path;
    path << out_dir << "/snapshot_" << channel << "_" << timestamp_ms << ".jpg";
    std::ofstream of(path.str(), std::ios::binary);
    of.write(reinterpret_cast<const char*>(jpeg.data()),
             static_cast<std::streamsize>(jpeg.size()));
    if (!of) {
      Logger::Error("[SNAPSHOT] write failed " + path.str());
      return;
    }
    written++;
    Logger::Info("[SNAPSHOT] wrote " + path.str() + " bytes=" + std::to_string(jpeg.size()));
  };

  std::unique_ptr<camgate::worker::DecodeWorker> worker;
  try {
    worker = std::make_unique<camgate::worker::DecodeWorker>(config, codecs, loop, on_snapshot);
  } catch (const camgate::ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  worker->Start();

  // Producer runs off the main thread; it closes the loop when the input is
  // exhausted (after one more interval so the last tick can land) or when a
  // signal arrives.
  ProducerResult produced;
  std::thread producer([&] {
    produced = ProduceFromFile(args, *worker);
    const auto linger = std::chrono::milliseconds(std::max<int64_t>(args.interval_ms, 0) + 500);
    const auto deadline = std::chrono::steady_clock::now() + linger;
    while (!g_termination_requested.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    worker->Stop();
    loop->Stop();
  });

  loop->Run();
  producer.join();

  if (!produced.error.empty()) {
    std::cerr << "Error: " << produced.error << "\n";
  }

  const camgate::worker::DecodeWorkerStats stats = worker->Stats();
  std::cout << "\n=== Snapshot Summary ===\n"
            << "Packets pushed:     " << produced.packets << " (keyframes " << produced.keyframes << ")\n"
            << "Pictures decoded:   " << stats.video_decoded << "\n"
            << "Snapshots emitted:  " << stats.video_emitted << "\n"
            << "Snapshots written:  " << written << "\n"
            << "Skipped by gate:    " << stats.video_skipped_by_gate << "\n"
            << "Empty ticks:        " << stats.video_empty_ticks << "\n"
            << "Decode errors:      " << stats.decode_errors << "\n"
            << "Conversion errors:  " << stats.conversion_errors << "\n"
            << "HW accel:           "
            << (codecs->HwAccel().available ? codecs->HwAccel().type : std::string("none"))
            << "\n";

  return produced.error.empty() ? 0 : 1;
}
