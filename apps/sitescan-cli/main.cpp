/**
 * sitescan-cli: analyze site photo(s) for safety hazards; print fused hazards and tag
 * recommendations.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/sitescan_cli [--config path] [--input path]...
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <sitescan/analysis/backend_health.hpp>
#include <sitescan/analysis/connectivity.hpp>
#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <sitescan/analysis/orchestrator.hpp>
#include <sitescan/app/backend_factory.hpp>
#include <sitescan/app/config.hpp>
#include <sitescan/app/session_runner.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/core/logging.hpp>
#include <sitescan/core/session.hpp>
#include <sitescan/vision/load_image.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace sa = sitescan::analysis;
namespace sc = sitescan::core;

sc::Image make_dummy_image(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{0});
  return sc::Image(w, h, sc::PixelFormat::BGR8, std::move(buffer));
}

std::string format_session(const sc::AnalysisSession& session, const sa::HazardTaxonomy& taxonomy) {
  std::ostringstream out;
  out << "session=" << session.correlation_id() << " state=" << sc::to_string(session.state())
      << " hazards=" << session.fused_hazards().size()
      << " degraded=" << (session.degraded_capability() ? "true" : "false")
      << " latency_ms=" << session.total_latency().count() << "\n";
  if (!session.completed()) {
    out << "  " << session.user_message() << "\n";
    return out.str();
  }
  out << "  backends:";
  for (const auto& id : session.contributing_backends()) out << " " << id;
  out << "\n";
  for (const auto& h : session.fused_hazards()) {
    out << "  " << h.hazard_type << " confidence=" << h.confidence
        << " severity=" << sc::to_string(h.severity) << " sources=" << h.contributing_backends.size()
        << " bbox=(" << h.region.x << "," << h.region.y << "," << h.region.w << "," << h.region.h
        << ")\n";
  }
  for (const auto& r : session.recommendations()) {
    const auto* tag = taxonomy.find_tag(r.tag_id);
    out << "  [" << sc::to_string(r.reason) << "] " << r.tag_id;
    if (tag) {
      out << " \"" << tag->display_name << "\"";
      for (const auto& code : tag->regulatory_codes) out << " " << code;
    }
    out << " confidence=" << r.confidence << "\n";
  }
  return out.str();
}

void print_health(const std::vector<sa::BackendStatus>& report) {
  for (const auto& s : report) {
    std::cout << "backend=" << s.id << " tier=" << sc::to_string(s.tier)
              << " available=" << (s.available ? "true" : "false")
              << " deprioritized=" << (s.deprioritized ? "true" : "false")
              << " success_rate=" << s.health.success_rate << " samples=" << s.health.samples
              << " avg_latency_ms=" << s.health.average_latency.count() << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string taxonomy_override;
  bool offline = false;
  bool hybrid = false;
  bool health = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--taxonomy" && i + 1 < argc) {
      taxonomy_override = argv[++i];
    } else if (arg == "--offline") {
      offline = true;
    } else if (arg == "--hybrid") {
      hybrid = true;
    } else if (arg == "--health") {
      health = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: sitescan_cli [options] [--input <path>]...\n"
                << "  --config <path>    Analysis config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>   Override on-device runtime: mock | onnx (default from config)\n"
                << "  --model <path>     Override model path for both on-device backends\n"
                << "  --taxonomy <path>  Hazard taxonomy file; default: built-in construction set\n"
                << "  --input <path>     Photo to analyze; repeat for a batch (demo uses a synthetic image)\n"
                << "  --hybrid           Run on-device and remote analysis concurrently\n"
                << "  --offline          Treat the device as disconnected (remote backend skipped)\n"
                << "  --health           Print backend health after the run\n";
      return 0;
    }
  }

  try {
    sitescan::app::AnalysisConfig cfg = config_path.empty() ? sitescan::app::default_config()
                                                            : sitescan::app::load_config(config_path);
    if (!backend_override.empty()) {
      if (backend_override == "mock") {
        cfg.inference_backend = sitescan::app::InferenceBackendType::Mock;
      } else if (backend_override == "onnx") {
        cfg.inference_backend = sitescan::app::InferenceBackendType::Onnx;
      } else {
        std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
        return 1;
      }
    }
    if (!model_override.empty()) {
      cfg.multimodal_model_path = model_override;
      cfg.detector_model_path = model_override;
    }
    if (!taxonomy_override.empty()) cfg.taxonomy_path = taxonomy_override;
    if (hybrid) cfg.hybrid_mode = true;

    sc::configure_logging(cfg.logging);

    auto taxonomy = std::make_shared<const sa::HazardTaxonomy>(
        cfg.taxonomy_path.empty() ? sa::default_taxonomy() : sa::load_taxonomy(cfg.taxonomy_path));

    auto& registry = sa::BackendHealthRegistry::global();
    if (!cfg.health_path.empty() && std::filesystem::exists(cfg.health_path)) {
      registry.load(cfg.health_path);
    }

    auto connectivity = std::make_shared<sa::StaticConnectivity>(
        offline ? sa::ConnectivityQuality::None : sa::ConnectivityQuality::Good);

    std::vector<sitescan::app::BatchItem> items;
    if (input_paths.empty()) {
      items.push_back({make_dummy_image(320, 240), {}});
    }
    for (const auto& path : input_paths) {
      auto image = sitescan::vision::load_image(path);
      if (!image) {
        std::cerr << "Failed to load image: " << path << "\n";
        return 1;
      }
      sc::CaptureContext context;
      context.correlation_id = std::filesystem::path(path).stem().string();
      items.push_back({std::move(*image), std::move(context)});
    }

    bool all_completed = true;
    {
      sa::SmartAnalysisOrchestrator orchestrator(sitescan::app::build_backends(cfg, *taxonomy), taxonomy,
                                                 connectivity, sitescan::app::orchestrator_config(cfg),
                                                 registry);

      std::mutex out_mutex;
      sitescan::app::analyze_batch_parallel(
          orchestrator, items, [&](std::size_t index, const sc::AnalysisSession& session) {
            const std::string text = format_session(session, *taxonomy);
            std::lock_guard lock(out_mutex);
            if (!session.completed()) all_completed = false;
            std::cout << text;
            if (index < input_paths.size()) {
              const std::filesystem::path p(input_paths[index]);
              const std::filesystem::path out_dir("output");
              std::filesystem::create_directories(out_dir);
              const std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
              std::ofstream f(out_file);
              if (f) {
                f << text;
              } else {
                std::cerr << "Warning: could not write " << out_file << "\n";
              }
            }
          });

      if (health) print_health(orchestrator.health_report());
    }

    if (!cfg.health_path.empty()) registry.save(cfg.health_path);
    return all_completed ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
