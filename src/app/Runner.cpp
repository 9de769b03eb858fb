#include "moltrace/app/Runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "moltrace/io/InputFormat.hpp"
#include "moltrace/output/MoleculeReport.hpp"
#include "moltrace/output/ResultsIndex.hpp"
#include "moltrace/output/TimelineFile.hpp"
#include "moltrace/output/TimelineSink.hpp"
#include "moltrace/pipeline/Detector.hpp"
#include "moltrace/util/AtomicFile.hpp"
#include "moltrace/util/Hash.hpp"
#include "moltrace/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {

inline std::int64_t file_time_to_epoch_seconds(fs::file_time_type t) {
  // Best-effort conversion from filesystem clock to system_clock.
  using namespace std::chrono;
  const auto now_fs = fs::file_time_type::clock::now();
  const auto now_sys = system_clock::now();
  const auto sys_time = time_point_cast<system_clock::duration>(t - now_fs + now_sys);
  return duration_cast<seconds>(sys_time.time_since_epoch()).count();
}

inline moltrace::output::FileFingerprint make_fingerprint(const fs::path& p,
                                                          bool compute_hash,
                                                          std::optional<std::uint64_t> known_hash = std::nullopt) {
  moltrace::output::FileFingerprint fp;
  fp.path = p.string();
  std::error_code ec;
  const auto sz = fs::file_size(p, ec);
  fp.size_bytes = ec ? 0ull : static_cast<std::uint64_t>(sz);
  const auto mt = fs::last_write_time(p, ec);
  fp.mtime_epoch_s = ec ? 0 : file_time_to_epoch_seconds(mt);

  if (compute_hash) {
    fp.hash_kind = "fnv1a64";
    const std::uint64_t h = known_hash ? *known_hash : moltrace::fnv1a64_file(p.string());
    fp.hash_fnv1a64_hex = moltrace::hex_u64(h);
    fp.hash_computed = true;
  } else {
    fp.hash_kind = "none";
    fp.hash_fnv1a64_hex.clear();
    fp.hash_computed = false;
  }
  return fp;
}

// Output file names are relative to [output] dir unless absolute.
fs::path output_path(const fs::path& out_dir, const std::string& name) {
  fs::path p(name);
  if (p.is_absolute()) return p;
  return (out_dir / p).lexically_normal();
}

} // namespace

namespace moltrace {

Runner::Runner(const IniConfig& cfg, const BondOracle* oracle, int threads_override)
    : cfg_(cfg), oracle_(oracle), threads_override_(threads_override) {}

int Runner::run() {
  return run_impl_(false);
}

int Runner::validate_config() {
  return run_impl_(true);
}

int Runner::run_impl_(bool validate_only) {
  Stopwatch total_timer;

  const fs::path cfg_path = cfg_.file_path();

  // --- Input ---
  DetectOptions opt;
  opt.format = parse_input_format(cfg_.get_string("input", "format", std::optional<std::string>("bond")));
  const auto files = cfg_.get_list("input", "files");
  if (files.empty()) throw std::runtime_error("[input] files must list at least one trajectory file");
  for (const auto& f : files) opt.inputs.push_back(cfg_.resolve_path(f));
  opt.atom_names = cfg_.get_list("input", "atom_names", std::optional<std::string>(""));
  opt.step_interval = cfg_.get_size("input", "step_interval", std::optional<std::size_t>(1));
  opt.pbc = cfg_.get_bool("input", "pbc", std::optional<bool>(false));
  opt.oracle = (opt.format == InputFormat::LammpsDump) ? oracle_ : nullptr;

  // --- Run ---
  const std::int64_t threads_cfg = cfg_.get_int64("run", "threads", std::optional<std::int64_t>(0));
  if (threads_cfg < 0) throw std::runtime_error("[run] threads must be >= 0");
  opt.threads = threads_override_ > 0 ? threads_override_ : static_cast<int>(threads_cfg);
  opt.batch_size = cfg_.get_size("run", "batch_size", std::optional<std::size_t>(0));

  // --- Output ---
  const fs::path out_dir = cfg_.resolve_path(cfg_.get_string("output", "dir", std::optional<std::string>("./out")));
  const fs::path timeline_path =
      output_path(out_dir, cfg_.get_string("output", "timeline", std::optional<std::string>("molecules.bin")));
  const fs::path report_path =
      output_path(out_dir, cfg_.get_string("output", "report", std::optional<std::string>("molecules.tsv")));
  const fs::path results_json_path =
      output_path(out_dir, cfg_.get_string("output", "results_json", std::optional<std::string>("results.json")));
  const bool print_profile = cfg_.get_bool("output", "profile", std::optional<bool>(true));

  if (validate_only) {
    const TrajectoryHeader h = scan_trajectory_header(opt);
    std::cerr << "[moltrace] validation OK (no timestep processing performed)\n"
              << "           format=" << input_format_name(opt.format) << " files=" << opt.inputs.size()
              << " natoms=" << h.natoms << " step_lines=" << h.step_lines << "\n"
              << "           step_interval=" << opt.step_interval << " pbc=" << (opt.pbc ? "true" : "false")
              << " oracle=" << (opt.oracle ? opt.oracle->name() : std::string("none")) << "\n"
              << "           output_dir=" << out_dir.string() << "\n";
    return 0;
  }

  // --- Detect ---
  DetectResult res = detect_molecules(opt);
  std::cerr << "[moltrace] detected " << res.timeline.molecule_count() << " distinct molecules, "
            << res.timeline.occurrence_count() << " occurrences over " << res.timeline.step_count() << " steps ("
            << res.header.natoms << " atoms, threads=" << res.threads << ")\n";

  // --- Write ---
  // Outputs stay staged until results.json is written too.
  util::StagedFileSet outputs;
  double t_write = 0.0;
  {
    StageTimer tm(t_write);
    fs::create_directories(out_dir);
    output::TimelineFileWriter sink(outputs.stage(timeline_path));
    output::write_timeline(res.timeline, res.header, sink);
    output::write_molecule_report(outputs.stage(report_path), res.timeline, opt.atom_names);
  }

  // --- Results index ---
  output::ResultsIndex idx;
  idx.moltrace_version = MOLTRACE_VERSION_STR;
  idx.config_path = cfg_path.string();
  const std::uint64_t config_hash = fnv1a64_file(cfg_path.string());
  idx.config_hash_fnv1a64_hex = hex_u64(config_hash);
  idx.config_fingerprint = make_fingerprint(cfg_path, true, config_hash);
  for (const auto& p : opt.inputs) idx.inputs.push_back(make_fingerprint(p, true));
  idx.format = input_format_name(opt.format);
  idx.atom_names = opt.atom_names;
  idx.step_interval = opt.step_interval;
  idx.pbc = opt.pbc;
  idx.oracle = opt.oracle ? opt.oracle->name() : std::string("none");
  idx.threads = res.threads;
  idx.batch_size = opt.batch_size > 0 ? opt.batch_size : 4 * static_cast<std::size_t>(res.threads);
  idx.natoms = res.header.natoms;
  idx.step_lines = res.header.step_lines;
  idx.blocks_seen = res.profile.blocks_seen;
  idx.steps = res.timeline.step_count();
  idx.molecules = res.timeline.molecule_count();
  idx.occurrences = res.timeline.occurrence_count();
  idx.output_dir = out_dir.string();
  idx.outputs.push_back(output::OutputFileDescriptor{"timeline", timeline_path.string(), "binary"});
  idx.outputs.push_back(output::OutputFileDescriptor{"report", report_path.string(), "tsv"});
  idx.header_seconds = res.profile.header_seconds;
  idx.detect_seconds = res.profile.detect_seconds;
  idx.write_seconds = t_write;
  idx.batches = res.profile.batches;
  idx.wall_seconds = total_timer.seconds();
  output::write_results_json(outputs.stage(results_json_path), idx);
  outputs.commit();

  if (print_profile) {
    std::cerr << "[moltrace] profiling\n";
    std::cerr << "  wall_seconds: " << std::setprecision(6) << idx.wall_seconds << "\n";
    std::cerr << "  header_seconds: " << idx.header_seconds << "\n";
    std::cerr << "  detect_seconds: " << idx.detect_seconds << " (batches=" << idx.batches << ")\n";
    std::cerr << "  write_seconds: " << idx.write_seconds << "\n";
    std::cerr << "  timeline: " << timeline_path.string() << "\n";
    std::cerr << "  report: " << report_path.string() << "\n";
    std::cerr << "  results_json: " << results_json_path.string() << "\n";
  }

  return 0;
}

} // namespace moltrace
