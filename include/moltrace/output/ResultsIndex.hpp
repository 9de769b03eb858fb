#pragma once

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "moltrace/util/AtomicFile.hpp"

namespace moltrace::output {
namespace fs = std::filesystem;

// Bump when changing the JSON structure in non-backward-compatible ways.
inline constexpr const char* RESULTS_SCHEMA_VERSION = "1.0";

struct FileFingerprint {
  std::string path;
  std::uint64_t size_bytes = 0;
  std::int64_t mtime_epoch_s = 0; // seconds since epoch (best-effort)

  bool hash_computed = false;
  std::string hash_fnv1a64_hex;
  std::string hash_kind = "fnv1a64"; // "fnv1a64" or "none"
};

struct OutputFileDescriptor {
  std::string role;   // timeline|report
  std::string path;
  std::string format; // binary|tsv
};

struct ResultsIndex {
  std::string schema_version = RESULTS_SCHEMA_VERSION;
  std::string moltrace_version;

  std::string config_path;
  std::string config_hash_fnv1a64_hex;
  FileFingerprint config_fingerprint;
  std::vector<FileFingerprint> inputs;

  // detection parameters
  std::string format;
  std::vector<std::string> atom_names;
  std::size_t step_interval = 1;
  bool pbc = false;
  std::string oracle;
  int threads = 1;
  std::size_t batch_size = 0;

  // trajectory/timeline summary
  std::size_t natoms = 0;
  std::size_t step_lines = 0;
  std::size_t blocks_seen = 0;
  std::size_t steps = 0;
  std::size_t molecules = 0;
  std::size_t occurrences = 0;

  std::string output_dir;
  std::vector<OutputFileDescriptor> outputs;

  // coarse profiling
  double wall_seconds = 0.0;
  double header_seconds = 0.0;
  double detect_seconds = 0.0;
  double write_seconds = 0.0;
  std::size_t batches = 0;
};

inline std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

inline void write_results_json(std::ostream& ofs, const ResultsIndex& idx) {
  auto q = [&](const std::string& s) {
    return std::string("\"") + json_escape(s) + "\"";
  };
  auto b = [](bool v) { return v ? "true" : "false"; };

  auto write_fingerprint = [&](const FileFingerprint& fp, int indent) {
    const std::string pad(indent, ' ');
    ofs << "{\n";
    ofs << pad << "  \"path\": " << q(fp.path) << ",\n";
    ofs << pad << "  \"size_bytes\": " << fp.size_bytes << ",\n";
    ofs << pad << "  \"mtime_epoch_s\": " << fp.mtime_epoch_s << ",\n";
    ofs << pad << "  \"hash_kind\": " << q(fp.hash_kind) << ",\n";
    ofs << pad << "  \"hash_computed\": " << b(fp.hash_computed) << ",\n";
    ofs << pad << "  \"hash_fnv1a64\": " << q(fp.hash_fnv1a64_hex) << "\n";
    ofs << pad << "}";
  };

  ofs << std::setprecision(6);
  ofs << "{\n";
  ofs << "  \"schema_version\": " << q(idx.schema_version) << ",\n";
  ofs << "  \"moltrace_version\": " << q(idx.moltrace_version) << ",\n";

  ofs << "  \"run\": {\n";
  ofs << "    \"config_path\": " << q(idx.config_path) << ",\n";
  ofs << "    \"config_hash_fnv1a64\": " << q(idx.config_hash_fnv1a64_hex) << ",\n";
  ofs << "    \"config_fingerprint\": ";
  write_fingerprint(idx.config_fingerprint, 4);
  ofs << ",\n";
  ofs << "    \"inputs\": [";
  for (std::size_t i = 0; i < idx.inputs.size(); ++i) {
    ofs << (i ? ",\n      " : "\n      ");
    write_fingerprint(idx.inputs[i], 6);
  }
  ofs << (idx.inputs.empty() ? "],\n" : "\n    ],\n");
  ofs << "    \"format\": " << q(idx.format) << ",\n";
  ofs << "    \"atom_names\": [";
  for (std::size_t i = 0; i < idx.atom_names.size(); ++i) {
    if (i) ofs << ", ";
    ofs << q(idx.atom_names[i]);
  }
  ofs << "],\n";
  ofs << "    \"step_interval\": " << idx.step_interval << ",\n";
  ofs << "    \"pbc\": " << b(idx.pbc) << ",\n";
  ofs << "    \"oracle\": " << q(idx.oracle) << ",\n";
  ofs << "    \"threads\": " << idx.threads << ",\n";
  ofs << "    \"batch_size\": " << idx.batch_size << ",\n";
  ofs << "    \"output_dir\": " << q(idx.output_dir) << "\n";
  ofs << "  },\n";

  ofs << "  \"trajectory\": {\n";
  ofs << "    \"natoms\": " << idx.natoms << ",\n";
  ofs << "    \"step_lines\": " << idx.step_lines << ",\n";
  ofs << "    \"blocks_seen\": " << idx.blocks_seen << ",\n";
  ofs << "    \"steps\": " << idx.steps << "\n";
  ofs << "  },\n";

  ofs << "  \"timeline\": {\n";
  ofs << "    \"molecules\": " << idx.molecules << ",\n";
  ofs << "    \"occurrences\": " << idx.occurrences << "\n";
  ofs << "  },\n";

  ofs << "  \"outputs\": [";
  for (std::size_t i = 0; i < idx.outputs.size(); ++i) {
    const auto& o = idx.outputs[i];
    ofs << (i ? ",\n" : "\n");
    ofs << "    {\"role\": " << q(o.role) << ", \"path\": " << q(o.path) << ", \"format\": " << q(o.format) << "}";
  }
  ofs << (idx.outputs.empty() ? "],\n" : "\n  ],\n");

  ofs << "  \"profiling\": {\n";
  ofs << "    \"wall_seconds\": " << idx.wall_seconds << ",\n";
  ofs << "    \"header_seconds\": " << idx.header_seconds << ",\n";
  ofs << "    \"detect_seconds\": " << idx.detect_seconds << ",\n";
  ofs << "    \"write_seconds\": " << idx.write_seconds << ",\n";
  ofs << "    \"batches\": " << idx.batches << "\n";
  ofs << "  }\n";
  ofs << "}\n";
}

inline void write_results_json(const fs::path& out_path, const ResultsIndex& idx) {
  util::atomic_write_text(out_path, [&](std::ostream& ofs) { write_results_json(ofs, idx); });
}

} // namespace moltrace::output
