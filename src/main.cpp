#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "moltrace/app/Runner.hpp"
#include "moltrace/bond/BondOracle.hpp"
#include "moltrace/config/IniConfig.hpp"

#if MOLTRACE_HAS_OPENBABEL
#include "moltrace/bond/OpenBabelOracle.hpp"
#endif

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  int threads = 0; // 0 = use [run] threads
  bool validate_config = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--threads N] [--validate-config]\n"
      << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << MOLTRACE_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--threads") {
      if (i + 1 >= argc) throw std::runtime_error("--threads requires a value");
      cli.threads = std::stoi(argv[++i]);
      if (cli.threads < 1) throw std::runtime_error("--threads must be >= 1");
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (cli.config.empty()) {
    throw std::runtime_error("--config is required");
  }
  return cli;
}

std::unique_ptr<moltrace::BondOracle> make_default_oracle() {
#if MOLTRACE_HAS_OPENBABEL
  return std::make_unique<moltrace::OpenBabelOracle>();
#else
  return nullptr;
#endif
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    const auto oracle = make_default_oracle();
    moltrace::IniConfig cfg(cli.config);
    moltrace::Runner runner(cfg, oracle.get(), cli.threads);
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
