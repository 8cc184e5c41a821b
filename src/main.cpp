#include <exception>
#include <iostream>
#include <string>

#include "galaxis/core/galaxy_config.h"
#include "galaxis/core/orchestrator.h"
#include "galaxis/util/digest.h"
#include "galaxis/util/file_io.h"
#include "galaxis/util/log.h"
#include "galaxis/util/snapshot_export.h"
#include "galaxis/util/strings.h"

namespace {

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " <galaxy-file> [ticks] [snapshot-out]\n"
            << "\n"
            << "  galaxy-file  .json galaxy definition, or id,type,neighbor... adjacency text\n"
            << "  ticks        ticks to run (default 100); stops early at a scheduled pause\n"
            << "               or once every explorer is dead\n"
            << "  snapshot-out write the final snapshot JSON to this file instead of stdout\n"
            << "\n"
            << "Prints the final snapshot as JSON followed by its digest.\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2 || argc > 4) {
      print_usage(argv[0]);
      return 2;
    }

    unsigned long long ticks = 100;
    if (argc >= 3 && !galaxis::parse_u64(argv[2], &ticks)) {
      std::cerr << "Invalid tick count: " << argv[2] << "\n";
      return 2;
    }

    galaxis::GalaxyConfig galaxy = galaxis::load_galaxy_file(argv[1]);
    galaxis::log::set_level(galaxy.sim.log_level);

    galaxis::Orchestrator orch(std::move(galaxy));
    const bool has_explorers = !orch.snapshot().explorers.empty();
    orch.start();

    unsigned long long done = 0;
    while (done < ticks) {
      if (!orch.tick()) break;
      ++done;
      if (orch.run_state() != galaxis::RunState::Running) break;

      if (has_explorers && orch.survivors().explorers == 0) {
        galaxis::log::info("Every explorer is dead after " + std::to_string(done) + " ticks");
        break;
      }
    }

    const galaxis::GalaxySnapshot snap = orch.snapshot();
    orch.shutdown();

    const std::string text = galaxis::snapshot_to_json_text(snap);
    if (argc == 4) {
      galaxis::write_text_file(argv[3], text);
      galaxis::log::info(std::string("Wrote snapshot to ") + argv[3]);
    } else {
      std::cout << text;
    }
    std::cout << "digest " << galaxis::digest64_to_hex(galaxis::digest_snapshot64(snap)) << "\n";
    return 0;
  } catch (const std::exception& e) {
    galaxis::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
