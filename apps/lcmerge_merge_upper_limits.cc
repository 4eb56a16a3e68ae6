#include "lcmerge/io/BinJson.hh"
#include "lcmerge/io/ConfigManager.hh"
#include "lcmerge/merge/MultiBandUpperLimitMerger.hh"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) { std::cerr << "usage: lcmerge_merge_upper_limits <config.json>\n"; return 1; }

  try {
    lcmerge::ConfigManager cfg(argv[1]); cfg.parse();
    if (!cfg.has_upper_limits()) {
      std::cerr << "[config] no `upper_limits.rows` in " << argv[1] << "\n"; return 1;
    }

    std::cout << "[ulmerge] Run: " << cfg.run().label << "\n"
              << "  Rows : " << cfg.selection().rows.ToString() << " of "
              << cfg.upper_limit_table().size() << "\n"
              << "  Bands: ";
    const auto& bands = cfg.upper_limit_options().bands;
    for (size_t i = 0; i < bands.size(); ++i)
      std::cout << lcmerge::BandName(bands[i]) << (i + 1 < bands.size() ? "," : "");
    std::cout << "\n";

    const auto res = lcmerge::merge::MergeUpperLimits(cfg.upper_limit_table(),
                                                      cfg.selection().rows,
                                                      cfg.upper_limit_options());
    const auto jres = lcmerge::io::ToJson(res);
    std::cout << jres.dump(2) << "\n";

    if (!cfg.run().outdir.empty()) {
      std::filesystem::create_directories(cfg.run().outdir);
      const std::string path = cfg.run().outdir + "/merged_upper_limits.json";
      std::ofstream out(path);
      if (!out) throw std::runtime_error("Cannot write " + path);
      out << jres.dump(2) << "\n";
      std::cout << "\n[output] " << path << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n"; return 2;
  }
}
