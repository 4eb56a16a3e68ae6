#include "lcmerge/io/BinJson.hh"
#include "lcmerge/io/ConfigManager.hh"
#include "lcmerge/merge/LightCurveMerger.hh"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) { std::cerr << "usage: lcmerge_merge_bins <config.json>\n"; return 1; }

  try {
    lcmerge::ConfigManager cfg(argv[1]); cfg.parse();
    if (!cfg.has_light_curve()) {
      std::cerr << "[config] no `light_curve` block in " << argv[1] << "\n"; return 1;
    }

    const auto& sel  = cfg.selection();
    const auto& opts = cfg.merge_options();
    auto& lc = cfg.light_curve();

    std::cout << "[merge] Run: " << cfg.run().label << "\n"
              << "  Dataset: " << sel.dataset << " (" << lc.dataset(sel.dataset).size() << " bins)\n"
              << "  Rows   : " << sel.rows.ToString() << "\n"
              << "  Insert : " << lcmerge::merge::InsertPolicyName(opts.insert)
              << "   Remove: " << (opts.remove ? "yes" : "no") << "\n";

    const auto res = lcmerge::merge::MergeLightCurveBins(lc, sel.dataset, sel.rows, opts);

    const auto jres = lcmerge::io::ToJson(res);
    std::cout << jres.dump(2) << "\n";

    if (!cfg.run().outdir.empty()) {
      std::filesystem::create_directories(cfg.run().outdir);
      const std::string path = cfg.run().outdir + "/merged_bin.json";
      std::ofstream out(path);
      if (!out) throw std::runtime_error("Cannot write " + path);

      nlohmann::json doc;
      doc["merged"] = jres;
      doc["light_curve"] = nlohmann::json::object();
      for (const auto& name : lc.names()) doc["light_curve"][name] = lcmerge::io::ToJson(lc.dataset(name));
      out << doc.dump(2) << "\n";
      std::cout << "\n[output] " << path << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n"; return 2;
  }
}
