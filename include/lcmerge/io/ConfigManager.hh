#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "lcmerge/lightcurve/LightCurve.hh"
#include "lcmerge/lightcurve/RowSelection.hh"
#include "lcmerge/lightcurve/UpperLimitTable.hh"
#include "lcmerge/merge/MergeOptions.hh"
#include "lcmerge/merge/MultiBandUpperLimitMerger.hh"

namespace lcmerge {

struct RunHeader {
  std::string label;
  std::string outdir;
  int         verbosity = 1;
};

struct SelectionJSON {
  std::string  dataset;  // light-curve dataset name; unused for UL tables
  RowSelection rows;
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  /// Parse a JSON document already in memory (used by tests).
  static ConfigManager FromString(const std::string& text);

  void parse();

  const RunHeader&                     run()                 const noexcept { return run_; }
  const merge::LightCurveMergeOptions& merge_options()       const noexcept { return merge_; }
  const merge::UpperLimitMergeOptions& upper_limit_options() const noexcept { return ul_; }
  const SelectionJSON&                 selection()           const noexcept { return sel_; }
  bool has_light_curve()  const noexcept { return has_lc_; }
  bool has_upper_limits() const noexcept { return !ul_table_.empty(); }

  LightCurve&           light_curve()    noexcept { return lc_; }
  const MultiBandTable& upper_limit_table() const noexcept { return ul_table_; }

private:
  ConfigManager() = default;
  void parse_json_(const nlohmann::json& j);

  std::string                   path_;
  std::optional<std::string>    text_;
  RunHeader                     run_;
  merge::LightCurveMergeOptions merge_;
  merge::UpperLimitMergeOptions ul_;
  SelectionJSON                 sel_;
  LightCurve                    lc_;
  bool                          has_lc_ = false;
  MultiBandTable                ul_table_;

  void parse_run_(const nlohmann::json& j);
  void parse_merge_(const nlohmann::json& j);
  void parse_light_curve_(const nlohmann::json& j);
  void parse_selection_(const nlohmann::json& j);
  void parse_upper_limits_(const nlohmann::json& j);
};

} // namespace lcmerge
