#include "lcmerge/io/ConfigManager.hh"
#include "lcmerge/io/BinJson.hh"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace lcmerge {

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

ConfigManager ConfigManager::FromString(const std::string& text) {
  ConfigManager cfg;
  cfg.text_ = text;
  return cfg;
}

void ConfigManager::parse() {
  nlohmann::json j;
  if (text_) {
    j = nlohmann::json::parse(*text_);
  } else {
    std::ifstream in(path_);
    if (!in) throw std::runtime_error("Cannot open config: " + path_);
    in >> j;
  }
  parse_json_(j);
}

void ConfigManager::parse_json_(const nlohmann::json& j) {
  if (j.contains("run"))          parse_run_(j.at("run"));
  if (j.contains("merge"))        parse_merge_(j.at("merge"));
  if (j.contains("light_curve"))  parse_light_curve_(j.at("light_curve"));
  if (j.contains("upper_limits")) parse_upper_limits_(j.at("upper_limits"));
  if (j.contains("selection"))    parse_selection_(j.at("selection"));
  else if (!ul_table_.empty())    sel_.rows = RowSelection::All(ul_table_.size());
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string{});
  run_.verbosity = j.value("verbosity", 1);
  merge_.verbosity = run_.verbosity;
  ul_.verbosity    = run_.verbosity;
}

void ConfigManager::parse_merge_(const nlohmann::json& j) {
  merge_.remove     = j.value("remove", false);
  merge_.force_rate = j.value("force_rate", false);
  merge_.force_ul   = j.value("force_ul", false);
  merge_.ul_conf    = j.value("ul_conf", merge::kDefaultULConf);

  if (j.contains("insert")) {
    const auto& ji = j.at("insert");
    if (ji.is_boolean())
      merge_.insert = ji.get<bool>() ? merge::InsertPolicy::AlwaysCoerce : merge::InsertPolicy::NeverInsert;
    else
      merge_.insert = merge::ParseInsertPolicy(ji.get<std::string>());
  }
  if (j.contains("det_thresh") && !j.at("det_thresh").is_null())
    merge_.det_thresh = j.at("det_thresh").get<double>();
}

void ConfigManager::parse_light_curve_(const nlohmann::json& j) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    lc_.Add(it.key(), io::DatasetFromJson(it.value()));
  }
  has_lc_ = true;
}

void ConfigManager::parse_selection_(const nlohmann::json& j) {
  sel_.dataset = j.value("dataset", std::string{});
  if (j.contains("rows")) {
    sel_.rows = RowSelection(j.at("rows").get<std::vector<std::size_t>>());
  } else if (has_lc_ && lc_.has(sel_.dataset)) {
    sel_.rows = RowSelection::All(lc_.dataset(sel_.dataset).size());
  } else {
    sel_.rows = RowSelection::All(ul_table_.size());
  }
}

void ConfigManager::parse_upper_limits_(const nlohmann::json& j) {
  ul_.detections_as_rates = j.value("detections_as_rates", true);
  ul_.conf                = j.value("conf", merge::kDefaultULConf);
  if (j.contains("det_thresh") && !j.at("det_thresh").is_null())
    ul_.det_thresh = j.at("det_thresh").get<double>();

  if (j.contains("bands")) {
    const auto& jb = j.at("bands");
    std::vector<std::string> names;
    if (jb.is_string()) names.push_back(jb.get<std::string>());
    else                names = jb.get<std::vector<std::string>>();
    ul_.bands = ParseBands(names);
  }

  ul_table_.clear();
  for (const auto& jr : j.at("rows")) ul_table_.push_back(io::MultiBandRowFromJson(jr));
}

} // namespace lcmerge
