#include "lcmerge/io/BinJson.hh"
#include "lcmerge/core/Errors.hh"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace lcmerge::io {

using nlohmann::json;

namespace {

// NaN is not representable in JSON; write null.
json num(double v) { return std::isfinite(v) ? json(v) : json(nullptr); }

// Counts may arrive as 12 or 12.0; anything not an exact int64 is rejected.
std::int64_t read_counts(const json& j, const std::string& key) {
  const json& v = j.at(key);
  if (v.is_number_integer()) {
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw InvalidArgument(key + " exceeds the 64-bit integer range, got " + v.dump());
    }
    const std::int64_t n = v.get<std::int64_t>();
    if (n < 0) throw InvalidArgument(key + " must be non-negative, got " + v.dump());
    return n;
  }
  const double counts = v.get<double>();
  if (!std::isfinite(counts) || counts < 0.0 || std::floor(counts) != counts ||
      counts >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    std::ostringstream os;
    os << key << " must be a non-negative 64-bit integer, got " << counts;
    throw InvalidArgument(os.str());
  }
  return static_cast<std::int64_t>(counts);
}

} // namespace

Bin BinFromJson(const json& j, Kind kind) {
  Bin b;
  b.time     = j.at("Time").get<double>();
  b.time_pos = std::fabs(j.value("TimePos", 0.0));
  b.time_neg = std::fabs(j.value("TimeNeg", 0.0));

  b.counts_in_source  = read_counts(j, "CountsInSource");
  b.background_counts = j.at("BackgroundCounts").get<double>();
  b.correction_factor = j.value("CorrectionFactor", 1.0);
  b.exposure          = j.at("Exposure").get<double>();

  b.frac_exp = j.value("FracExp", 1.0);
  b.bg_rate  = j.value("BGRate", 0.0);
  b.bg_err   = j.value("BGErr", 0.0);
  if (j.contains("Sigma") && !j.at("Sigma").is_null()) b.sigma = j.at("Sigma").get<double>();
  b.snr = j.value("SNR", 0.0);

  if (kind == Kind::Detection) {
    DetectionMeasurement d;
    d.rate     = j.at("Rate").get<double>();
    d.rate_pos = j.at("RatePos").get<double>();
    d.rate_neg = j.at("RateNeg").get<double>();
    b.measurement = d;
  } else {
    UpperLimitMeasurement u;
    u.upper_limit = j.at("UpperLimit").get<double>();
    b.measurement = u;
  }
  return b;
}

Dataset DatasetFromJson(const json& j) {
  const Kind kind = ParseKind(j.at("kind").get<std::string>());
  std::vector<Bin> bins;
  for (const auto& jb : j.at("bins")) bins.push_back(BinFromJson(jb, kind));
  return Dataset(kind, std::move(bins));
}

MultiBandRow MultiBandRowFromJson(const json& j) {
  MultiBandRow row;
  row.source_exposure = j.at("SourceExposure").get<double>();
  row.image_exposure  = j.at("ImageExposure").get<double>();
  for (Band b : kAllBands) {
    const std::string name = BandName(b);
    if (!j.contains(name) || j.at(name).is_null()) continue;
    const auto& jb = j.at(name);
    BandColumns c;
    c.counts            = read_counts(jb, "Counts");
    c.bg_counts         = jb.at("BGCounts").get<double>();
    c.correction_factor = jb.at("CorrectionFactor").get<double>();
    c.exposure          = jb.value("Exposure", row.image_exposure);
    row.band(b) = c;
  }
  return row;
}

json ToJson(const Bin& b) {
  json j;
  j["Time"]     = b.time;
  j["TimePos"]  = b.time_pos;
  j["TimeNeg"]  = b.time_neg;
  if (const auto* d = std::get_if<DetectionMeasurement>(&b.measurement)) {
    j["Rate"] = d->rate;
  } else {
    j["UpperLimit"] = std::get<UpperLimitMeasurement>(b.measurement).upper_limit;
  }
  j["RatePos"]          = b.rate_pos();
  j["RateNeg"]          = b.rate_neg();
  j["FracExp"]          = num(b.frac_exp);
  j["BGRate"]           = b.bg_rate;
  j["BGErr"]            = b.bg_err;
  j["CorrectionFactor"] = b.correction_factor;
  j["CountsInSource"]   = b.counts_in_source;
  j["BackgroundCounts"] = b.background_counts;
  j["Exposure"]         = b.exposure;
  j["Sigma"]            = num(b.sigma);
  j["SNR"]              = b.snr;
  return j;
}

json ToJson(const Dataset& ds) {
  json j;
  j["kind"] = KindName(ds.kind());
  j["bins"] = json::array();
  for (const auto& b : ds.bins()) j["bins"].push_back(ToJson(b));
  return j;
}

json ToJson(const merge::MergeResult& r) {
  json j;
  j["isUpperLimit"] = r.is_upper_limit;
  j["inserted"]     = r.was_inserted;
  j["row"]          = ToJson(r.merged_row);
  return j;
}

json ToJson(const merge::UpperLimitMergeResult& r) {
  json j;
  j["SourceExposure"] = r.source_exposure;
  j["ImageExposure"]  = r.image_exposure;
  for (const auto& kv : r.bands) {
    const std::string p = BandName(kv.first) + "_";
    const auto& br = kv.second;
    j[p + "UpperLimit"]       = br.upper_limit;
    j[p + "Counts"]           = br.counts;
    j[p + "BGCounts"]         = br.bg_counts;
    j[p + "CorrectionFactor"] = br.correction_factor;
    if (br.rate) {
      j[p + "Rate"]       = num(br.rate->rate);
      j[p + "RatePos"]    = num(br.rate->rate_pos);
      j[p + "RateNeg"]    = num(br.rate->rate_neg);
      j[p + "IsDetected"] = br.rate->is_detected;
    }
  }
  return j;
}

} // namespace lcmerge::io
