#pragma once
#include <nlohmann/json.hpp>

#include "lcmerge/lightcurve/Bin.hh"
#include "lcmerge/lightcurve/Dataset.hh"
#include "lcmerge/lightcurve/UpperLimitTable.hh"
#include "lcmerge/merge/LightCurveMerger.hh"
#include "lcmerge/merge/MultiBandUpperLimitMerger.hh"

namespace lcmerge::io {

/// Column names follow the light-curve products: Time, TimePos, TimeNeg,
/// CountsInSource, BackgroundCounts, CorrectionFactor, Exposure, and either
/// Rate/RatePos/RateNeg or UpperLimit. TimeNeg may be given with either sign.
Bin BinFromJson(const nlohmann::json& j, Kind kind);
Dataset DatasetFromJson(const nlohmann::json& j);
MultiBandRow MultiBandRowFromJson(const nlohmann::json& j);

nlohmann::json ToJson(const Bin& b);
nlohmann::json ToJson(const Dataset& ds);
nlohmann::json ToJson(const merge::MergeResult& r);
/// Flat "{Band}_{Column}" keys, as in the catalogue tables.
nlohmann::json ToJson(const merge::UpperLimitMergeResult& r);

} // namespace lcmerge::io
