#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lcmerge {

/// Catalogue energy bands.
enum class Band { Total = 0, Soft, Medium, Hard };

constexpr std::size_t kNBands = 4;
constexpr std::array<Band, kNBands> kAllBands{Band::Total, Band::Soft, Band::Medium, Band::Hard};

std::string BandName(Band b);
/// Case-insensitive: "total", "SOFT", "Medium", ... Unknown names throw InvalidArgument.
Band ParseBand(const std::string& s);
/// {"all"} (or an empty list) selects every band; otherwise each name is parsed.
std::vector<Band> ParseBands(const std::vector<std::string>& names);

/// Columns one row contributes to one band.
struct BandColumns {
  std::int64_t counts            = 0;
  double       bg_counts         = 0.0;
  double       correction_factor = 1.0;
  double       exposure          = 0.0;  ///< s
};

/// One row of a catalogue upper-limit table. Bands may be absent.
struct MultiBandRow {
  double source_exposure = 0.0;
  double image_exposure  = 0.0;
  std::array<std::optional<BandColumns>, kNBands> bands;

  const std::optional<BandColumns>& band(Band b) const { return bands[static_cast<std::size_t>(b)]; }
  std::optional<BandColumns>&       band(Band b)       { return bands[static_cast<std::size_t>(b)]; }
};

using MultiBandTable = std::vector<MultiBandRow>;

} // namespace lcmerge
