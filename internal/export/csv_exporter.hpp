#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/state/snapshot_store.hpp"

namespace telemetry::csv {

struct CsvDocument {
  std::string text;
  std::size_t rows{0};
};

/*
  Flattens saved series into one table.

  Header: series, t_s, then the union of every snapshot's metric ids in
  first-seen order. One row per sample per snapshot; metrics a snapshot
  does not have, and absent values, are empty cells.
*/
CsvDocument ExportSeries(const std::vector<std::shared_ptr<const state::SeriesSnapshot>>& snapshots);

// RFC 4180: quotes fields containing a comma, a quote or a line break.
std::string QuoteField(std::string_view field);

// Writes `text` to `path`, replacing the file. Throws std::runtime_error.
void WriteFile(const std::string& path, const std::string& text);

} // namespace telemetry::csv
