#include "csv_exporter.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace telemetry::csv {

namespace {

void AppendRow(std::string& out, const std::vector<std::string>& cells) {
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i != 0) {
      out.push_back(',');
    }
    out += QuoteField(cells[i]);
  }
  out += "\r\n";
}

} // namespace

std::string QuoteField(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string quoted;
  quoted.reserve(field.size() + 2);
  quoted.push_back('"');
  for (char c : field) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

CsvDocument ExportSeries(const std::vector<std::shared_ptr<const state::SeriesSnapshot>>& snapshots) {
  std::vector<std::string>        columns;
  std::unordered_set<std::string> seen;
  for (const auto& snapshot : snapshots) {
    for (const auto& metric_id : snapshot->metric_ids) {
      if (seen.insert(metric_id).second) {
        columns.push_back(metric_id);
      }
    }
  }

  CsvDocument document;

  std::vector<std::string> header = {"series", "t_s"};
  header.insert(header.end(), columns.begin(), columns.end());
  AppendRow(document.text, header);

  std::vector<std::string> cells;
  for (const auto& snapshot : snapshots) {
    std::vector<const std::vector<state::SampleValue>*> values;
    values.reserve(columns.size());
    for (const auto& column : columns) {
      values.push_back(snapshot->ValuesFor(column));
    }

    for (std::size_t row = 0; row < snapshot->times.size(); ++row) {
      cells.clear();
      cells.push_back(snapshot->name);
      cells.push_back(fmt::format("{:.2f}", snapshot->times[row]));
      for (const auto* column_values : values) {
        if (column_values == nullptr || row >= column_values->size() || !(*column_values)[row]) {
          cells.emplace_back();
          continue;
        }
        cells.push_back(fmt::format("{}", *(*column_values)[row]));
      }
      AppendRow(document.text, cells);
      ++document.rows;
    }
  }

  return document;
}

void WriteFile(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open '" + path + "' for writing");
  }
  out << text;
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing '" + path + "'");
  }
}

} // namespace telemetry::csv
