#include "barsim/config/csv_bar_loader.hpp"
#include "barsim/domain/errors.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>

namespace barsim {

namespace {

std::string_view trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

// Next line that is neither blank nor a '#' comment.
std::optional<std::string> nextLine(std::istream& in, std::size_t& line_no) {
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    const auto content = trim(line);
    if (content.empty() || content.front() == '#') {
      continue;
    }
    return line;
  }
  return std::nullopt;
}

[[noreturn]] void fail(const std::string& source,
                       std::size_t line_no,
                       const std::string& what) {
  throw ConfigError(source + ":" + std::to_string(line_no) + ": " + what);
}

std::int64_t parseKey(std::string_view cell,
                      const std::string& source,
                      std::size_t line_no) {
  const std::string text(trim(cell));
  char* end = nullptr;
  errno = 0;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
    fail(source, line_no, "malformed key '" + text + "'");
  }
  return static_cast<std::int64_t>(value);
}

double parseNumber(std::string_view cell,
                   const std::string& source,
                   std::size_t line_no) {
  const std::string text(trim(cell));
  if (text.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    fail(source, line_no, "malformed number '" + text + "'");
  }
  return value;
}

}  // namespace

std::vector<std::string_view> splitCsvLine(std::string_view line, char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start <= line.size()) {
    auto pos = line.find(delim, start);
    if (pos == std::string_view::npos) {
      pos = line.size();
    }
    out.emplace_back(line.substr(start, pos - start));
    start = pos + 1;
    if (pos == line.size()) {
      break;
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// parseBarsCsv: header, then one row per bar
// -----------------------------------------------------------------------------
domain::BarTable parseBarsCsv(std::istream& in, const std::string& source) {
  std::size_t line_no = 0;
  const auto header = nextLine(in, line_no);
  if (!header) {
    fail(source, line_no, "missing header row");
  }

  const auto header_cells = splitCsvLine(*header);
  if (header_cells.size() < 2) {
    fail(source, line_no,
         "header needs a key column and at least one data column");
  }

  std::vector<std::string> names;
  for (std::size_t c = 1; c < header_cells.size(); ++c) {
    names.emplace_back(trim(header_cells[c]));
  }
  std::vector<std::vector<double>> columns(names.size());
  std::vector<std::int64_t> keys;

  while (const auto line = nextLine(in, line_no)) {
    const auto cells = splitCsvLine(*line);
    if (cells.size() != header_cells.size()) {
      fail(source, line_no,
           "expected " + std::to_string(header_cells.size()) + " cells, got " +
               std::to_string(cells.size()));
    }
    keys.push_back(parseKey(cells[0], source, line_no));
    for (std::size_t c = 1; c < cells.size(); ++c) {
      columns[c - 1].push_back(parseNumber(cells[c], source, line_no));
    }
  }

  domain::BarTable table;
  table.keys = std::move(keys);
  for (std::size_t c = 0; c < names.size(); ++c) {
    table.addColumn(names[c], std::move(columns[c]));
  }
  return table;
}

domain::BarTable loadBarsCsv(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open bars file: " + path);
  }
  domain::BarTable table = parseBarsCsv(in, path);
  std::cout << "[CsvBarLoader] loaded " << table.size() << " rows, "
            << table.column_names.size() << " columns from " << path << "\n";
  return table;
}

}  // namespace barsim
