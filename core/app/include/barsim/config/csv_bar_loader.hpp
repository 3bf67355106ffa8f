#pragma once

#include "barsim/domain/bar.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// CSV bar input
// -----------------------------------------------------------------------------
//
// @details
// Format:
//
//   # comment lines and blank lines are skipped anywhere
//   key,open,high,low,close,signal,atr
//   1700000000000,100.0,101.5,99.2,100.8,1,0.9
//
// The first non-comment line is the header. The first column is the
// integer bar key (its header name is ignored); every other column must
// hold a number on every row ("nan" and empty cells read as NaN). Nothing
// about prices is checked here: that is InputValidator's job.
//
// @throws ConfigError naming the line for a wrong cell count, a
//         malformed key or a malformed number, and for an unreadable file.
// -----------------------------------------------------------------------------

std::vector<std::string_view> splitCsvLine(std::string_view line,
                                           char delim = ',');

domain::BarTable parseBarsCsv(std::istream& in,
                              const std::string& source = "<stream>");

domain::BarTable loadBarsCsv(const std::string& path);

}  // namespace barsim
