// include/signal_ngin/data/csv_bar_loader.hpp
#pragma once

#include <istream>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace data {

/**
 * @brief Parse OHLCV rows of the form time,open,high,low,close,volume
 *
 * The time column is either epoch seconds or UTC ISO-8601
 * (YYYY-MM-DDTHH:MM:SS with an optional trailing Z). A leading header row and
 * blank lines are skipped. The parsed series is checked with validate_bars.
 *
 * @return FILE_IO_ERROR/INVALID_DATA with the offending line number
 */
Result<std::vector<Bar>> parse_bars_csv(std::istream& input);

Result<std::vector<Bar>> load_bars_csv(const std::string& path);

}  // namespace data
}  // namespace signal_ngin
