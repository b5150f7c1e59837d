// include/signal_ngin/core/bar_validation.hpp
#pragma once

#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Check a bar window against the engine's input contract
 *
 * Rejects non-ascending or duplicate timestamps, non-finite OHLCV fields,
 * negative volume and bars whose high is below their low. An empty window
 * is valid.
 *
 * @param bars Bar window supplied by the caller
 * @param component Component name reported in the error
 * @return Result<void> with INVALID_DATA on the first violation found
 */
Result<void> validate_bars(const std::vector<Bar>& bars, const std::string& component);

}  // namespace signal_ngin
