#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tw {
namespace cli {

/// Decimal size in [0, 2^32); nullopt for anything else.
std::optional<size_t> parse_payload_size(const std::string& text);

/**
 * @brief tunnelwatch replay <trace> [--config <file>]
 *
 * Findings and the closing stats go to @p out, usage errors to @p err.
 * Failures after argument checking are logged and return 1.
 */
int handle_replay(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

/// tunnelwatch framelen <cipher> <mac> [payload]
int handle_framelen(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace tw
