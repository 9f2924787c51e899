#pragma once

/// @file event_script.hpp
/// @brief Loader for the line-oriented event script format.
/// @ingroup io_loaders

#include <ridesim/io/scenario_loader.hpp>

#include <filesystem>
#include <string_view>

namespace ridesim::io {

/// @brief Parse an event script.
///
/// Each non-blank line that does not start with `#` is one request:
///
/// @code
/// <time> RiderRequest <id> <row,col origin> <row,col destination> <patience>
/// <time> DriverRequest <id> <row,col location> <speed>
/// @endcode
///
/// Tokens are separated by spaces or tabs. Numbers are non-negative
/// integers and locations are written `row,col` without spaces.
///
/// @param script  Script contents.
/// @return The requests, in line order.
///
/// @throws ParseError  If a line is malformed or an identifier is reused.
///
/// @see load_event_script
ScenarioData parse_event_script(std::string_view script);

/// @brief Read and parse an event script file.
/// @throws LoaderError  If the file cannot be read.
/// @throws ParseError   If a line is malformed.
ScenarioData load_event_script(const std::filesystem::path& path);

} // namespace ridesim::io
