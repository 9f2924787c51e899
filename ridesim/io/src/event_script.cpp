#include <ridesim/io/event_script.hpp>
#include <ridesim/io/error.hpp>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace ridesim::io {

namespace {

std::vector<std::string_view> split_tokens(std::string_view line) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        pos = line.find_first_not_of(" \t\r", pos);
        if (pos == std::string_view::npos) {
            break;
        }
        std::size_t end = line.find_first_of(" \t\r", pos);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        tokens.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return tokens;
}

template<typename T>
T parse_number(std::string_view token, std::string_view what, const std::string& context) {
    T value{};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        throw ParseError("invalid " + std::string(what) + " '" + std::string(token) + "'", context);
    }
    return value;
}

core::Location parse_location(std::string_view token, const std::string& context) {
    std::size_t comma = token.find(',');
    if (comma == std::string_view::npos) {
        throw ParseError("invalid location '" + std::string(token) + "', expected row,col", context);
    }
    // Values beyond int64_t fail with result_out_of_range
    auto row = parse_number<int64_t>(token.substr(0, comma), "location row", context);
    auto col = parse_number<int64_t>(token.substr(comma + 1), "location column", context);
    if (row < 0 || col < 0) {
        throw ParseError("location '" + std::string(token) + "' must not be negative", context);
    }
    return {row, col};
}

} // anonymous namespace

ScenarioData parse_event_script(std::string_view script) {
    ScenarioData result;
    std::unordered_set<std::string> rider_ids;
    std::unordered_set<std::string> driver_ids;

    std::size_t line_number = 0;
    std::size_t pos = 0;
    while (pos <= script.size()) {
        std::size_t newline = script.find('\n', pos);
        if (newline == std::string_view::npos) {
            newline = script.size();
        }
        std::string_view line = script.substr(pos, newline - pos);
        pos = newline + 1;
        ++line_number;

        auto tokens = split_tokens(line);
        if (tokens.empty() || tokens.front().starts_with('#')) {
            continue;
        }

        std::string ctx = "line " + std::to_string(line_number);
        if (tokens.size() < 2) {
            throw ParseError("expected '<time> <kind> ...'", ctx);
        }

        auto time = parse_number<core::TimePoint>(tokens[0], "timestamp", ctx);
        std::string_view kind = tokens[1];

        if (kind == "RiderRequest") {
            if (tokens.size() != 6) {
                throw ParseError("RiderRequest takes <id> <origin> <destination> <patience>", ctx);
            }
            std::string id(tokens[2]);
            if (!rider_ids.insert(id).second) {
                throw ParseError("duplicate rider id '" + id + "'", ctx);
            }
            result.requests.emplace_back(RiderRequestParams{
                .time = time,
                .id = std::move(id),
                .origin = parse_location(tokens[3], ctx),
                .destination = parse_location(tokens[4], ctx),
                .patience = parse_number<core::Duration>(tokens[5], "patience", ctx),
            });
        } else if (kind == "DriverRequest") {
            if (tokens.size() != 5) {
                throw ParseError("DriverRequest takes <id> <location> <speed>", ctx);
            }
            std::string id(tokens[2]);
            if (!driver_ids.insert(id).second) {
                throw ParseError("duplicate driver id '" + id + "'", ctx);
            }
            result.requests.emplace_back(DriverRequestParams{
                .time = time,
                .id = std::move(id),
                .location = parse_location(tokens[3], ctx),
                .speed = parse_number<core::Speed>(tokens[4], "speed", ctx),
            });
        } else {
            throw ParseError("unknown event kind '" + std::string(kind) + "'", ctx);
        }
    }

    return result;
}

ScenarioData load_event_script(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return parse_event_script(oss.str());
}

} // namespace ridesim::io
