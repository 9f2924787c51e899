#include <ridesim/io/scenario_loader.hpp>
#include <ridesim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

namespace ridesim::io {

namespace {

using namespace ridesim::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString() || member.GetStringLength() == 0) {
        throw LoaderError(std::string("field '") + name + "' must be a non-empty string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

Location get_location(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray() || member.Size() != 2 || !member[0].IsInt64() || !member[1].IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be a [row, col] pair", context);
    }
    Location location{member[0].GetInt64(), member[1].GetInt64()};
    if (location.row < 0 || location.col < 0) {
        throw LoaderError(std::string("field '") + name + "' must not be negative", context);
    }
    return location;
}

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    if (!doc.HasMember("requests")) {
        // Empty scenario is valid
        return;
    }

    const auto& requests = doc["requests"];
    if (!requests.IsArray()) {
        throw LoaderError("field 'requests' must be an array", "scenario");
    }

    std::unordered_set<std::string> rider_ids;
    std::unordered_set<std::string> driver_ids;

    for (rapidjson::SizeType idx = 0; idx < requests.Size(); ++idx) {
        const auto& obj = requests[idx];
        std::string ctx = "requests[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("request must be an object", ctx);
        }

        std::string type = get_string(obj, "type", ctx);
        TimePoint time = get_uint64(obj, "time", ctx);
        std::string id = get_string(obj, "id", ctx);

        if (type == "rider") {
            if (!rider_ids.insert(id).second) {
                throw LoaderError("duplicate rider id '" + id + "'", ctx);
            }
            result.requests.emplace_back(RiderRequestParams{
                .time = time,
                .id = std::move(id),
                .origin = get_location(obj, "origin", ctx),
                .destination = get_location(obj, "destination", ctx),
                .patience = get_uint64(obj, "patience", ctx),
            });
        } else if (type == "driver") {
            if (!driver_ids.insert(id).second) {
                throw LoaderError("duplicate driver id '" + id + "'", ctx);
            }
            result.requests.emplace_back(DriverRequestParams{
                .time = time,
                .id = std::move(id),
                .location = get_location(obj, "location", ctx),
                .speed = get_uint64(obj, "speed", ctx),
            });
        } else {
            throw LoaderError("unknown request type '" + type + "'", ctx);
        }
    }
}

template<typename Writer>
void write_location(Writer& writer, const char* key, Location location) {
    writer.Key(key);
    writer.StartArray();
    writer.Int64(location.row);
    writer.Int64(location.col);
    writer.EndArray();
}

} // anonymous namespace

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("requests");
    writer.StartArray();

    for (const auto& request : scenario.requests) {
        writer.StartObject();
        if (const auto* rider = std::get_if<RiderRequestParams>(&request)) {
            writer.Key("type");
            writer.String("rider");
            writer.Key("time");
            writer.Uint64(rider->time);
            writer.Key("id");
            writer.String(rider->id.c_str(), static_cast<rapidjson::SizeType>(rider->id.size()));
            write_location(writer, "origin", rider->origin);
            write_location(writer, "destination", rider->destination);
            writer.Key("patience");
            writer.Uint64(rider->patience);
        } else if (const auto* driver = std::get_if<DriverRequestParams>(&request)) {
            writer.Key("type");
            writer.String("driver");
            writer.Key("time");
            writer.Uint64(driver->time);
            writer.Key("id");
            writer.String(driver->id.c_str(), static_cast<rapidjson::SizeType>(driver->id.size()));
            write_location(writer, "location", driver->location);
            writer.Key("speed");
            writer.Uint64(driver->speed);
        }
        writer.EndObject();
    }

    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString() << '\n';
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

} // namespace ridesim::io
