#include "tracedmcp/tools/weather.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace tracedmcp::tools::weather
{
namespace
{

const std::array<const char*, 4> CURRENT_CONDITIONS = {"Sunny", "Cloudy", "Rainy",
                                                       "Partly Cloudy"};
const std::array<const char*, 4> FORECAST_CONDITIONS = {"Sunny", "Cloudy", "Rainy", "Stormy"};

// FNV-1a, stable across platforms and runs
std::uint64_t fnv1a(const std::string& s)
{
    std::uint64_t h = 14695981039346656037ull;
    for (unsigned char c : s)
    {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

/// splitmix64 stream seeded from the location.
class Sequence
{
  public:
    explicit Sequence(std::uint64_t seed) : state_(seed) {}

    int in_range(int lo, int hi)
    {
        auto span = static_cast<std::uint64_t>(hi - lo + 1);
        return lo + static_cast<int>(next() % span);
    }

  private:
    std::uint64_t next()
    {
        std::uint64_t z = (state_ += 0x9e3779b97f4a7c15ull);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
        return z ^ (z >> 31);
    }

    std::uint64_t state_;
};

Json weather_output_schema()
{
    return Json{{"type", "object"},
                {"properties",
                 {{"location", {{"type", "string"}}},
                  {"temperature", {{"type", "integer"}, {"description", "Celsius"}}},
                  {"condition", {{"type", "string"}}},
                  {"humidity", {{"type", "integer"}, {"description", "Percent"}}},
                  {"wind_speed", {{"type", "integer"}, {"description", "km/h"}}}}},
                {"required",
                 Json::array({"location", "temperature", "condition", "humidity", "wind_speed"})}};
}

Json forecast_output_schema()
{
    Json day = {{"type", "object"},
                {"properties",
                 {{"day", {{"type", "integer"}}},
                  {"high", {{"type", "integer"}}},
                  {"low", {{"type", "integer"}}},
                  {"condition", {{"type", "string"}}},
                  {"precipitation_chance", {{"type", "integer"}}}}},
                {"required",
                 Json::array({"day", "high", "low", "condition", "precipitation_chance"})}};
    return Json{{"type", "object"},
                {"properties",
                 {{"location", {{"type", "string"}}},
                  {"items", {{"type", "array"}, {"items", day}}}}},
                {"required", Json::array({"location", "items"})}};
}

} // namespace

void to_json(Json& j, const Weather& w)
{
    j = Json{{"location", w.location},
             {"temperature", w.temperature},
             {"condition", w.condition},
             {"humidity", w.humidity},
             {"wind_speed", w.wind_speed}};
}

void to_json(Json& j, const DailyForecast& f)
{
    j = Json{{"day", f.day},
             {"high", f.high},
             {"low", f.low},
             {"condition", f.condition},
             {"precipitation_chance", f.precipitation_chance}};
}

Weather SimulatedWeatherSource::current(const std::string& location) const
{
    Sequence seq(fnv1a(location));
    Weather w;
    w.location = location;
    w.temperature = seq.in_range(15, 30);
    w.condition = CURRENT_CONDITIONS[static_cast<std::size_t>(
        seq.in_range(0, static_cast<int>(CURRENT_CONDITIONS.size()) - 1))];
    w.humidity = seq.in_range(40, 80);
    w.wind_speed = seq.in_range(5, 25);
    return w;
}

std::vector<DailyForecast> SimulatedWeatherSource::forecast(const std::string& location,
                                                            int days) const
{
    Sequence seq(fnv1a(location) ^ 0x5bd1e995u);
    std::vector<DailyForecast> out;
    days = std::min(days, MAX_FORECAST_DAYS);
    for (int day = 1; day <= days; ++day)
    {
        DailyForecast f;
        f.day = day;
        f.high = seq.in_range(20, 35);
        f.low = seq.in_range(10, 20);
        f.condition = FORECAST_CONDITIONS[static_cast<std::size_t>(
            seq.in_range(0, static_cast<int>(FORECAST_CONDITIONS.size()) - 1))];
        f.precipitation_chance = seq.in_range(0, 100);
        out.push_back(std::move(f));
    }
    return out;
}

Tool make_get_weather_tool(std::shared_ptr<const WeatherSource> source)
{
    Json input = {{"type", "object"},
                  {"properties",
                   {{"location",
                     {{"type", "string"},
                      {"minLength", 1},
                      {"description", "City name to get weather for"}}}}},
                  {"required", Json::array({"location"})}};

    return Tool("get_weather", input, weather_output_schema(),
                [source](const Json& args) -> Json
                { return source->current(args.at("location").get<std::string>()); },
                "Get current weather for a specified location");
}

Tool make_get_forecast_tool(std::shared_ptr<const WeatherSource> source)
{
    Json input = {{"type", "object"},
                  {"properties",
                   {{"location",
                     {{"type", "string"},
                      {"minLength", 1},
                      {"description", "City name for forecast"}}},
                    {"days",
                     {{"type", "integer"},
                      {"minimum", 1},
                      {"default", DEFAULT_FORECAST_DAYS},
                      {"description", "Number of days to forecast (1-7)"}}}}},
                  {"required", Json::array({"location"})}};

    return Tool(
        "get_forecast", input, forecast_output_schema(),
        [source](const Json& args) -> Json
        {
            auto location = args.at("location").get<std::string>();
            // Requests beyond a week are clamped rather than rejected
            int days = DEFAULT_FORECAST_DAYS;
            if (args.contains("days"))
                days = static_cast<int>(std::min<double>(args.at("days").get<double>(),
                                                         MAX_FORECAST_DAYS));
            return Json{{"location", location}, {"items", source->forecast(location, days)}};
        },
        "Get weather forecast for the specified location and number of days");
}

void register_weather_tools(ToolManager& tools, std::shared_ptr<const WeatherSource> source)
{
    tools.register_tool(make_get_weather_tool(source));
    tools.register_tool(make_get_forecast_tool(source));
}

} // namespace tracedmcp::tools::weather
