#pragma once
#include "tracedmcp/tools/manager.hpp"
#include "tracedmcp/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tracedmcp::tools::weather
{

constexpr int DEFAULT_FORECAST_DAYS = 3;
constexpr int MAX_FORECAST_DAYS = 7;

struct Weather
{
    std::string location;
    int temperature{0};
    std::string condition;
    int humidity{0};
    int wind_speed{0};
};

struct DailyForecast
{
    int day{0};
    int high{0};
    int low{0};
    std::string condition;
    int precipitation_chance{0};
};

void to_json(Json& j, const Weather& w);
void to_json(Json& j, const DailyForecast& f);

/// Data source behind the weather tools. Implementations report upstream failures by throwing;
/// the registry turns those into ExecutionFailed.
class WeatherSource
{
  public:
    virtual ~WeatherSource() = default;
    virtual Weather current(const std::string& location) const = 0;
    virtual std::vector<DailyForecast> forecast(const std::string& location, int days) const = 0;
};

/// Plausible readings derived only from the location string, so the same input always
/// produces the same output.
class SimulatedWeatherSource : public WeatherSource
{
  public:
    Weather current(const std::string& location) const override;
    std::vector<DailyForecast> forecast(const std::string& location, int days) const override;
};

Tool make_get_weather_tool(std::shared_ptr<const WeatherSource> source);
Tool make_get_forecast_tool(std::shared_ptr<const WeatherSource> source);

/// Registers get_weather and get_forecast.
void register_weather_tools(ToolManager& tools, std::shared_ptr<const WeatherSource> source =
                                                    std::make_shared<SimulatedWeatherSource>());

} // namespace tracedmcp::tools::weather
