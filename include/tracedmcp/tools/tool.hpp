#pragma once
#include "tracedmcp/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace tracedmcp::tools
{

/// A named, schema-described callable exposed through tools/call.
class Tool
{
  public:
    using Fn = std::function<Json(const Json&)>;

    Tool() = default;

    Tool(std::string name, Json input_schema, Json output_schema, Fn fn,
         std::optional<std::string> description = std::nullopt)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), output_schema_(std::move(output_schema)),
          fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::optional<std::string>& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    const Json& output_schema() const
    {
        return output_schema_;
    }
    Json invoke(const Json& input) const
    {
        return fn_(input);
    }

    Tool& set_description(std::string desc)
    {
        description_ = std::move(desc);
        return *this;
    }

    /// tools/list entry
    Json descriptor() const
    {
        Json entry = {{"name", name_}};
        if (description_)
            entry["description"] = *description_;
        entry["inputSchema"] =
            input_schema_.is_null() ? Json{{"type", "object"}} : input_schema_;
        if (!output_schema_.is_null() && !output_schema_.empty())
            entry["outputSchema"] = output_schema_;
        return entry;
    }

  private:
    std::string name_;
    std::optional<std::string> description_;
    Json input_schema_;
    Json output_schema_;
    Fn fn_;
};

} // namespace tracedmcp::tools
