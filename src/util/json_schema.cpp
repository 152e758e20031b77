#include "tracedmcp/util/json_schema.hpp"

#include <cmath>
#include <string>

namespace tracedmcp::util::schema {

static bool is_type(const Json& inst, const std::string& type) {
  if (type == "object") return inst.is_object();
  if (type == "array") return inst.is_array();
  if (type == "string") return inst.is_string();
  if (type == "number") return inst.is_number();
  if (type == "integer") {
    if (inst.is_number_integer()) return true;
    // 3.0 is an integer per JSON Schema
    if (!inst.is_number_float()) return false;
    double d = inst.get<double>();
    return std::isfinite(d) && std::floor(d) == d;
  }
  if (type == "boolean") return inst.is_boolean();
  if (type == "null") return inst.is_null();
  return true; // unknown treated as pass-through
}

static bool matches_type(const Json& schema, const Json& inst) {
  const auto& t = schema["type"];
  if (t.is_string()) return is_type(inst, t.get<std::string>());
  if (t.is_array()) {
    for (const auto& alt : t)
      if (alt.is_string() && is_type(inst, alt.get<std::string>())) return true;
    return false;
  }
  return true;
}

static std::string at(const std::string& path) { return path.empty() ? "value" : path; }

static std::string join(const std::string& path, const std::string& key) {
  return path.empty() ? key : path + "." + key;
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path);

static void validate_object(const Json& schema, const Json& inst, const std::string& path) {
  if (schema.contains("required") && schema["required"].is_array()) {
    for (const auto& req : schema["required"]) {
      auto key = req.get<std::string>();
      if (!inst.contains(key)) throw ValidationError("missing required: " + join(path, key));
    }
  }
  bool has_props = schema.contains("properties") && schema["properties"].is_object();
  if (has_props) {
    for (const auto& [name, subschema] : schema["properties"].items()) {
      if (inst.contains(name)) validate_at(subschema, inst[name], join(path, name));
    }
  }
  auto ap = schema.find("additionalProperties");
  if (ap != schema.end() && ap->is_boolean() && !ap->get<bool>()) {
    for (const auto& [name, value] : inst.items()) {
      (void)value;
      if (!has_props || !schema["properties"].contains(name))
        throw ValidationError("unexpected property: " + join(path, name));
    }
  }
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path) {
  if (!schema.is_object()) return;

  if (schema.contains("type") && !matches_type(schema, inst))
    throw ValidationError("type mismatch for: " + at(path) + " (expected " + schema["type"].dump() + ")");

  if (schema.contains("enum") && schema["enum"].is_array()) {
    bool found = false;
    for (const auto& allowed : schema["enum"])
      if (allowed == inst) { found = true; break; }
    if (!found) throw ValidationError("value not allowed for: " + at(path));
  }

  if (inst.is_number()) {
    double v = inst.get<double>();
    if (schema.contains("minimum") && v < schema["minimum"].get<double>())
      throw ValidationError(at(path) + " must be >= " + schema["minimum"].dump());
    if (schema.contains("maximum") && v > schema["maximum"].get<double>())
      throw ValidationError(at(path) + " must be <= " + schema["maximum"].dump());
  }

  if (inst.is_string()) {
    auto len = inst.get_ref<const std::string&>().size();
    if (schema.contains("minLength") && len < schema["minLength"].get<std::size_t>())
      throw ValidationError(at(path) + " is shorter than " + schema["minLength"].dump());
    if (schema.contains("maxLength") && len > schema["maxLength"].get<std::size_t>())
      throw ValidationError(at(path) + " is longer than " + schema["maxLength"].dump());
  }

  if (inst.is_object()) validate_object(schema, inst, path);

  if (inst.is_array() && schema.contains("items") && schema["items"].is_object()) {
    std::size_t i = 0;
    for (const auto& item : inst) validate_at(schema["items"], item, path + "[" + std::to_string(i++) + "]");
  }
}

void validate(const Json& schema, const Json& instance) {
  validate_at(schema, instance, "");
}

} // namespace tracedmcp::util::schema
