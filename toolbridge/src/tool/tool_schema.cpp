#include "tool_schema.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace toolbridge::tools {

namespace {

const char* json_type_name(ParamKind kind) {
    switch (kind) {
        case ParamKind::String:
        case ParamKind::Enum:
            return "string";
        case ParamKind::Bool:
            return "boolean";
        case ParamKind::Integer:
            return "integer";
        case ParamKind::Number:
            return "number";
    }
    return "string";
}

std::string join(const std::vector<std::string>& values, const char* separator) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += value;
    }
    return joined;
}

[[noreturn]] void type_mismatch(const ParameterSpec& spec, const std::string& expected) {
    throw ValidationError(spec.name, "Parameter '" + spec.name + "' must be " + expected);
}

nlohmann::json check_kind(const ParameterSpec& spec, const nlohmann::json& value) {
    switch (spec.kind) {
        case ParamKind::String:
            if (!value.is_string()) {
                type_mismatch(spec, "a string");
            }
            return value;
        case ParamKind::Bool:
            if (!value.is_boolean()) {
                type_mismatch(spec, "a boolean");
            }
            return value;
        case ParamKind::Integer:
            if (value.is_number_unsigned()) {
                if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    type_mismatch(spec, "an integer within range");
                }
                return static_cast<int64_t>(value.get<uint64_t>());
            }
            if (value.is_number_integer()) {
                return value;
            }
            if (value.is_number_float()) {
                double d = value.get<double>();
                if (std::isfinite(d) && std::trunc(d) == d &&
                    d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                    d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                    return static_cast<int64_t>(d);
                }
            }
            type_mismatch(spec, "an integer");
        case ParamKind::Number:
            if (!value.is_number()) {
                type_mismatch(spec, "a number");
            }
            return value;
        case ParamKind::Enum:
            if (!value.is_string() ||
                std::find(spec.enum_values.begin(), spec.enum_values.end(), value.get<std::string>()) ==
                    spec.enum_values.end()) {
                type_mismatch(spec, "one of: " + join(spec.enum_values, ", "));
            }
            return value;
    }
    return value;
}

} // namespace

ParameterSpec required_string(std::string name, std::string description) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::String;
    spec.description = std::move(description);
    spec.required = true;
    return spec;
}

ParameterSpec optional_string(std::string name, std::string description, std::optional<std::string> default_value) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::String;
    spec.description = std::move(description);
    if (default_value) {
        spec.default_value = *default_value;
    }
    return spec;
}

ParameterSpec optional_bool(std::string name, std::string description, bool default_value) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Bool;
    spec.description = std::move(description);
    spec.default_value = default_value;
    return spec;
}

ParameterSpec optional_integer(std::string name, std::string description, std::optional<int64_t> default_value) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Integer;
    spec.description = std::move(description);
    if (default_value) {
        spec.default_value = *default_value;
    }
    return spec;
}

ParameterSpec optional_number(std::string name, std::string description, std::optional<double> default_value) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Number;
    spec.description = std::move(description);
    if (default_value) {
        spec.default_value = *default_value;
    }
    return spec;
}

ParameterSpec enum_param(std::string name, std::string description, std::vector<std::string> values,
                         std::string default_value) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Enum;
    spec.description = std::move(description);
    spec.enum_values = std::move(values);
    spec.default_value = std::move(default_value);
    return spec;
}

nlohmann::json describe(const ToolDescriptor& descriptor) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& spec : descriptor.parameters) {
        nlohmann::json property = {
            {"type", json_type_name(spec.kind)},
            {"description", spec.description},
        };
        if (spec.kind == ParamKind::Enum) {
            property["enum"] = spec.enum_values;
        }
        if (spec.default_value) {
            property["default"] = *spec.default_value;
        }
        properties[spec.name] = std::move(property);

        if (spec.required && !spec.default_value) {
            required.push_back(spec.name);
        }
    }

    return {
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", {
            {"type", "object"},
            {"properties", std::move(properties)},
            {"required", std::move(required)},
        }},
    };
}

bool ToolArguments::has(const std::string& name) const {
    return values_.contains(name);
}

const nlohmann::json& ToolArguments::at(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("argument not present: " + name);
    }
    return *it;
}

std::string ToolArguments::get_string(const std::string& name) const {
    return at(name).get<std::string>();
}

bool ToolArguments::get_bool(const std::string& name) const {
    return at(name).get<bool>();
}

int64_t ToolArguments::get_int(const std::string& name) const {
    return at(name).get<int64_t>();
}

double ToolArguments::get_number(const std::string& name) const {
    return at(name).get<double>();
}

std::optional<std::string> ToolArguments::find_string(const std::string& name) const {
    if (!has(name)) {
        return std::nullopt;
    }
    return get_string(name);
}

std::optional<int64_t> ToolArguments::find_int(const std::string& name) const {
    if (!has(name)) {
        return std::nullopt;
    }
    return get_int(name);
}

ToolArguments validate_arguments(const ToolDescriptor& descriptor, const nlohmann::json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw ValidationError("arguments", "arguments must be an object");
    }

    nlohmann::json validated = nlohmann::json::object();
    for (const auto& spec : descriptor.parameters) {
        const nlohmann::json* value = nullptr;
        if (arguments.is_object()) {
            auto it = arguments.find(spec.name);
            if (it != arguments.end() && !it->is_null()) {
                value = &*it;
            }
        }

        if (!value) {
            if (spec.default_value) {
                validated[spec.name] = *spec.default_value;
            } else if (spec.required) {
                throw ValidationError(spec.name, "Missing required parameter: " + spec.name);
            }
            continue;
        }

        validated[spec.name] = check_kind(spec, *value);
    }
    // undeclared arguments are dropped, not rejected
    return ToolArguments(std::move(validated));
}

} // namespace toolbridge::tools
