#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge::tools {

enum class ParamKind {
    String,
    Bool,
    Integer,
    Number,
    Enum,
};

struct ParameterSpec {
    std::string name;
    ParamKind kind = ParamKind::String;
    std::string description;
    bool required = false;
    std::optional<nlohmann::json> default_value;
    std::vector<std::string> enum_values; // ParamKind::Enum only
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    // overrides the server-wide execution window when set
    std::optional<std::chrono::milliseconds> timeout;
};

ParameterSpec required_string(std::string name, std::string description);
ParameterSpec optional_string(std::string name, std::string description,
                              std::optional<std::string> default_value = std::nullopt);
ParameterSpec optional_bool(std::string name, std::string description, bool default_value);
ParameterSpec optional_integer(std::string name, std::string description,
                               std::optional<int64_t> default_value = std::nullopt);
ParameterSpec optional_number(std::string name, std::string description,
                              std::optional<double> default_value = std::nullopt);
ParameterSpec enum_param(std::string name, std::string description, std::vector<std::string> values,
                         std::string default_value);

/// JSON Schema rendering used by tools/list.
nlohmann::json describe(const ToolDescriptor& descriptor);

class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string parameter, const std::string& message)
        : std::runtime_error(message), parameter_(std::move(parameter)) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

/**
 * Arguments after validation: declared parameters only, defaults applied,
 * kinds checked. Accessors throw std::out_of_range for absent parameters.
 */
class ToolArguments {
public:
    ToolArguments() = default;
    explicit ToolArguments(nlohmann::json values) : values_(std::move(values)) {}

    bool has(const std::string& name) const;
    std::string get_string(const std::string& name) const;
    bool get_bool(const std::string& name) const;
    int64_t get_int(const std::string& name) const;
    double get_number(const std::string& name) const;

    std::optional<std::string> find_string(const std::string& name) const;
    std::optional<int64_t> find_int(const std::string& name) const;

    const nlohmann::json& values() const { return values_; }

private:
    const nlohmann::json& at(const std::string& name) const;

    nlohmann::json values_ = nlohmann::json::object();
};

/// @throws ValidationError naming the offending parameter
ToolArguments validate_arguments(const ToolDescriptor& descriptor, const nlohmann::json& arguments);

} // namespace toolbridge::tools
