// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace talktype::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ConfigError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Reads the fields of one section of a config object into existing values.
///
/// A missing section or key leaves the target untouched, so the targets keep their defaults.
/// A value of the wrong JSON type is not applied; the first one is reported by status() as a
/// ConfigError naming "section.key".
class SectionReader
{
  public:
    SectionReader(const nlohmann::json& root, std::string_view section): _section(section)
    {
        auto const it = root.find(_section);
        if (it == root.end())
            return;

        if (!it->is_object())
        {
            _error = Error { ErrorCode::ConfigError, std::format("'{}' must be a JSON object", _section) };
            return;
        }
        _object = &*it;
    }

    void read(std::string_view key, std::string& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_string())
                out = value->get<std::string>();
            else
                mismatch(key, "a string");
        }
    }

    void read(std::string_view key, bool& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_boolean())
                out = value->get<bool>();
            else
                mismatch(key, "true or false");
        }
    }

    void read(std::string_view key, int& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_number_integer())
                out = value->get<int>();
            else
                mismatch(key, "an integer");
        }
    }

    void read(std::string_view key, std::int64_t& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_number_integer())
                out = value->get<std::int64_t>();
            else
                mismatch(key, "an integer");
        }
    }

    void read(std::string_view key, float& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_number())
                out = value->get<float>();
            else
                mismatch(key, "a number");
        }
    }

    /// @brief null clears the value.
    void read(std::string_view key, std::optional<float>& out)
    {
        if (auto const* value = find(key))
        {
            if (value->is_number())
                out = value->get<float>();
            else if (value->is_null())
                out.reset();
            else
                mismatch(key, "a number or null");
        }
    }

    /// @brief Returns the first type error of this section, if any.
    [[nodiscard]] auto status() const -> VoidResult
    {
        if (_error)
            return std::unexpected(*_error);
        return {};
    }

  private:
    [[nodiscard]] auto find(std::string_view key) const -> const nlohmann::json*
    {
        if (!_object)
            return nullptr;

        auto const it = _object->find(std::string(key));
        return it != _object->end() ? &*it : nullptr;
    }

    void mismatch(std::string_view key, std::string_view expected)
    {
        if (!_error)
            _error = Error { ErrorCode::ConfigError, std::format("{}.{} must be {}", _section, key, expected) };
    }

    const nlohmann::json* _object = nullptr;
    std::string _section;
    std::optional<Error> _error;
};

} // namespace talktype::json
