#pragma once
#include <toml.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace gatecore {

using toml_value_t = toml::value;
using toml_table_t = toml_value_t::table_type;
using toml_array_t = toml_value_t::array_type;

// 读取可选的整数配置，类型不对时抛出 std::logic_error
inline bool read_toml_integer(int64_t& value, const std::string& key, const toml_table_t& table) {
    const auto it = table.find(key);
    if (it == table.end()) {
        return false;
    }

    if (!it->second.is_integer()) {
        throw std::logic_error(fmt::format("config key '{}' must be an integer", key));
    }

    value = static_cast<int64_t>(it->second.as_integer());
    return true;
}

inline bool read_toml_string(std::string& value, const std::string& key, const toml_table_t& table) {
    const auto it = table.find(key);
    if (it == table.end()) {
        return false;
    }

    if (!it->second.is_string()) {
        throw std::logic_error(fmt::format("config key '{}' must be a string", key));
    }

    value = it->second.as_string();
    return true;
}

inline bool read_toml_boolean(bool& value, const std::string& key, const toml_table_t& table) {
    const auto it = table.find(key);
    if (it == table.end()) {
        return false;
    }

    if (!it->second.is_boolean()) {
        throw std::logic_error(fmt::format("config key '{}' must be a boolean", key));
    }

    value = it->second.as_boolean();
    return true;
}

inline const toml_table_t* find_toml_table(const std::string& key, const toml_table_t& table) {
    const auto it = table.find(key);
    if (it == table.end()) {
        return nullptr;
    }

    if (!it->second.is_table()) {
        throw std::logic_error(fmt::format("config key '{}' must be a table", key));
    }

    return &it->second.as_table();
}

}  // namespace gatecore
