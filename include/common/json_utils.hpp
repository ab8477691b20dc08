#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>

namespace nlohmann {

/**
 * @brief 按路径查找 json 子节点
 * @return 子节点的指针，路径上任意一级不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::invalid_argument(msg);
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

/**
 * @brief 按路径获取 json 子节点
 * @throw std::invalid_argument 子节点不存在
 */
template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

/**
 * @throw std::invalid_argument 子节点不存在或者类型不匹配
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 获取可选的子节点，子节点不存在或者为 null 时返回 def_value
 * @throw std::invalid_argument 子节点存在但类型不匹配
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return std::nullopt;
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 将 optional 转换为 json，空值转换为 null
 */
template <typename T>
json from_optional(const std::optional<T> &value) {
    if (!value) return nullptr;
    return json(*value);
}

}  // namespace nlohmann
