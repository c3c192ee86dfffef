#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 沿着 keys 逐层查找 JSON 对象中的值
 * @return 找到的值，任意一层不存在或者不是对象时返回 nullptr
 */
template <typename... Keys>
const json *find_value(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = (ref && ref->is_object() && ref->count(keys)) ? &ref->at(keys) : nullptr), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_value(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const std::string &reason, Keys &&... keys) {
    std::string path;
    ((path += (path.empty() ? "" : ".") + boost::lexical_cast<std::string>(keys)), ...);
    return std::invalid_argument(reason + ": " + path);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_value(j, keys...);
    if (!ref || ref->is_null()) throw build_invalid_argument("missing field", keys...);
    return *ref;
}

/**
 * @brief 读取必须存在的字段
 * @throw std::invalid_argument 若字段不存在或者类型不正确
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument("unexpected value type of", keys...);
    }
}

/**
 * @brief 读取可选的字段，不存在时返回 def_value
 * @throw std::invalid_argument 若字段存在但类型不正确
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    if (!exists(j, keys...)) return def_value;
    return get_value<T>(j, keys...);
}

}  // namespace nlohmann
