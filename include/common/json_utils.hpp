#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sandbox {

namespace detail {

/**
 * @brief 沿着 keys 逐层查找 json 对象的子项
 * @return 找到的子项指针，如果某一层不存在或者不是对象则返回 nullptr
 */
template <typename... Keys>
const nlohmann::json *find_path(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

}  // namespace detail

template <typename... Keys>
bool exists(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = detail::find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const nlohmann::json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const nlohmann::json &access(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = detail::find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    return *ref;
}

/**
 * @brief 读取 json 中 keys 对应的值，不存在或者类型不匹配时抛出 invalid_argument
 */
template <typename T, typename... Keys>
T get_value(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取 json 中 keys 对应的值
 * @param def_value 不存在、为 null 或者类型不匹配时返回该值
 */
template <typename T, typename... Keys>
T get_value_def(const nlohmann::json &j, const T &def_value, const Keys &... keys) {
    const nlohmann::json *res = detail::find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (nlohmann::json::exception &) {
        return def_value;
    }
}

}  // namespace sandbox
