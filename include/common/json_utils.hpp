#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 沿着 keys 逐层查找 json 对象的成员
 * @return 找到的成员，任意一层不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_member(const json &j, Keys &&... keys) {
    const json *ref = j.is_object() ? &j : nullptr;
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
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_member(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_member(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_member(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        return def_value;
    }
}

/**
 * @brief 序列化为 JSON 文本，不是合法 UTF-8 的字节被替换为 U+FFFD
 * 用户程序的输出可以是任意字节，直接 dump 会抛出 type_error
 */
inline std::string dump_lossy(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace nlohmann
