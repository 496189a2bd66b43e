#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = dcx::scoped_guard() + [&]

namespace dcx {

/**
 * @brief 作用域守卫，离开作用域时执行清理函数
 * 沙箱的清理（杀死进程、删除容器、删除临时目录）依赖它在任何退出路径上都被执行，
 * 包括异常退出。
 *
 * @code{.cpp}
 *     defer { std::filesystem::remove_all(dir); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace dcx
