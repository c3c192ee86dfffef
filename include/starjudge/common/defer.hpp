#pragma once

#include <functional>

#define STARJUDGE_DEFER_1(x, y) x##y
#define STARJUDGE_DEFER_2(x, y) STARJUDGE_DEFER_1(x, y)
#define STARJUDGE_DEFER_0(x) STARJUDGE_DEFER_2(x, __COUNTER__)
#define defer auto STARJUDGE_DEFER_0(_defered_option) = starjudge::scoped_guard() + [&]

namespace starjudge {

/**
 * @brief 离开作用域时执行 f
 * 配合 defer 宏使用：defer { close(fd); };
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace starjudge
