#pragma once

#include <condition_variable>
#include <mutex>

namespace dcx::worker {

/**
 * @brief worker 的执行位置，同时运行的测试点数不超过 capacity
 * 所有提交共享同一个 slot_pool。
 */
struct slot_pool {
    explicit slot_pool(int capacity);

    /**
     * @brief 获取一个位置，没有空闲位置时阻塞等待
     */
    void acquire();

    /**
     * @brief 尝试获取一个位置
     * @return 没有空闲位置时返回 false
     */
    bool try_acquire();

    void release();

    int capacity() const;
    int available() const;

private:
    const int total;
    int free;
    mutable std::mutex mut;
    std::condition_variable cv;
};

/**
 * @brief 接管一个已经获取的位置，离开作用域时归还
 */
struct slot_guard {
    explicit slot_guard(slot_pool &pool);
    ~slot_guard();

    slot_guard(const slot_guard &) = delete;
    slot_guard &operator=(const slot_guard &) = delete;

private:
    slot_pool &pool;
};

}  // namespace dcx::worker
