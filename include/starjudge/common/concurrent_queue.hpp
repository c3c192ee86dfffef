#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace starjudge {

/**
 * @brief 并发队列，写者读者模型
 * 写者在不再写入时调用 close，读者在队列关闭且为空后 pop 返回 nullopt
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，队列已关闭且没有剩余元素时返回 nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) cond.wait(mlock);
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已经关闭时返回 false，元素被丢弃
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     * 已经在队列中的元素仍然可以被弹出
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace starjudge
