#pragma once

#include <functional>
#include <future>
#include <type_traits>
#include <vector>

// Helpers for the short-lived background work of a backup run
class ThreadUtils {
public:
    template<typename Func, typename... Args>
    static std::future<typename std::result_of<Func(Args...)>::type>
    async(Func&& func, Args&&... args) {
        return std::async(std::launch::async,
                          std::forward<Func>(func),
                          std::forward<Args>(args)...);
    }

    // Blocks until every future is ready, leaving results untouched
    template<typename T>
    static void waitAll(std::vector<std::future<T>>& futures) {
        for (auto& future : futures) {
            if (future.valid()) {
                future.wait();
            }
        }
    }
};
