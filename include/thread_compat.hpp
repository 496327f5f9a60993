#pragma once
#include <thread>
#include <utility>

// Joining thread wrapper used by the inspection worker pool. The project
// targets C++17, so std::jthread is not available; this type only provides
// join-on-destruction and has no stop token.
namespace th_compat {
class jthread {
    std::thread t;

  public:
    jthread() noexcept = default;
    template <class Fn, class... Args>
    explicit jthread(Fn&& fn, Args&&... args)
        : t(std::forward<Fn>(fn), std::forward<Args>(args)...) {}
    jthread(jthread&&) noexcept = default;
    jthread& operator=(jthread&& other) noexcept {
        if (this != &other) {
            join();
            t = std::move(other.t);
        }
        return *this;
    }
    jthread(const jthread&) = delete;
    jthread& operator=(const jthread&) = delete;
    ~jthread() { join(); }
    void join() {
        if (t.joinable())
            t.join();
    }
    bool joinable() const noexcept { return t.joinable(); }
};
} // namespace th_compat
