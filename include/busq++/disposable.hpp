// busq++ contributors

#ifndef BUSQ_DISPOSABLE_HPP
#define BUSQ_DISPOSABLE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace Busq {

// Cancellation token for a streaming operation. dispose() runs the teardown
// once; dropping the token disposes it.
class Disposable {
  public:
    Disposable() noexcept = default;
    explicit Disposable(std::function<void()> on_dispose) : on_dispose_(std::move(on_dispose)) {}

    void dispose() noexcept;
    bool disposed() const noexcept { return !on_dispose_; }

    // RAII / moves
    ~Disposable() { dispose(); }
    Disposable(Disposable&& other) noexcept : on_dispose_(std::move(other.on_dispose_)) {
        other.on_dispose_ = nullptr;
    }
    Disposable& operator=(Disposable&& other) noexcept;
    Disposable(const Disposable&)            = delete;
    Disposable& operator=(const Disposable&) = delete;

  private:
    std::function<void()> on_dispose_;
};

// Side table of boxed callbacks keyed by token. take() hands the entry out at
// most once, which is how every callback context gets released exactly once.
template <typename Fn> class CallbackRegistry {
  public:
    struct Entry {
        explicit Entry(Fn f) : fn(std::move(f)) {}
        Fn                fn;
        std::atomic<bool> cancelled{false};
    };
    using EntryPtr = std::shared_ptr<Entry>;

    uint64_t add(Fn fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t                    token = ++next_token_;
        entries_.emplace(token, std::make_shared<Entry>(std::move(fn)));
        return token;
    }

    EntryPtr find(uint64_t token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = entries_.find(token);
        return it == entries_.end() ? nullptr : it->second;
    }

    EntryPtr take(uint64_t token) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = entries_.find(token);
        if (it == entries_.end()) {
            return nullptr;
        }
        EntryPtr out = std::move(it->second);
        entries_.erase(it);
        return out;
    }

    void cancel(uint64_t token) {
        if (auto e = find(token)) {
            e->cancelled = true;
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

  private:
    mutable std::mutex                     mutex_;
    std::unordered_map<uint64_t, EntryPtr> entries_;
    uint64_t                               next_token_ = 0;
};

} // namespace Busq
#endif
