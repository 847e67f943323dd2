// busq++ contributors

#include <busq++/disposable.hpp>

namespace Busq {

void Disposable::dispose() noexcept {
    auto fn     = std::move(on_dispose_);
    on_dispose_ = nullptr;
    if (fn) {
        fn();
    }
}

Disposable& Disposable::operator=(Disposable&& other) noexcept {
    if (this != &other) {
        dispose();
        on_dispose_       = std::move(other.on_dispose_);
        other.on_dispose_ = nullptr;
    }
    return *this;
}

} // namespace Busq
