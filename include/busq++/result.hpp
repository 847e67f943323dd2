// busq++ contributors

#ifndef BUSQ_RESULT_HPP
#define BUSQ_RESULT_HPP

#include <cstdio>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace Busq {
namespace types {
template <typename T> struct Ok {
    T val;

    Ok(const T& v) : val(v) {}
    Ok(T&& v) : val(std::move(v)) {}
};

template <> struct Ok<void> {};

template <typename E> struct Err {
    E val;

    Err(const E& v) : val(v) {}
    Err(E&& v) : val(std::move(v)) {}
};
} // namespace types

template <typename T> inline types::Ok<std::decay_t<T>> Ok(T&& val) {
    return types::Ok<std::decay_t<T>>(std::forward<T>(val));
}

inline types::Ok<void> Ok() {
    return types::Ok<void>();
}

template <typename E> inline types::Err<std::decay_t<E>> Err(E&& val) {
    return types::Err<std::decay_t<E>>(std::forward<E>(val));
}

namespace detail {
[[noreturn]] inline void result_panic(const char* what, const char* detail = nullptr) {
    if (detail) {
        std::fprintf(stderr, "%s: %s\n", what, detail);
    } else {
        std::fprintf(stderr, "%s\n", what);
    }
    std::terminate();
}
} // namespace detail

// =======================
// Result<T, E>
// =======================
// Index 0 holds the Ok value, index 1 the error, so T and E may be the same type.
template <typename T, typename E> class Result {
    std::variant<T, E> value_;

  public:
    Result(types::Ok<T> ok) : value_(std::in_place_index<0>, std::move(ok.val)) {}
    Result(types::Err<E> err) : value_(std::in_place_index<1>, std::move(err.val)) {}

    // Ok(uint32_t) into Result<uint64_t, E> and similar widening returns
    template <typename U,
              typename = std::enable_if_t<!std::is_same<U, T>::value &&
                                          std::is_constructible<T, U&&>::value>>
    Result(types::Ok<U> ok) : value_(std::in_place_index<0>, std::move(ok.val)) {}

    bool is_ok() const noexcept { return value_.index() == 0; }
    bool is_err() const noexcept { return value_.index() == 1; }

    T&   unwrap() & {
        if (is_err()) {
            detail::result_panic("unwrap on Err");
        }
        return std::get<0>(value_);
    }

    const T& unwrap() const& {
        if (is_err()) {
            detail::result_panic("unwrap on Err");
        }
        return std::get<0>(value_);
    }

    T unwrap() && {
        if (is_err()) {
            detail::result_panic("unwrap on Err");
        }
        return std::get<0>(std::move(value_));
    }

    E& unwrap_err() & {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok");
        }
        return std::get<1>(value_);
    }

    const E& unwrap_err() const& {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok");
        }
        return std::get<1>(value_);
    }

    E unwrap_err() && {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok");
        }
        return std::get<1>(std::move(value_));
    }

    T unwrap_or(T default_value) const& {
        return is_ok() ? std::get<0>(value_) : std::move(default_value);
    }

    T unwrap_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(value_)) : std::move(default_value);
    }

    T expect(const char* message) && {
        if (is_err()) {
            detail::result_panic("Fatal (expect) error", message);
        }
        return std::get<0>(std::move(value_));
    }

    T& expect(const char* message) & {
        if (is_err()) {
            detail::result_panic("Fatal (expect) error", message);
        }
        return std::get<0>(value_);
    }

    const T& expect(const char* message) const& {
        if (is_err()) {
            detail::result_panic("Fatal (expect) error", message);
        }
        return std::get<0>(value_);
    }

    template <typename F> T unwrap_or_else(F&& f) const& {
        return is_ok() ? std::get<0>(value_) : static_cast<T>(f(std::get<1>(value_)));
    }

    // rvalue: moves Ok(T) out; on Err(E) the handler may consume E
    template <typename F> T unwrap_or_else(F&& f) && {
        if (is_ok()) {
            return std::get<0>(std::move(value_));
        }
        return static_cast<T>(std::forward<F>(f)(std::get<1>(std::move(value_))));
    }

    // Ok value as an optional, dropping the error
    std::optional<T> ok() && {
        if (is_err()) {
            return std::nullopt;
        }
        return std::optional<T>(std::get<0>(std::move(value_)));
    }
};

// Result<void, E> specialization
template <typename E> class Result<void, E> {
    std::optional<E> error_;

  public:
    Result(types::Ok<void>) {}
    Result(types::Err<E> err) : error_(std::move(err.val)) {}

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_err() const noexcept { return error_.has_value(); }

    void unwrap() const {
        if (is_err()) {
            detail::result_panic("unwrap on Err of Result<void, E>");
        }
    }

    const E& unwrap_err() const& {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok of Result<void, E>");
        }
        return *error_;
    }

    E& unwrap_err() & {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok of Result<void, E>");
        }
        return *error_;
    }

    E unwrap_err() && {
        if (is_ok()) {
            detail::result_panic("unwrap_err on Ok of Result<void, E>");
        }
        return std::move(*error_);
    }

    void expect(const char* message) const {
        if (is_err()) {
            detail::result_panic("Fatal (expect) error", message);
        }
    }
};

#define match_result(res, ok_name, ok_block, err_name, err_block)                                  \
    do {                                                                                           \
        auto&& _result_val = (res);                                                                \
        if (_result_val.is_ok()) {                                                                 \
            auto&& ok_name = _result_val.unwrap();                                                 \
            ok_block                                                                               \
        } else {                                                                                   \
            auto&& err_name = _result_val.unwrap_err();                                            \
            err_block                                                                              \
        }                                                                                          \
    } while (0)

// Early-return propagation for Result-returning functions
#define BUSQ_TRY(var, expr)                                                                        \
    auto var##_result_ = (expr);                                                                   \
    if (var##_result_.is_err()) {                                                                  \
        return Err(std::move(var##_result_).unwrap_err());                                         \
    }                                                                                              \
    auto var = std::move(var##_result_).unwrap()

#define BUSQ_TRY_VOID(expr)                                                                        \
    do {                                                                                           \
        auto _busq_void_result_ = (expr);                                                          \
        if (_busq_void_result_.is_err()) {                                                         \
            return Err(std::move(_busq_void_result_).unwrap_err());                                \
        }                                                                                          \
    } while (0)

} // namespace Busq
#endif
