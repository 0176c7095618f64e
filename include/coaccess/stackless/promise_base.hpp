#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace coaccess {

class Execution;

struct promise_common_base {
    void unhandled_exception() noexcept { exception_ = std::current_exception(); }
    void rethrow_if_exception() {
        if (exception_) [[unlikely]] {
            std::rethrow_exception(exception_);
        }
    }

    void set_execution(Execution* execution) noexcept { execution_ = execution; }
    Execution* get_execution() const noexcept { return execution_; }

   protected:
    std::exception_ptr exception_{nullptr};
    Execution* execution_{nullptr};
};

template <typename T>
struct async_promise_base : promise_common_base {
    template <typename U>
    void return_value(U&& val) {
        value_.emplace(std::forward<U>(val));
    }

    T get_return_value() { return std::move(*value_); }

   protected:
    std::optional<T> value_{};
};

template <>
struct async_promise_base<void> : promise_common_base {
    void return_void() noexcept {}
};

}  // namespace coaccess
