#pragma once

#include <concepts>

namespace coaccess {

class Execution;

// Promise that knows which execution its coroutine belongs to
template <typename Promise>
concept PromiseExecutionConcept = requires(Promise p, Execution* execution) {
    // Must have getter
    { p.get_execution() } -> std::same_as<Execution*>;

    // Must have setter
    p.set_execution(execution);
};

}  // namespace coaccess
