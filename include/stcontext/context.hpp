#ifndef STCONTEXT_CONTEXT_HPP
#define STCONTEXT_CONTEXT_HPP

#include <type_traits>

// Single-thread context (STC) capability
//
// A value of an STC type is proof that the program is currently running without
// concurrency: no other threads, no enabled interrupts, no signal handlers that
// touch the same data. Code that holds a reference to such a value may borrow a
// SingleThreadRefCell without further ceremony.
//
// Nothing is checked at runtime. Obtaining a context is the unsafe step; the
// caller asserts the invariant and must stop using the context (and every guard
// derived from it) before concurrency begins.

// @safe
namespace stcontext {

// Default: types are NOT a single-thread context
template<typename T, typename = void>
struct is_stc : std::false_type {};

template<typename T>
inline constexpr bool STC = is_stc<T>::value;

// Init - context constructed at program start, or during early kernel boot
// before interrupts and SMP are enabled.
class Init {
private:
    // User-provided: a defaulted one would leave Init an aggregate, and
    // `Init{}` would skip new_()
    Init() noexcept {}

public:
    // @unsafe
    // SAFETY: Caller must ensure:
    // 1. No other execution context exists (threads, interrupts, signal handlers)
    // 2. None will be started while this Init, or a guard borrowed with it, is alive
    // 3. No second Init is created for the same single-threaded phase
    static Init new_() noexcept {
        return Init();
    }

    // A copy would be a second proof nobody asserted
    Init(const Init&) = delete;
    Init& operator=(const Init&) = delete;
    Init(Init&&) = delete;
    Init& operator=(Init&&) = delete;
};

template<>
struct is_stc<Init> : std::true_type {};

} // namespace stcontext

#endif // STCONTEXT_CONTEXT_HPP
