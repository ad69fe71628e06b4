#ifndef STCONTEXT_SINGLE_THREAD_REFCELL_HPP
#define STCONTEXT_SINGLE_THREAD_REFCELL_HPP

#include <utility>
#include "context.hpp"
#include "refcell.hpp"
#include "traits.hpp"

// SingleThreadRefCell<T> - context-aware RefCell for global mutable data
//
// The cell may only be touched from a single thread, with no interrupts or
// signal handlers running either. Borrowing requires a reference to a type
// satisfying is_stc (single-thread context). Such a context is created by an
// unsafe step at the start of a single-threaded phase and dropped at its end,
// so the code in between does not need an @unsafe block for every access to
// mutable static data. Starting a thread too early shows up at compile time:
// neither the context nor a guard is Send.
//
// Intended for single-threaded applications and for early OS boot, before
// interrupts and SMP are enabled.
//
// Example:
//   stcontext::SingleThreadRefCell<int> G_INT(5);
//
//   auto ctx = stcontext::Init::new_();  // @unsafe
//   {
//       auto g = G_INT.borrow(ctx);
//       assert(*g == 5);
//   }
//   {
//       auto g = G_INT.borrow_mut(ctx);
//       *g = 6;
//   }
//
// Guarantees:
// - sizeof(SingleThreadRefCell<T>) == sizeof(RefCell<T>)
// - sizeof(SingleThreadRef<T, C>) == sizeof(Ref<T>), the context costs nothing
// - Runtime borrow checking identical to RefCell (throws on violation)

// @safe
namespace stcontext {

// SingleThreadRef<T, C> - immutable borrow authorized by context type C
template<typename T, typename C>
class SingleThreadRef {
private:
    Ref<T> value;

    friend class SingleThreadRefCell<T>;
    explicit SingleThreadRef(Ref<T>&& r) : value(std::move(r)) {}

public:
    SingleThreadRef(SingleThreadRef&&) noexcept = default;

    SingleThreadRef(const SingleThreadRef&) = delete;
    SingleThreadRef& operator=(const SingleThreadRef&) = delete;
    SingleThreadRef& operator=(SingleThreadRef&&) = delete;

    const T& operator*() const {
        return *value;
    }

    const T* operator->() const {
        return value.operator->();
    }
};

// SingleThreadRefMut<T, C> - mutable borrow authorized by context type C
template<typename T, typename C>
class SingleThreadRefMut {
private:
    RefMut<T> value;

    friend class SingleThreadRefCell<T>;
    explicit SingleThreadRefMut(RefMut<T>&& r) : value(std::move(r)) {}

public:
    SingleThreadRefMut(SingleThreadRefMut&&) noexcept = default;

    SingleThreadRefMut(const SingleThreadRefMut&) = delete;
    SingleThreadRefMut& operator=(const SingleThreadRefMut&) = delete;
    SingleThreadRefMut& operator=(SingleThreadRefMut&&) = delete;

    T& operator*() const {
        return *value;
    }

    T* operator->() const {
        return value.operator->();
    }
};

template<typename T>
class SingleThreadRefCell {
private:
    RefCell<T> value;

public:
    constexpr SingleThreadRefCell() : value() {}
    constexpr explicit SingleThreadRefCell(T val) : value(std::move(val)) {}

    // Factory method (Rust-style)
    static SingleThreadRefCell<T> new_(T value) {
        return SingleThreadRefCell<T>(std::move(value));
    }

    // The context is only named, never read. The guard must not outlive
    // either this cell or ctx.
    // @lifetime: (&'a, &'b C) -> SingleThreadRef<'a, 'b, T, C>
    template<typename C>
    SingleThreadRef<T, C> borrow(const C& ctx) const {
        static_assert(is_stc<C>::value,
                      "SingleThreadRefCell<T> requires a single-thread context (is_stc<C>)");
        (void)ctx;
        return SingleThreadRef<T, C>(value.borrow());
    }

    // @lifetime: (&'a, &'b C) -> SingleThreadRefMut<'a, 'b, T, C>
    template<typename C>
    SingleThreadRefMut<T, C> borrow_mut(const C& ctx) const {
        static_assert(is_stc<C>::value,
                      "SingleThreadRefCell<T> requires a single-thread context (is_stc<C>)");
        (void)ctx;
        return SingleThreadRefMut<T, C>(value.borrow_mut());
    }

    // A temporary context dies at the end of the full expression, before the guard
    template<typename C>
    void borrow(const C&&) const = delete;

    template<typename C>
    void borrow_mut(const C&&) const = delete;

    SingleThreadRefCell(const SingleThreadRefCell&) = delete;
    SingleThreadRefCell& operator=(const SingleThreadRefCell&) = delete;
    SingleThreadRefCell(SingleThreadRefCell&&) = delete;
    SingleThreadRefCell& operator=(SingleThreadRefCell&&) = delete;
};

template<typename T>
SingleThreadRefCell<T> make_single_thread_refcell(T value) {
    return SingleThreadRefCell<T>(std::move(value));
}

} // namespace stcontext

#endif // STCONTEXT_SINGLE_THREAD_REFCELL_HPP
