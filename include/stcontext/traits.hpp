#pragma once

#include <type_traits>
#include "context.hpp"

namespace stcontext {

// Forward declarations for stcontext types
template<typename T> class RefCell;
template<typename T> class Ref;
template<typename T> class RefMut;
template<typename T> class SingleThreadRefCell;
template<typename T, typename C> class SingleThreadRef;
template<typename T, typename C> class SingleThreadRefMut;

// Forward declare is_sync for circular dependency with is_send
template<typename T, typename = void>
struct is_sync;

// ============================================================================
// Send Trait - Can transfer ownership across thread boundaries
// ============================================================================

// Default: types are NOT Send
template<typename T, typename = void>
struct is_send : std::false_type {};

// Primitives are Send
template<typename T>
struct is_send<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Send if T is Sync
template<typename T>
struct is_send<const T&> : is_sync<T> {};

// T& is Send if T is Send
template<typename T>
struct is_send<T&> : is_send<T> {};

template<typename T>
struct is_send<T&&> : is_send<T> {};

// RefCell<T> is Send if T is Send (but not Sync)
template<typename T>
struct is_send<RefCell<T>> : is_send<T> {};

// SingleThreadRefCell<T> is Send if T is Send
template<typename T>
struct is_send<SingleThreadRefCell<T>> : is_send<T> {};

// Borrow guards stay on the thread that borrowed
template<typename T>
struct is_send<Ref<T>> : std::false_type {};

template<typename T>
struct is_send<RefMut<T>> : std::false_type {};

template<typename T, typename C>
struct is_send<SingleThreadRef<T, C>> : std::false_type {};

template<typename T, typename C>
struct is_send<SingleThreadRefMut<T, C>> : std::false_type {};

// The context is proof about the current thread; it never leaves it
template<>
struct is_send<Init> : std::false_type {};

template<typename T>
struct is_send<T*> : std::false_type {};

template<typename T>
struct is_send<const T*> : std::false_type {};

// ============================================================================
// Sync Trait - Can safely share &T across threads
// ============================================================================

// Default: types are NOT Sync
template<typename T, typename>
struct is_sync : std::false_type {};

// Primitives are Sync
template<typename T>
struct is_sync<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Sync if T is Sync
template<typename T>
struct is_sync<const T&> : is_sync<T> {};

// T& (mutable ref) is NEVER Sync
template<typename T>
struct is_sync<T&> : std::false_type {};

template<typename T>
struct is_sync<T&&> : std::false_type {};

// RefCell<T> is NEVER Sync (unsynchronized interior mutability)
template<typename T>
struct is_sync<RefCell<T>> : std::false_type {};

// SingleThreadRefCell<T> is ALWAYS Sync: every access needs an STC reference,
// and an STC reference cannot exist while another thread runs.
template<typename T>
struct is_sync<SingleThreadRefCell<T>> : std::true_type {};

template<typename T, typename C>
struct is_sync<SingleThreadRef<T, C>> : std::false_type {};

template<typename T, typename C>
struct is_sync<SingleThreadRefMut<T, C>> : std::false_type {};

// const Init& must not be Send, so Init is not Sync
template<>
struct is_sync<Init> : std::false_type {};

template<typename T>
struct is_sync<T*> : std::false_type {};

template<typename T>
struct is_sync<const T*> : std::false_type {};

// ============================================================================
// Helper constexpr variables (C++17 compatible)
// ============================================================================

template<typename T>
inline constexpr bool Send = is_send<T>::value;

template<typename T>
inline constexpr bool Sync = is_sync<T>::value;

template<typename T>
inline constexpr bool ThreadSafe = Send<T> && Sync<T>;

} // namespace stcontext

// ==================================================================
// HELPER MACROS FOR USER TYPES
// ==================================================================

// Mark a user type as a single-thread context. The type is also pinned as
// neither Send nor Sync, like Init.
// The type's constructors must be private and user-provided (`Ctx() {}`, not
// `Ctx() = default;`). In C++17 a class with only defaulted or deleted
// constructors is an aggregate, so `Ctx{}` would create one anywhere.
// Usage (at global scope): STCONTEXT_MARK_STC(BootContext)
#define STCONTEXT_MARK_STC(Type) \
    namespace stcontext { \
        template<> struct is_stc<Type> : std::true_type {}; \
        template<> struct is_send<Type> : std::false_type {}; \
        template<> struct is_sync<Type> : std::false_type {}; \
    }

// Mark a user type as Send
// Usage (at global scope): STCONTEXT_MARK_SEND(MyType)
#define STCONTEXT_MARK_SEND(Type) \
    namespace stcontext { \
        template<> struct is_send<Type> : std::true_type {}; \
    }

// Mark a user type as Sync
// Usage (at global scope): STCONTEXT_MARK_SYNC(MyType)
#define STCONTEXT_MARK_SYNC(Type) \
    namespace stcontext { \
        template<> struct is_sync<Type> : std::true_type {}; \
    }
