#ifndef STCONTEXT_HPP
#define STCONTEXT_HPP

// stcontext - single-thread context cells for C++
//
// Mutable global state that is only touched while the program has no
// concurrency (single-threaded programs, early kernel boot):
// - Init / is_stc: the unsafe proof that the current phase is single-threaded
// - RefCell: runtime shared/exclusive borrow tracking
// - SingleThreadRefCell: a RefCell that only lends to holders of the proof
// - is_send / is_sync: keeps the proof and the guards on their own thread

#include "stcontext/context.hpp"
#include "stcontext/traits.hpp"
#include "stcontext/refcell.hpp"
#include "stcontext/single_thread_refcell.hpp"

#endif // STCONTEXT_HPP
