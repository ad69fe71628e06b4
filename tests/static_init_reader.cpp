// Borrows G_BOOT_TICKS while this file's globals are dynamically initialized.
// Initialization order across files is unspecified, so this only sees 40 if
// G_BOOT_TICKS was constant-initialized.

#include "stcontext/single_thread_refcell.hpp"

extern stcontext::SingleThreadRefCell<int> G_BOOT_TICKS;

namespace {

// @safe
int tick_during_dynamic_init() {
    auto ctx = stcontext::Init::new_();  // @unsafe
    auto g = G_BOOT_TICKS.borrow_mut(ctx);
    int seen = *g;
    *g += 1;
    return seen;
}

} // namespace

int G_TICKS_SEEN_BEFORE_MAIN = tick_during_dynamic_init();
