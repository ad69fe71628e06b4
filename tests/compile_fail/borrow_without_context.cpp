// Must not compile: int is not a single-thread context
#include <stcontext/single_thread_refcell.hpp>

stcontext::SingleThreadRefCell<int> G_VALUE(1);

int main() {
    int not_a_context = 0;
    auto g = G_VALUE.borrow(not_a_context);
    return *g;
}
