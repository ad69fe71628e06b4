// Must not compile: brace-initialization cannot stand in for Init::new_()
#include <stcontext/single_thread_refcell.hpp>

stcontext::SingleThreadRefCell<int> G_VALUE(1);

int main() {
    stcontext::Init forged{};
    auto g = G_VALUE.borrow_mut(forged);
    *g = 42;
    return 0;
}
