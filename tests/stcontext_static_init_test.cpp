// Test suite for static initialization of SingleThreadRefCell<T>

#include "stcontext/single_thread_refcell.hpp"
#include <iostream>
#include <cassert>

using namespace stcontext;

SingleThreadRefCell<int> G_BOOT_TICKS(40);

// Set by tests/static_init_reader.cpp before main()
extern int G_TICKS_SEEN_BEFORE_MAIN;

// @safe
void test_initial_value_visible_before_main() {
    std::cout << "Testing borrow from another file's initializer..." << std::endl;

    assert(G_TICKS_SEEN_BEFORE_MAIN == 40);

    std::cout << "✓ Global cell held its value before dynamic initialization" << std::endl;
}

// @safe
void test_write_before_main_persists() {
    std::cout << "Testing write made before main()..." << std::endl;

    auto ctx = Init::new_();  // @unsafe
    {
        auto g = G_BOOT_TICKS.borrow(ctx);
        assert(*g == 41);
    }
    // The guard taken during initialization was released
    {
        auto g = G_BOOT_TICKS.borrow_mut(ctx);
        *g = 0;
    }

    std::cout << "✓ Early write kept, borrow released" << std::endl;
}

int main() {
    std::cout << "\n=== SingleThreadRefCell<T> Static Init Test Suite ===" << std::endl;

    test_initial_value_visible_before_main();
    test_write_before_main_persists();

    std::cout << "\n✅ All static init tests passed!" << std::endl;
    return 0;
}
