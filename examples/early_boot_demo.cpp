// Demonstration of SingleThreadRefCell during a simulated early boot
// Global kernel tables are filled in before "interrupts" are enabled

#include <iostream>
#include <string>
#include <vector>
#include <stcontext/stcontext.hpp>

struct MemoryRegion {
    unsigned long base;
    unsigned long length;
    std::string kind;
};

// Kernel globals
stcontext::SingleThreadRefCell<std::vector<MemoryRegion>> G_MEMORY_MAP;
stcontext::SingleThreadRefCell<unsigned> G_BOOT_STAGE(0);

// @safe
void detect_memory(const stcontext::Init& ctx) {
    auto map = G_MEMORY_MAP.borrow_mut(ctx);
    map->push_back({0x00000000UL, 0x0009fc00UL, "usable"});
    map->push_back({0x000f0000UL, 0x00010000UL, "reserved"});
    map->push_back({0x00100000UL, 0x3fe00000UL, "usable"});

    *G_BOOT_STAGE.borrow_mut(ctx) += 1;
}

// @safe
unsigned long usable_bytes(const stcontext::Init& ctx) {
    unsigned long total = 0;
    auto map = G_MEMORY_MAP.borrow(ctx);
    for (const auto& region : *map) {
        if (region.kind == "usable") {
            total += region.length;
        }
    }
    return total;
}

// @safe
void print_memory_map(const stcontext::Init& ctx) {
    auto map = G_MEMORY_MAP.borrow(ctx);
    // A second reader while the first is alive is fine
    auto stage = G_BOOT_STAGE.borrow(ctx);
    std::cout << "Memory map after stage " << *stage << ":" << std::endl;
    for (const auto& region : *map) {
        std::cout << "  [" << std::hex << region.base << ", +" << region.length << std::dec
                  << ") " << region.kind << std::endl;
    }
    std::cout << "  usable: " << usable_bytes(ctx) << " bytes" << std::endl;
}

// @safe
void show_borrow_conflict(const stcontext::Init& ctx) {
    auto reader = G_MEMORY_MAP.borrow(ctx);
    try {
        auto writer = G_MEMORY_MAP.borrow_mut(ctx);
        writer->clear();
    } catch (const std::runtime_error& e) {
        std::cout << "Rejected conflicting borrow: " << e.what() << std::endl;
    }
    std::cout << "Map still has " << reader->size() << " regions" << std::endl;
}

int main() {
    std::cout << "=== Early boot ===" << std::endl;

    {
        // SAFETY: nothing else runs yet, interrupts are "off"
        // @unsafe
        auto ctx = stcontext::Init::new_();

        detect_memory(ctx);
        print_memory_map(ctx);
        show_borrow_conflict(ctx);
    }
    // ctx is gone: from here on the globals are not touched without a lock

    std::cout << "=== Interrupts enabled ===" << std::endl;
    return 0;
}
