#ifndef STCONTEXT_REFCELL_HPP
#define STCONTEXT_REFCELL_HPP

#include <cassert>
#include <stdexcept>
#include <utility>

// RefCell<T> - dynamic borrow tracker used by SingleThreadRefCell
//
// Guarantees:
// - Single-threaded only (the counter is a plain int, no atomics)
// - Runtime borrow checking (throws on violation)
// - Multiple immutable borrows OR single mutable borrow
// - Borrows released by RAII guards
// - constexpr construction, so a namespace-scope RefCell<literal T> is constant-initialized

// @safe
namespace stcontext {

template<typename T>
class RefCell;

template<typename T>
class Ref;

template<typename T>
class RefMut;

// Values taken by RefCell::borrow_flag
enum class BorrowState : int {
    Unborrowed = 0,
    Reading = 1,     // Positive values = number of readers
    Writing = -1
};

template<typename T>
class RefCell {
private:
    mutable T value;
    mutable int borrow_flag;  // 0 = unborrowed, >0 = # readers, -1 = writing

    friend class Ref<T>;
    friend class RefMut<T>;

    void add_reader() const {
        if (borrow_flag < 0) {
            throw std::runtime_error("RefCell<T>: already mutably borrowed");
        }
        borrow_flag++;
    }

    void remove_reader() const {
        assert(borrow_flag > 0);
        borrow_flag--;
    }

    void add_writer() const {
        if (borrow_flag > 0) {
            throw std::runtime_error("RefCell<T>: already immutably borrowed");
        }
        if (borrow_flag < 0) {
            throw std::runtime_error("RefCell<T>: already mutably borrowed");
        }
        borrow_flag = static_cast<int>(BorrowState::Writing);
    }

    void remove_writer() const {
        assert(borrow_flag == static_cast<int>(BorrowState::Writing));
        borrow_flag = static_cast<int>(BorrowState::Unborrowed);
    }

public:
    // constexpr so that a namespace-scope RefCell of a literal T is constant-
    // initialized: its value and an empty borrow_flag are in place before any
    // dynamic initializer, in any translation unit, can borrow it.
    constexpr RefCell() : value(), borrow_flag(0) {}
    constexpr explicit RefCell(T val) : value(std::move(val)), borrow_flag(0) {}

    ~RefCell() {
#ifdef DEBUG
        assert(borrow_flag == 0 && "RefCell<T> dropped while borrowed");
#endif
    }

    // @lifetime: (&'a) -> Ref<'a, T>
    Ref<T> borrow() const {
        add_reader();
        return Ref<T>(*this);
    }

    // @lifetime: (&'a) -> RefMut<'a, T>
    RefMut<T> borrow_mut() const {
        add_writer();
        return RefMut<T>(*this);
    }

    // @lifetime: (&'a) -> bool
    bool can_borrow() const {
        return borrow_flag >= 0;
    }

    // @lifetime: (&'a) -> bool
    bool can_borrow_mut() const {
        return borrow_flag == 0;
    }

    // Number of live immutable borrows (0 while mutably borrowed)
    int readers() const {
        return borrow_flag > 0 ? borrow_flag : 0;
    }

    RefCell(const RefCell&) = delete;
    RefCell& operator=(const RefCell&) = delete;
    RefCell(RefCell&&) = delete;
    RefCell& operator=(RefCell&&) = delete;
};

// Ref<T> - RAII guard for an immutable borrow
template<typename T>
class Ref {
private:
    const RefCell<T>* cell;

    friend class RefCell<T>;
    explicit Ref(const RefCell<T>& c) : cell(&c) {}

public:
    ~Ref() {
        if (cell) {
            cell->remove_reader();
        }
    }

    // Moved-from guard no longer owns the borrow
    Ref(Ref&& other) noexcept : cell(other.cell) {
        other.cell = nullptr;
    }

    Ref(const Ref&) = delete;
    Ref& operator=(const Ref&) = delete;
    Ref& operator=(Ref&&) = delete;

    const T& operator*() const {
        return cell->value;
    }

    const T* operator->() const {
        return &cell->value;
    }
};

// RefMut<T> - RAII guard for a mutable borrow
template<typename T>
class RefMut {
private:
    const RefCell<T>* cell;

    friend class RefCell<T>;
    explicit RefMut(const RefCell<T>& c) : cell(&c) {}

public:
    ~RefMut() {
        if (cell) {
            cell->remove_writer();
        }
    }

    RefMut(RefMut&& other) noexcept : cell(other.cell) {
        other.cell = nullptr;
    }

    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;
    RefMut& operator=(RefMut&&) = delete;

    // value is a mutable member, writable through the const cell
    T& operator*() const {
        return cell->value;
    }

    T* operator->() const {
        return &cell->value;
    }
};

} // namespace stcontext

#endif // STCONTEXT_REFCELL_HPP
