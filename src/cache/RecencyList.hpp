#ifndef RECENCYLIST_HPP
#define RECENCYLIST_HPP

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Doubly linked most-recent-first list stored in a flat arena.
//
// Every element lives in a slot of a std::vector and is linked to its
// neighbours by slot index, never by pointer. Slot 0 is the head sentinel
// (more recent than everything) and slot 1 the tail sentinel (less recent than
// everything), so pushFront/remove/moveToFront never special-case the ends.
// Freed slots are chained into a free list and reused before the arena grows.
//
// Indices stay valid until the element is removed. Not thread-safe; the owner
// serializes access.
template <typename T>
class RecencyList {
public:
    using Index = std::size_t;
    static constexpr Index NONE = std::numeric_limits<Index>::max();

    explicit RecencyList(std::size_t expected_size = 0) {
        slots_.reserve(expected_size + FIRST_ELEMENT);
        slots_.emplace_back(); // HEAD
        slots_.emplace_back(); // TAIL
        slots_[HEAD].less_recent = TAIL;
        slots_[TAIL].more_recent = HEAD;
    }

    // Inserts item as the most recently used element and returns its index.
    Index pushFront(T item) {
        Index index = allocate();
        try {
            slots_[index].item.emplace(std::move(item));
        } catch (...) {
            release(index);
            throw;
        }
        linkAfterHead(index);
        ++size_;
        return index;
    }

    void moveToFront(Index index) {
        checkLive(index);
        if (slots_[HEAD].less_recent == index) {
            return;
        }
        unlink(index);
        linkAfterHead(index);
    }

    // Unlinks the element, returns it and recycles its slot.
    T remove(Index index) {
        checkLive(index);
        unlink(index);
        Slot& slot = slots_[index];
        T item = std::move(*slot.item);
        slot.item.reset();
        release(index);
        --size_;
        return item;
    }

    Index mostRecent() const {
        Index first = slots_[HEAD].less_recent;
        return first == TAIL ? NONE : first;
    }

    Index leastRecent() const {
        Index last = slots_[TAIL].more_recent;
        return last == HEAD ? NONE : last;
    }

    // Neighbour toward the tail, NONE past the last element.
    Index lessRecent(Index index) const {
        checkLive(index);
        Index next = slots_[index].less_recent;
        return next == TAIL ? NONE : next;
    }

    // Neighbour toward the head, NONE before the first element.
    Index moreRecent(Index index) const {
        checkLive(index);
        Index prev = slots_[index].more_recent;
        return prev == HEAD ? NONE : prev;
    }

    T& at(Index index) {
        checkLive(index);
        return *slots_[index].item;
    }

    const T& at(Index index) const {
        checkLive(index);
        return *slots_[index].item;
    }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // Slots allocated so far, sentinels excluded. Grows only when the free list is empty.
    std::size_t arenaSize() const { return slots_.size() - FIRST_ELEMENT; }

    void clear() {
        slots_.resize(FIRST_ELEMENT);
        slots_[HEAD].less_recent = TAIL;
        slots_[TAIL].more_recent = HEAD;
        free_head_ = NONE;
        size_ = 0;
    }

private:
    static constexpr Index HEAD = 0;
    static constexpr Index TAIL = 1;
    static constexpr Index FIRST_ELEMENT = 2;

    struct Slot {
        std::optional<T> item;
        Index more_recent = NONE;
        Index less_recent = NONE; // doubles as the free-list link
    };

    Index allocate() {
        if (free_head_ != NONE) {
            Index index = free_head_;
            free_head_ = slots_[index].less_recent;
            return index;
        }
        slots_.emplace_back();
        return slots_.size() - 1;
    }

    void release(Index index) {
        slots_[index].more_recent = NONE;
        slots_[index].less_recent = free_head_;
        free_head_ = index;
    }

    void linkAfterHead(Index index) {
        Index old_first = slots_[HEAD].less_recent;
        slots_[index].more_recent = HEAD;
        slots_[index].less_recent = old_first;
        slots_[old_first].more_recent = index;
        slots_[HEAD].less_recent = index;
    }

    void unlink(Index index) {
        Index prev = slots_[index].more_recent;
        Index next = slots_[index].less_recent;
        slots_[prev].less_recent = next;
        slots_[next].more_recent = prev;
    }

    void checkLive(Index index) const {
        if (index < FIRST_ELEMENT || index >= slots_.size() || !slots_[index].item) {
            throw std::out_of_range("RecencyList: no live element at index " + std::to_string(index));
        }
    }

    std::vector<Slot> slots_;
    Index free_head_ = NONE;
    std::size_t size_ = 0;
};

#endif // RECENCYLIST_HPP
