#pragma once

#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

#include "handle.hpp"

namespace glide {

/**
 * @brief Generational slot map holding colliders and characters.
 *
 * Resources live in a dense array so the scene can iterate them linearly
 * during a sweep. Handles go through a slot table, which keeps them stable
 * across swap-and-pop removals and invalidates them once the resource is
 * gone.
 *
 * @tparam T Resource type to manage
 */
template <typename T>
class Manager {
 private:
  static constexpr uint32_t INITIAL_CAPACITY = 64;
  static_assert(INITIAL_CAPACITY <= Handle::MAX_INDEX,
                "Initial capacity larger max handle index.");

  // Slot table. A slot stores validity, generation and the dense index.
  std::vector<Handle> slots_;
  std::deque<uint32_t> free_slots_;
  std::vector<T> data_;
  // Dense index -> slot index, needed to patch the slot of the element moved
  // by swap-and-pop.
  std::vector<uint32_t> slot_of_data_;

  const Handle* find_slot(Handle handle) const {
    if (handle.is_empty() || handle.get_index() >= slots_.size()) {
      return nullptr;
    }

    const Handle& slot = slots_[handle.get_index()];
    if (!slot.get_is_valid() ||
        slot.get_generation() != handle.get_generation()) {
      return nullptr;
    }
    return &slot;
  }

  // Returns the slot index for a new resource or MAX_INDEX when full.
  uint32_t acquire_slot() {
    if (!free_slots_.empty()) {
      uint32_t slot_idx = free_slots_.front();
      free_slots_.pop_front();
      return slot_idx;
    }

    if (slots_.size() >= Handle::MAX_INDEX) {
      return Handle::MAX_INDEX;
    }
    slots_.push_back(Handle{});
    return static_cast<uint32_t>(slots_.size() - 1);
  }

 public:
  Manager() {
    slots_.resize(INITIAL_CAPACITY, Handle{});
    for (uint32_t i = 0; i < INITIAL_CAPACITY; ++i) {
      free_slots_.push_back(i);
    }
  }

  /**
   * @brief Invalidates all existing handles and clears all resources.
   */
  void clear() {
    for (Handle& s : slots_) {
      s.set_is_valid(false);
      s.increment_generation();
    }

    free_slots_.clear();
    for (uint32_t i = 0; i < slots_.size(); ++i) {
      free_slots_.push_back(i);
    }

    data_.clear();
    slot_of_data_.clear();
  }

  /**
   * @return Pointer to resource or nullptr if handle is empty, stale or
   * out of range.
   */
  T* get(Handle handle) {
    const Handle* slot = find_slot(handle);
    return (slot) ? data_.data() + slot->get_index() : nullptr;
  }

  const T* get(Handle handle) const {
    const Handle* slot = find_slot(handle);
    return (slot) ? data_.data() + slot->get_index() : nullptr;
  }

  /**
   * @brief Adds a new resource and returns its handle.
   *
   * @return Handle to new resource, or empty handle if out of capacity
   */
  template <typename U>
  Handle add(U&& resource) {
    uint32_t slot_idx = acquire_slot();
    if (slot_idx == Handle::MAX_INDEX) {
      return Handle{};
    }

    Handle& slot = slots_[slot_idx];
    slot.set_is_valid(true);
    slot.set_index(static_cast<uint32_t>(data_.size()));
    data_.push_back(std::forward<U>(resource));
    slot_of_data_.push_back(slot_idx);
    return Handle{true, slot.get_generation(), slot_idx};
  }

  /**
   * @brief Removes resource and invalidates its handle.
   *
   * @return true if resource was removed, false if handle was invalid
   */
  bool remove(Handle handle) {
    if (!find_slot(handle)) {
      return false;
    }

    Handle& dead_slot = slots_[handle.get_index()];
    uint32_t dead_index = dead_slot.get_index();

    // Swap-and-pop keeps the dense layout.
    uint32_t last_index = static_cast<uint32_t>(data_.size() - 1);
    if (dead_index != last_index) {
      data_[dead_index] = std::move_if_noexcept(data_.back());
      slots_[slot_of_data_.back()].set_index(dead_index);
      slot_of_data_[dead_index] = slot_of_data_.back();
    }
    data_.pop_back();
    slot_of_data_.pop_back();

    dead_slot.set_is_valid(false);
    dead_slot.increment_generation();
    free_slots_.push_front(handle.get_index());

    return true;
  }

  uint32_t size() const { return static_cast<uint32_t>(data_.size()); }

  std::vector<T>& data() { return data_; }

  const std::vector<T>& data() const { return data_; }
};

}  // namespace glide
