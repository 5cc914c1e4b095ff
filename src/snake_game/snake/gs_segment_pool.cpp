/**
 * @file gs_segment_pool.cpp
 * @brief Реализация пула сегментов
 */

#include "gs_segment_pool.hpp"

namespace gsnake {

SegmentHandle SegmentPool::create(GridPosition position) {
  std::uint32_t index;
  if (!free_.empty()) {
    index = free_.back();
    free_.pop_back();
  } else {
    index = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
    // free_ не длиннее slots_, поэтому push_back в destroy() не выделяет память
    free_.reserve(slots_.size());
  }

  Slot& slot = slots_[index];
  slot.position = position;
  slot.alive = true;
  ++alive_;
  return SegmentHandle{index, slot.generation};
}

bool SegmentPool::destroy(SegmentHandle handle) noexcept {
  if (find_(handle) == nullptr) return false;

  Slot& slot = slots_[handle.index];
  slot.alive = false;
  ++slot.generation;
  --alive_;
  free_.push_back(handle.index);
  return true;
}

bool SegmentPool::alive(SegmentHandle handle) const noexcept {
  return find_(handle) != nullptr;
}

std::optional<GridPosition> SegmentPool::position(
    SegmentHandle handle) const noexcept {
  const Slot* slot = find_(handle);
  if (slot == nullptr) return std::nullopt;
  return slot->position;
}

bool SegmentPool::set_position(SegmentHandle handle,
                               GridPosition position) noexcept {
  if (find_(handle) == nullptr) return false;
  slots_[handle.index].position = position;
  return true;
}

const SegmentPool::Slot* SegmentPool::find_(
    SegmentHandle handle) const noexcept {
  if (handle.index >= slots_.size()) return nullptr;
  const Slot& slot = slots_[handle.index];
  if (!slot.alive || slot.generation != handle.generation) return nullptr;
  return &slot;
}

}  // namespace gsnake
