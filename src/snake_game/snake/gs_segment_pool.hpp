/**
 * @file gs_segment_pool.hpp
 * @brief Пул сегментов змейки с поколенческими дескрипторами
 *
 * Хранит позиции головы и сегментов тела. Каждый объект адресуется
 * дескриптором {index, generation}. Уничтожение объекта увеличивает
 * поколение слота, поэтому старые дескрипторы становятся недействительными
 * ("висячими") и при чтении дают пустой результат, а не чужую позицию.
 *
 * Освобождённые слоты переиспользуются в порядке LIFO.
 */

#ifndef GSNAKE_SEGMENT_POOL_HPP
#define GSNAKE_SEGMENT_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "gs_snake_types.hpp"

namespace gsnake {

struct SegmentHandle {
  std::uint32_t index = 0;
  std::uint32_t generation = 0;

  bool operator==(const SegmentHandle& o) const noexcept {
    return index == o.index && generation == o.generation;
  }
  bool operator!=(const SegmentHandle& o) const noexcept {
    return !(*this == o);
  }
};

class SegmentPool {
 public:
  /// Создать объект с позицией @p position и вернуть его дескриптор.
  SegmentHandle create(GridPosition position);

  /// Уничтожить объект. false, если дескриптор уже недействителен.
  bool destroy(SegmentHandle handle) noexcept;

  bool alive(SegmentHandle handle) const noexcept;

  /// Позиция объекта или std::nullopt для недействительного дескриптора.
  std::optional<GridPosition> position(SegmentHandle handle) const noexcept;

  /// Записать позицию. false, если дескриптор недействителен.
  bool set_position(SegmentHandle handle, GridPosition position) noexcept;

  std::size_t size() const noexcept { return alive_; }

 private:
  struct Slot {
    GridPosition position;
    std::uint32_t generation = 0;
    bool alive = false;
  };

  const Slot* find_(SegmentHandle handle) const noexcept;

  std::vector<Slot> slots_;
  std::vector<std::uint32_t> free_;
  std::size_t alive_ = 0;
};

}  // namespace gsnake

#endif  // GSNAKE_SEGMENT_POOL_HPP
