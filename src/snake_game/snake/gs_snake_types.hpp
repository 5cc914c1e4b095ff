/**
 * @file gs_snake_types.hpp
 * @brief Базовые типы ядра: координаты, направление, арена
 *
 * Значимые типы без поведения, кроме отношения "противоположное
 * направление", смещения на одну клетку и проверки границ арены.
 *
 * @note Ось Y направлена вверх: Up увеличивает y, Down уменьшает.
 */

#ifndef GSNAKE_SNAKE_TYPES_HPP
#define GSNAKE_SNAKE_TYPES_HPP

#include "gs_game.h"

namespace gsnake {

/**
 * @brief Клетка сетки. Равенство - точное совпадение координат.
 *
 * Значения не ограничиваются ареной: голова может на время выйти за её
 * пределы между шагом и проверкой столкновений.
 */
struct GridPosition {
  int x = 0;
  int y = 0;

  constexpr GridPosition() noexcept = default;
  constexpr GridPosition(int px, int py) noexcept : x(px), y(py) {}

  constexpr bool operator==(const GridPosition& o) const noexcept {
    return x == o.x && y == o.y;
  }
  constexpr bool operator!=(const GridPosition& o) const noexcept {
    return !(*this == o);
  }
};

enum class Direction { LEFT, UP, RIGHT, DOWN };

constexpr Direction opposite(Direction d) noexcept {
  switch (d) {
    case Direction::LEFT:
      return Direction::RIGHT;
    case Direction::UP:
      return Direction::DOWN;
    case Direction::RIGHT:
      return Direction::LEFT;
    case Direction::DOWN:
      return Direction::UP;
  }
  return d;
}

/// Соседняя клетка в направлении @p d.
constexpr GridPosition step(GridPosition p, Direction d) noexcept {
  switch (d) {
    case Direction::LEFT:
      return {p.x - 1, p.y};
    case Direction::UP:
      return {p.x, p.y + 1};
    case Direction::RIGHT:
      return {p.x + 1, p.y};
    case Direction::DOWN:
      return {p.x, p.y - 1};
  }
  return p;
}

constexpr Direction from_c(Direction_t d) noexcept {
  switch (d) {
    case GS_DIR_LEFT:
      return Direction::LEFT;
    case GS_DIR_RIGHT:
      return Direction::RIGHT;
    case GS_DIR_DOWN:
      return Direction::DOWN;
    case GS_DIR_UP:
    default:
      return Direction::UP;
  }
}

constexpr GridPosition from_c(GridPosition_t p) noexcept { return {p.x, p.y}; }

constexpr GridPosition_t to_c(GridPosition p) noexcept { return {p.x, p.y}; }

const char* to_string(Direction d) noexcept;

/**
 * @brief Границы арены (ширина x высота, в клетках).
 */
struct Arena {
  int width = 0;
  int height = 0;

  constexpr bool contains(GridPosition p) const noexcept {
    return p.x >= 0 && p.y >= 0 && p.x < width && p.y < height;
  }

  constexpr int cells() const noexcept { return width * height; }
};

}  // namespace gsnake

#endif  // GSNAKE_SNAKE_TYPES_HPP
