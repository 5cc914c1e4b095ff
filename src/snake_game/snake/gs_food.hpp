/**
 * @file gs_food.hpp
 * @brief Источник еды
 *
 * FoodSource - интерфейс, через который ядро видит еду: перечислить
 * позиции и удалить еду в клетке. FoodField - реализация со своим таймером
 * появления: по срабатыванию таймера кладёт одну единицу еды в случайную
 * свободную клетку арены.
 */

#ifndef GSNAKE_FOOD_HPP
#define GSNAKE_FOOD_HPP

#include <cstddef>
#include <random>
#include <vector>

#include "gs_clock.hpp"
#include "gs_snake_types.hpp"

namespace gsnake {

class FoodSource {
 public:
  virtual ~FoodSource() = default;

  /// Текущие позиции еды в детерминированном порядке.
  virtual const std::vector<GridPosition>& positions() const noexcept = 0;

  /// Удалить одну единицу еды в клетке @p p. false, если еды там нет.
  virtual bool remove(GridPosition p) noexcept = 0;
};

/**
 * @brief Еда на арене с таймером появления.
 *
 * Позиции хранятся в порядке появления. Клетка считается свободной, если в
 * ней нет ни еды, ни элемента цепочки змейки. Если свободных клеток нет или
 * достигнут предел max_food, таймер срабатывает вхолостую.
 *
 * @note Генератор - std::mt19937. Зерно 0 означает инициализацию из
 *       std::random_device; с ненулевым зерном последовательность появлений
 *       воспроизводима.
 */
class FoodField : public FoodSource {
 public:
  FoodField(Arena arena, int spawn_period_ms, int max_food, unsigned seed);

  const std::vector<GridPosition>& positions() const noexcept override {
    return food_;
  }
  bool remove(GridPosition p) noexcept override;

  /**
   * @brief Продвинуть таймер появления.
   * @param elapsed_ms Прошедшее время.
   * @param occupied   Клетки, занятые змейкой.
   * @return true, если появилась новая еда.
   */
  bool update(int elapsed_ms, const std::vector<GridPosition>& occupied);

  /// Положить еду в заданную клетку (без проверки занятости).
  void place(GridPosition p);

  void clear() noexcept;

  std::size_t size() const noexcept { return food_.size(); }

 private:
  bool spawn_(const std::vector<GridPosition>& occupied);

  Arena arena_;
  int max_food_;
  RepeatingClock spawn_clock_;
  std::mt19937 gen_;
  std::vector<GridPosition> food_;
};

}  // namespace gsnake

#endif  // GSNAKE_FOOD_HPP
