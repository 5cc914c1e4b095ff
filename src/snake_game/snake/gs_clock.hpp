/**
 * @file gs_clock.hpp
 * @brief Повторяющийся таймер с фиксированным периодом
 *
 * Используется как часы движения змейки и как таймер появления еды.
 * Таймер не накапливает срабатывания: один вызов tick() срабатывает не
 * более одного раза, сколько бы времени ни прошло. Остаток сверх целого
 * числа периодов сохраняется.
 *
 * @code
 * RepeatingClock clock(150);
 * clock.tick(100);   // false
 * clock.tick(60);    // true, остаток 10 мс
 * clock.tick(1500);  // true один раз, остаток 1510 % 150 = 10 мс
 * @endcode
 */

#ifndef GSNAKE_CLOCK_HPP
#define GSNAKE_CLOCK_HPP

namespace gsnake {

class RepeatingClock {
 public:
  explicit RepeatingClock(int period_ms) noexcept;

  /**
   * @brief Добавить прошедшее время.
   * @param elapsed_ms Прошедшее время; отрицательные значения считаются нулём.
   * @return true, если таймер сработал на этом вызове.
   */
  bool tick(int elapsed_ms) noexcept;

  void reset() noexcept { accumulated_ms_ = 0; }

  int period_ms() const noexcept { return period_ms_; }
  int accumulated_ms() const noexcept { return accumulated_ms_; }

 private:
  int period_ms_;
  int accumulated_ms_ = 0;
};

}  // namespace gsnake

#endif  // GSNAKE_CLOCK_HPP
