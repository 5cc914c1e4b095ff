/**
 * @file gs_snake_systems.hpp
 * @brief Состояние ядра змейки и системы, которые его изменяют
 *
 * Всё изменяемое состояние ядра собрано в SnakeState и передаётся по ссылке
 * в каждую систему. Глобального состояния нет.
 *
 * Порядок систем внутри кадра фиксирован (его соблюдает SnakeGame::update):
 * 1. handle_input()       - выбор направления по удерживаемым клавишам;
 * 2. movement()           - тик часов, сдвиг цепочки, проверка столкновений;
 * 3. reset_snake()        - если movement() выставил game_over;
 * 4. detect_food()        - только после сработавшего тика без сброса;
 * 5. apply_growth()       - добавление сегментов в PendingTailPosition.
 *
 * Производители флагов (game_over, pending_growth) всегда выполняются раньше
 * потребителей в том же кадре; между кадрами флаги не переносятся.
 */

#ifndef GSNAKE_SNAKE_SYSTEMS_HPP
#define GSNAKE_SNAKE_SYSTEMS_HPP

#include <optional>
#include <vector>

#include "gs_clock.hpp"
#include "gs_food.hpp"
#include "gs_input.hpp"
#include "gs_segment_pool.hpp"
#include "gs_snake_types.hpp"

namespace gsnake {

/// Причины конца игры, битовые флаги (обе могут сработать в одном тике).
enum GameOverCause : unsigned {
  GAME_OVER_NONE = 0,
  GAME_OVER_BOUNDARY = 1u << 0,
  GAME_OVER_SELF = 1u << 1
};

const char* describe_game_over(unsigned causes) noexcept;

/// Неизменяемые параметры ядра.
struct CoreConfig {
  Arena arena{10, 10};
  GridPosition start{3, 3};
  Direction start_direction = Direction::UP;
  int tick_period_ms = 150;
};

/// Результат системы движения.
enum class TickResult {
  IDLE,     ///< часы не сработали, кадр без изменений
  ABORTED,  ///< нарушена согласованность цепочки, тик отменён целиком
  MOVED     ///< цепочка сдвинута на одну клетку
};

/**
 * @brief Изменяемое состояние ядра.
 *
 * chain[0] - голова, chain[1..N] - сегменты тела от головы к хвосту.
 * Направление принадлежит голове и пересоздаётся вместе с ней.
 */
struct SnakeState {
  explicit SnakeState(const CoreConfig& cfg);

  CoreConfig config;
  SegmentPool pool;
  std::vector<SegmentHandle> chain;
  Direction direction;
  RepeatingClock movement_clock;

  /// Позиция последнего элемента цепочки до последнего сдвига.
  std::optional<GridPosition> pending_tail;
  unsigned game_over = GAME_OVER_NONE;
  int pending_growth = 0;
};

/**
 * @brief Создать каноническую змейку: голова в start, один сегмент позади.
 *
 * @pre Цепочка пуста (после конструирования или despawn_snake()).
 */
void spawn_snake(SnakeState& state);

/// Уничтожить голову и все сегменты.
void despawn_snake(SnakeState& state) noexcept;

/**
 * @brief Сброс после конца игры.
 *
 * Уничтожает цепочку, создаёт каноническую заново и отбрасывает
 * отложенный рост, PendingTailPosition и флаги конца игры.
 */
void reset_snake(SnakeState& state);

/// Первое по приоритету направление среди удерживаемых клавиш.
std::optional<Direction> read_direction(const InputSource& input) noexcept;

/**
 * @brief Система ввода.
 *
 * Применяет направление read_direction(), если оно не противоположно
 * текущему. Ничего не делает, если клавиши не нажаты или головы нет.
 */
void handle_input(SnakeState& state, const InputSource& input) noexcept;

/**
 * @brief Система движения и столкновений.
 *
 * При срабатывании часов:
 * - снимает позиции цепочки до изменений; если какой-либо дескриптор
 *   недействителен, тик отменяется без изменений (TickResult::ABORTED);
 * - смещает голову на клетку по направлению;
 * - проверяет выход за арену и попадание в любую позицию снимка и
 *   выставляет флаги game_over;
 * - каждый сегмент i занимает позицию снимка i-1;
 * - запоминает позицию последнего элемента снимка в pending_tail.
 */
TickResult movement(SnakeState& state, int elapsed_ms);

/**
 * @brief Система обнаружения еды.
 *
 * Для каждой еды в клетке головы просит источник удалить её и ставит в
 * очередь одно событие роста.
 *
 * @return Число съеденной еды.
 */
int detect_food(SnakeState& state, FoodSource& food);

/**
 * @brief Система роста.
 *
 * Каждое отложенное событие роста добавляет в конец цепочки сегмент в
 * позиции pending_tail. Очередь роста очищается.
 *
 * @return Число добавленных сегментов.
 */
int apply_growth(SnakeState& state);

/// Позиции цепочки по порядку (только разрешимые дескрипторы).
std::vector<GridPosition> chain_positions(const SnakeState& state);

/// Позиция головы или std::nullopt, если головы нет.
std::optional<GridPosition> head_position(const SnakeState& state) noexcept;

}  // namespace gsnake

#endif  // GSNAKE_SNAKE_SYSTEMS_HPP
