/**
 * @file gs_snake_internals.hpp
 * @brief Класс игровой сессии gsnake::SnakeGame
 *
 * Сессия владеет состоянием ядра (SnakeState), состоянием клавиатуры и полем
 * еды и управляется табличным конечным автоматом:
 *
 * | из         | событие        | в          |
 * |------------|----------------|------------|
 * | PLAYING    | PAUSE_TOGGLE   | PAUSED     |
 * | PAUSED     | PAUSE_TOGGLE   | PLAYING    |
 * | PLAYING    | GAME_OVER      | RESETTING  |
 * | PLAYING    | RESTART        | RESETTING  |
 * | PAUSED     | RESTART        | RESETTING  |
 * | RESETTING  | (автоматически)| PLAYING    |
 *
 * Автоматический переход из RESETTING выполняется в том же кадре, поэтому
 * состояние RESETTING снаружи не наблюдается.
 *
 * @note Доступ только через C API (gs_snake.h). Класс не потокобезопасен.
 */

#ifndef GSNAKE_SNAKE_INTERNALS_HPP
#define GSNAKE_SNAKE_INTERNALS_HPP

#include <cstddef>
#include <vector>

extern "C" {
#include "gs_fsm.h"
}

#include "gs_food.hpp"
#include "gs_game.h"
#include "gs_input.hpp"
#include "gs_snake_systems.hpp"

namespace gsnake {

enum class SessionState : gs_fsm_state_t {
  PLAYING = 1,
  PAUSED,
  RESETTING
};

enum class SessionEvent : gs_fsm_event_t {
  NONE = GS_FSM_EVENT_NONE,
  PAUSE_TOGGLE,
  GAME_OVER,
  RESTART
};

constexpr gs_fsm_state_t to_fsm_state(SessionState s) noexcept {
  return static_cast<gs_fsm_state_t>(s);
}

constexpr SessionState from_fsm_state(gs_fsm_state_t s) noexcept {
  return static_cast<SessionState>(s);
}

constexpr gs_fsm_event_t to_fsm_event(SessionEvent e) noexcept {
  return static_cast<gs_fsm_event_t>(e);
}

/// Перевод конфигурации C API в параметры ядра.
CoreConfig make_core_config(const GameConfig_t& config) noexcept;

class SnakeGame {
 public:
  static void* create(const GameConfig_t* config) noexcept;
  static void destroy(void* game) noexcept;
  static void set_key(void* game, GameKey_t key, KeyState_t state) noexcept;
  static void handle_action(void* game, GameAction_t action) noexcept;
  static void update(void* game, int elapsed_ms) noexcept;
  static const GameInfo_t* get_info(const void* game) noexcept;

  SnakeGame(const SnakeGame&) = delete;
  SnakeGame& operator=(const SnakeGame&) = delete;

  SessionState getState() const noexcept {
    return from_fsm_state(gs_fsm_current(&fsm_));
  }

#ifdef GSNAKE_TEST_ACCESS
  SnakeState& state_for_testing() noexcept { return state_; }
  FoodField& food_for_testing() noexcept { return food_; }
  int eaten_since_reset_for_testing() const noexcept {
    return eaten_since_reset_;
  }
#endif

 private:
  explicit SnakeGame(const GameConfig_t& config);
  ~SnakeGame() noexcept;

  void update_(int elapsed_ms);
  void processEvent_(SessionEvent ev) noexcept;
  void handleGameOver_() noexcept;
  void updateInfo_();

  static void on_enter_playing_(gs_fsm_context_t ctx);
  static void on_enter_paused_(gs_fsm_context_t ctx);
  static void on_enter_resetting_(gs_fsm_context_t ctx);

  static const gs_fsm_transition_t transitions_[];

  SnakeState state_;
  KeyboardState keys_;
  FoodField food_;
  gs_fsm_t fsm_{};

  bool restart_requested_ = false;
  bool paused_ = false;
  long ticks_ = 0;
  int resets_ = 0;
  int eaten_since_reset_ = 0;
  std::size_t best_length_ = 0;

  GameInfo_t info_{};
  std::vector<GridPosition_t> chain_buf_;
  std::vector<GridPosition_t> food_buf_;
  std::vector<int> field_;
};

}  // namespace gsnake

#endif  // GSNAKE_SNAKE_INTERNALS_HPP
