/**
 * @file gs_controller.hpp
 * @brief Контроллер: связывает бэкенд отображения и игровую сессию
 *
 * За один кадр контроллер:
 * 1. забирает все события ввода из View и переводит их в клавиши и
 *    действия сессии (p - пауза, r - перезапуск, q/Esc - выход);
 * 2. вызывает snake_update() с прошедшим временем;
 * 3. рисует устоявшееся состояние в зоны "field", "length", "best",
 *    "resets", "status" и вызывает render().
 *
 * Размещение зон зависит от бэкенда (символы или пиксели) и передаётся
 * через ControllerLayout.
 */

#ifndef GSNAKE_CONTROLLER_HPP
#define GSNAKE_CONTROLLER_HPP

#include <optional>
#include <string>

extern "C" {
#include "gs_game.h"
#include "view.h"
}

namespace gsnake {

struct ZoneRect {
  int x = 0;
  int y = 0;
  int w = 1;
  int h = 1;
};

struct ControllerLayout {
  ZoneRect field;
  ZoneRect length;
  ZoneRect best;
  ZoneRect resets;
  ZoneRect status;
};

/// Физическая клавиша для кода View (стрелки и WASD).
std::optional<GameKey_t> map_view_key(int key_code) noexcept;

/// Действие сессии для кода View.
std::optional<GameAction_t> map_view_action(int key_code) noexcept;

bool is_quit_key(int key_code) noexcept;

class Controller {
 public:
  Controller(const ViewInterface& view, const GameConfig_t& config, int fps,
             const ControllerLayout& layout) noexcept;
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /**
   * @brief Инициализировать View, создать сессию и настроить зоны.
   * @return false, если что-то из этого не удалось (причина в журнале).
   */
  bool start();

  /**
   * @brief Один кадр: ввод, обновление сессии, отрисовка.
   * @return false, когда игрок запросил выход или View сломался.
   */
  bool step(int elapsed_ms);

  const GameInfo_t* info() const noexcept;

 private:
  bool pollInput_();
  bool draw_();
  void shutdown_() noexcept;

  const ViewInterface& view_;
  GameConfig_t config_;
  int fps_;
  ControllerLayout layout_;

  ViewHandle_t handle_ = nullptr;
  void* game_ = nullptr;
  std::string status_;
};

}  // namespace gsnake

#endif  // GSNAKE_CONTROLLER_HPP
