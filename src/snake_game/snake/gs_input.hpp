/**
 * @file gs_input.hpp
 * @brief Источник ввода: "удерживается ли физическая клавиша K"
 *
 * InputSource - граница между ядром и фронтендом. KeyboardState - его
 * реализация, которую заполняет C API (snake_set_key).
 */

#ifndef GSNAKE_INPUT_HPP
#define GSNAKE_INPUT_HPP

#include <array>

#include "gs_game.h"

namespace gsnake {

class InputSource {
 public:
  virtual ~InputSource() = default;
  virtual bool is_held(GameKey_t key) const noexcept = 0;
};

/**
 * @brief Состояние восьми клавиш управления.
 *
 * Нажатие (GS_KEY_PRESSED) держится до явного отпускания. Касание
 * (GS_KEY_TAPPED) держится до ближайшего release_taps(), который сессия
 * вызывает в конце каждого кадра.
 */
class KeyboardState : public InputSource {
 public:
  bool is_held(GameKey_t key) const noexcept override;

  /// false для ключа или состояния вне диапазона.
  bool set(GameKey_t key, KeyState_t state) noexcept;

  void release_taps() noexcept;
  void release_all() noexcept;

 private:
  std::array<KeyState_t, GS_KEY_COUNT> keys_{};
};

}  // namespace gsnake

#endif  // GSNAKE_INPUT_HPP
