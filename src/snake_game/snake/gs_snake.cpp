/**
 * @file gs_snake.cpp
 * @brief C API обёртка для C++ реализации gsnake::SnakeGame
 *
 * Все функции объявлены как extern "C" и помечены noexcept, чтобы
 * исключение C++ не пересекло границу C (это привело бы к std::terminate()).
 *
 * @note Логика сессии находится в gs_snake_internals.cpp.
 * @see gs_snake.h, gs_snake_internals.hpp
 */

#include "gs_snake.h"

#include "gs_snake_internals.hpp"

extern "C" {

void* snake_create(const GameConfig_t* config) noexcept {
  return gsnake::SnakeGame::create(config);
}

void snake_destroy(void* game) noexcept { gsnake::SnakeGame::destroy(game); }

void snake_set_key(void* game, GameKey_t key, KeyState_t state) noexcept {
  gsnake::SnakeGame::set_key(game, key, state);
}

void snake_handle_action(void* game, GameAction_t action) noexcept {
  gsnake::SnakeGame::handle_action(game, action);
}

void snake_update(void* game, int elapsed_ms) noexcept {
  gsnake::SnakeGame::update(game, elapsed_ms);
}

const GameInfo_t* snake_get_info(const void* game) noexcept {
  return gsnake::SnakeGame::get_info(game);
}

}  // extern "C"
