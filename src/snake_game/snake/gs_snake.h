/**
 * @file gs_snake.h
 * @brief Публичный C интерфейс игровой сессии "Змейка на сетке"
 *
 * Сессия скрыта за непрозрачным указателем. Все функции безопасны при
 * передаче NULL и не выпускают исключения C++ за границу C.
 *
 * Типичный кадр контроллера:
 * @code
 * void *game = snake_create(NULL);            // конфигурация по умолчанию
 * snake_set_key(game, GS_KEY_ARROW_LEFT, GS_KEY_TAPPED);
 * snake_update(game, 16);                     // прошло 16 мс
 * const GameInfo_t *info = snake_get_info(game);
 * draw(info);
 * snake_destroy(game);
 * @endcode
 *
 * @see gs_snake_internals.hpp - реализация на C++
 */

#ifndef GSNAKE_SNAKE_H
#define GSNAKE_SNAKE_H

#include <stdbool.h>

#include "gs_game.h"

#ifdef __cplusplus
extern "C" {
#define GSNAKE_NOEXCEPT noexcept
#else
#define GSNAKE_NOEXCEPT
#endif

/**
 * @brief Создать сессию.
 *
 * @param config Конфигурация или NULL для значений по умолчанию.
 * @return Непрозрачный указатель или NULL, если конфигурация недопустима
 *         или не хватило памяти.
 */
void *snake_create(const GameConfig_t *config) GSNAKE_NOEXCEPT;

/** @brief Уничтожить сессию. Безопасна при NULL. */
void snake_destroy(void *game) GSNAKE_NOEXCEPT;

/**
 * @brief Сообщить состояние физической клавиши.
 *
 * Недопустимые значения key/state игнорируются.
 */
void snake_set_key(void *game, GameKey_t key, KeyState_t state) GSNAKE_NOEXCEPT;

/**
 * @brief Выполнить управляющее действие (пауза, перезапуск).
 *
 * Недопустимое действие игнорируется.
 */
void snake_handle_action(void *game, GameAction_t action) GSNAKE_NOEXCEPT;

/**
 * @brief Выполнить один кадр.
 *
 * @param elapsed_ms Время, прошедшее с предыдущего кадра. Змейка сдвигается
 *                   не более чем на одну клетку за вызов.
 */
void snake_update(void *game, int elapsed_ms) GSNAKE_NOEXCEPT;

/**
 * @brief Снимок состояния для отрисовки.
 *
 * @return Указатель на внутренний снимок или NULL при game == NULL.
 *         Действителен до следующего изменяющего вызова.
 */
const GameInfo_t *snake_get_info(const void *game) GSNAKE_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif /* GSNAKE_SNAKE_H */
