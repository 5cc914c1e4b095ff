/**
 * @file gs_game_cmn.h
 * @brief Общие утилиты игры: конфигурация по умолчанию и валидация
 *
 * Функции этого заголовка используются C API сессии, контроллером и
 * фронтендами. Они отвечают за:
 * - заполнение GameConfig_t значениями по умолчанию (см. gs_config.h);
 * - проверку конфигурации до создания сессии;
 * - проверку значений клавиш, состояний клавиш и действий, пришедших
 *   из фронтенда;
 * - проверку согласованности снимка GameInfo_t перед отрисовкой.
 */

#ifndef GSNAKE_GAME_CMN_H
#define GSNAKE_GAME_CMN_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

#include "gs_game.h"

/**
 * @brief Получить конфигурацию по умолчанию
 *
 * Возвращает арену 10x10, голову в (3, 3) с направлением Up, период
 * движения 150 мс, период появления еды 1000 мс, без предела количества еды
 * и со случайным зерном.
 *
 * @code
 * GameConfig_t cfg = gsnake_default_config();
 * cfg.arena_width = 20;
 * void *game = snake_create(&cfg);
 * @endcode
 *
 * @return Заполненная структура GameConfig_t
 */
GameConfig_t gsnake_default_config(void);

/**
 * @brief Проверить корректность конфигурации
 *
 * Проверяет следующее:
 * - ширина и высота арены в диапазоне [GSNAKE_ARENA_MIN_SIDE,
 *   GSNAKE_ARENA_MAX_SIDE];
 * - стартовое направление допустимо;
 * - голова и следующий за ней сегмент (на клетку позади головы по
 *   стартовому направлению) лежат внутри арены;
 * - периоды движения и появления еды положительны;
 * - предел еды неотрицателен.
 *
 * @param config Конфигурация для проверки
 *
 * @return true если конфигурация допустима, false иначе (в том числе при NULL)
 */
bool gsnake_is_valid_config(const GameConfig_t *config);

/**
 * @brief Проверить, что значение является одной из восьми клавиш GameKey_t
 */
bool gsnake_is_valid_key(int key);

/**
 * @brief Проверить, что значение является допустимым KeyState_t
 */
bool gsnake_is_valid_key_state(int state);

/**
 * @brief Проверить, что значение является допустимым GameAction_t
 */
bool gsnake_is_valid_action(int action);

/**
 * @brief Проверить согласованность снимка GameInfo_t
 *
 * Проверяет следующее:
 * - размеры арены положительны, field не NULL;
 * - цепочка не пуста, содержит не меньше GSNAKE_MIN_CHAIN_LENGTH элементов
 *   и has_head установлен;
 * - food не NULL, если food_count > 0;
 * - каждая клетка field содержит значение CellValue_t;
 * - pause равна 0 или 1, счётчики неотрицательны.
 *
 * @param info Снимок для проверки
 *
 * @return true если снимок корректен
 *
 * @code
 * const GameInfo_t *info = snake_get_info(game);
 * if (gsnake_is_valid_game_info(info)) {
 *   draw(info);
 * }
 * @endcode
 */
bool gsnake_is_valid_game_info(const GameInfo_t *info);

#ifdef __cplusplus
}
#endif

#endif /* GSNAKE_GAME_CMN_H */
