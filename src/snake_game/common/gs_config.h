/**
 * @file gs_config.h
 * @brief Значения конфигурации по умолчанию и допустимые диапазоны
 *
 * Константы используются функцией gsnake_default_config() и валидацией
 * gsnake_is_valid_config(). Время задаётся в миллисекундах, размеры и
 * координаты - в клетках сетки.
 */

#ifndef GSNAKE_CONFIG_H
#define GSNAKE_CONFIG_H

/* Размер арены */
#define GSNAKE_ARENA_WIDTH 10
#define GSNAKE_ARENA_HEIGHT 10
#define GSNAKE_ARENA_MIN_SIDE 5
#define GSNAKE_ARENA_MAX_SIDE 64

/* Каноническое стартовое положение: голова, за ней один сегмент */
#define GSNAKE_START_X 3
#define GSNAKE_START_Y 3
#define GSNAKE_START_DIRECTION GS_DIR_UP
#define GSNAKE_MIN_CHAIN_LENGTH 2

/* Период часов движения */
#define GSNAKE_TICK_PERIOD_MS 150

/* Период появления еды и предел одновременно лежащей еды (0 - без предела) */
#define GSNAKE_FOOD_PERIOD_MS 1000
#define GSNAKE_MAX_FOOD 0

/* 0 - инициализировать генератор из std::random_device */
#define GSNAKE_DEFAULT_SEED 0u

#endif /* GSNAKE_CONFIG_H */
