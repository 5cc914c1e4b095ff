/**
 * @file gs_game.h
 * @brief Общие C-типы игры "Змейка на сетке"
 *
 * Типы, через которые ядро игры общается с внешним миром: координаты клеток,
 * физические клавиши, действия сессии, конфигурация и снимок состояния для
 * отрисовки. Заголовок совместим с C и C++.
 *
 * @note Ось Y направлена вверх: направление Up увеличивает y.
 */

#ifndef GSNAKE_GAME_H
#define GSNAKE_GAME_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @struct GridPosition_t
 * @brief Координаты клетки сетки (не пиксели).
 */
typedef struct {
  int x;
  int y;
} GridPosition_t;

/**
 * @enum Direction_t
 * @brief Направление движения головы.
 */
typedef enum {
  GS_DIR_LEFT = 0,
  GS_DIR_UP,
  GS_DIR_RIGHT,
  GS_DIR_DOWN
} Direction_t;

/**
 * @enum GameKey_t
 * @brief Восемь физических клавиш управления.
 *
 * Порядок перечисления совпадает с приоритетом опроса: при одновременном
 * удержании нескольких клавиш учитывается первая по этому порядку.
 */
typedef enum {
  GS_KEY_ARROW_LEFT = 0,
  GS_KEY_ARROW_RIGHT,
  GS_KEY_ARROW_DOWN,
  GS_KEY_ARROW_UP,
  GS_KEY_A,
  GS_KEY_D,
  GS_KEY_S,
  GS_KEY_W,
  GS_KEY_COUNT
} GameKey_t;

/**
 * @enum KeyState_t
 * @brief Состояние клавиши, сообщаемое фронтендом.
 *
 * GS_KEY_TAPPED - клавиша считается удержанной ровно один кадр; нужно для
 * бэкендов, которые не сообщают об отпускании (ncurses).
 */
typedef enum {
  GS_KEY_RELEASED = 0,
  GS_KEY_PRESSED,
  GS_KEY_TAPPED
} KeyState_t;

/**
 * @enum GameAction_t
 * @brief Управляющие действия сессии.
 */
typedef enum {
  GS_ACTION_PAUSE = 0,  ///< переключить паузу
  GS_ACTION_RESTART     ///< пересоздать змейку и очистить еду
} GameAction_t;

/**
 * @enum CellValue_t
 * @brief Значения клеток матрицы GameInfo_t::field.
 */
typedef enum {
  GS_CELL_EMPTY = 0,
  GS_CELL_BODY = 1,
  GS_CELL_HEAD = 2,
  GS_CELL_FOOD = 3
} CellValue_t;

/**
 * @struct GameConfig_t
 * @brief Параметры сессии.
 *
 * Заполняется gsnake_default_config() и проверяется gsnake_is_valid_config().
 */
typedef struct {
  int arena_width;              ///< ширина арены в клетках
  int arena_height;             ///< высота арены в клетках
  GridPosition_t start;         ///< стартовая клетка головы
  Direction_t start_direction;  ///< стартовое направление
  int tick_period_ms;           ///< период часов движения
  int food_period_ms;           ///< период появления еды
  int max_food;                 ///< предел еды на поле, 0 - без предела
  unsigned seed;                ///< зерно генератора еды, 0 - случайное
} GameConfig_t;

/**
 * @struct GameInfo_t
 * @brief Снимок состояния для отрисовки (только чтение).
 *
 * Указатели ссылаются на внутренние буферы сессии и действительны до
 * следующего вызова snake_update(), snake_handle_action() или
 * snake_destroy().
 *
 * Матрица field хранится построчно, ширина - width, высота - height.
 * Строка 0 соответствует верхнему краю арены, то есть y = height - 1.
 */
typedef struct {
  int width;
  int height;
  const GridPosition_t *chain;  ///< цепочка, голова первой
  int chain_length;
  int has_head;
  const GridPosition_t *food;   ///< еда в порядке появления
  int food_count;
  const int *field;             ///< значения CellValue_t
  int pause;
  int resets;                   ///< число сбросов после столкновений
  int best_length;              ///< наибольшая длина цепочки за сессию
  long ticks;                   ///< число сработавших тиков
} GameInfo_t;

#ifdef __cplusplus
}
#endif

#endif /* GSNAKE_GAME_H */
