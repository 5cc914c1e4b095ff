/**
 * @file view.h
 * @brief Абстрактный интерфейс отображения для фронтендов "Змейки на сетке"
 *
 * View - адаптер представления: получает от контроллера готовые данные
 * (текст, числа, матрицу клеток) и отдаёт события клавиатуры. Логику игры
 * он не знает и обратного канала в ядро не имеет.
 *
 * Реализации: cli_view (ncurses) и qt_view (Qt6 Widgets).
 *
 * @defgroup View Интерфейс отображения
 * @{
 */

#ifndef GSNAKE_VIEW_H
#define GSNAKE_VIEW_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Непрозрачный контекст бэкенда. */
typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат операций View.
 */
typedef enum {
  VIEW_OK,               ///< успех
  VIEW_ERROR,            ///< общая ошибка
  VIEW_INVALID_ID,       ///< зона с таким element_id не настроена
  VIEW_BAD_DATA,         ///< некорректные аргументы или данные
  VIEW_NOT_INITIALIZED,  ///< handle равен NULL
  VIEW_NO_EVENT          ///< очередь ввода пуста (poll_input)
} ViewResult_t;

/**
 * @name Коды клавиш
 * Буквы и цифры передаются своим ASCII-кодом в нижнем регистре,
 * стрелки и Esc - кодами ниже.
 * @{
 */
#define VIEW_KEY_ESCAPE 27
#define VIEW_KEY_ARROW_LEFT 0x1001
#define VIEW_KEY_ARROW_RIGHT 0x1002
#define VIEW_KEY_ARROW_UP 0x1003
#define VIEW_KEY_ARROW_DOWN 0x1004
/** @} */

/**
 * @enum ViewKeyState_t
 * @brief Тип события клавиши.
 *
 * Бэкенды, которые умеют сообщать об отпускании (Qt), шлют пары
 * PRESS/RELEASE. Бэкенды без отпускания (терминал) шлют TAP - клавиша
 * считается удержанной один кадр.
 */
typedef enum {
  VIEW_KEY_TAP = 0,
  VIEW_KEY_PRESS,
  VIEW_KEY_RELEASE
} ViewKeyState_t;

/**
 * @struct InputEvent_t
 * @brief Событие клавиатуры.
 */
typedef struct {
  int key_code;              ///< ASCII или VIEW_KEY_*
  ViewKeyState_t key_state;  ///< TAP, PRESS или RELEASE
} InputEvent_t;

/**
 * @enum ElementType_t
 * @brief Тип содержимого зоны.
 */
typedef enum {
  ELEMENT_TEXT,    ///< const char* (поддерживает '\n')
  ELEMENT_NUMBER,  ///< int
  ELEMENT_MATRIX   ///< матрица int, значения CellValue_t
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Данные для отрисовки одной зоны.
 *
 * @note Данные не копируются: текст и матрица должны жить до render().
 * @note Матрица хранится построчно: элемент (col, row) → row * width + col.
 */
typedef struct ElementData_t {
  ElementType_t type;
  union {
    const char *text;
    int number;
    struct {
      const int *data;
      int width;
      int height;
    } matrix;
  } content;
} ElementData_t;

/**
 * @brief Таблица функций бэкенда отображения.
 *
 * @code
 * ViewHandle_t view = cli_view.init(10, 10, 60);
 * cli_view.configure_zone(view, "field", 1, 1, 20, 10);
 * cli_view.draw_element(view, "field", &data);
 * cli_view.render(view);
 * cli_view.shutdown(view);
 * @endcode
 */
typedef struct ViewInterface {
  int version;  ///< VIEW_INTERFACE_VERSION

  /**
   * @brief Инициализировать бэкенд.
   * @param width  Ширина арены в клетках
   * @param height Высота арены в клетках
   * @param fps    Частота кадров контроллера
   * @return Контекст или NULL при ошибке
   */
  ViewHandle_t (*init)(int width, int height, int fps);

  /**
   * @brief Настроить зону вывода (повторный вызов перезаписывает зону).
   *
   * Единицы x, y, max_width, max_height зависят от бэкенда: символы
   * терминала для CLI, пиксели для Qt.
   */
  ViewResult_t (*configure_zone)(ViewHandle_t handle, const char *element_id,
                                 int x, int y, int max_width, int max_height);

  /** @brief Записать данные зоны в буфер кадра. */
  ViewResult_t (*draw_element)(ViewHandle_t handle, const char *element_id,
                               const ElementData_t *data);

  /** @brief Вывести буфер кадра. */
  ViewResult_t (*render)(ViewHandle_t handle);

  /**
   * @brief Забрать одно событие ввода.
   * @return VIEW_OK при наличии события, VIEW_NO_EVENT если очередь пуста.
   */
  ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

  /** @brief Завершить работу; handle становится недействительным. */
  ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

#define VIEW_INTERFACE_VERSION 2

#ifdef __cplusplus
}
#endif

#endif  // GSNAKE_VIEW_H

/** @} */  // end of View module
