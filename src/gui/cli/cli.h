/**
 * @file cli.h
 * @brief Терминальная реализация View на ncurses
 *
 * Экспортирует объект `cli_view`, реализующий @ref ViewInterface.
 * Поле рисуется по два символа на клетку, чтобы клетки выглядели
 * квадратными. Ncurses не сообщает об отпускании клавиш, поэтому все
 * события ввода приходят как VIEW_KEY_TAP.
 *
 * @note Требуется ncurses (-lncurses).
 * @note Бэкенд сам вызывает initscr()/endwin(); не используйте ncurses
 *       напрямую параллельно с ним.
 *
 * @defgroup Cli_view Терминальный интерфейс
 * @ingroup View
 */

#ifndef GSNAKE_CLI_H
#define GSNAKE_CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Экземпляр терминального бэкенда.
 *
 * Функции не потокобезопасны и вызываются из основного цикла контроллера.
 * Одновременно допускается только один активный контекст.
 */
extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif  // GSNAKE_CLI_H
