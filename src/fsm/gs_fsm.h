/**
 * @file gs_fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Небольшая библиотека конечного автомата на таблице переходов
 *
 * Пользовательский код (игровая сессия) объявляет свои состояния и события
 * целыми числами и описывает переходы массивом @ref gs_fsm_transition_t.
 * Библиотека не хранит данных пользователя - только указатель на контекст,
 * который передаётся в колбэки входа и выхода.
 *
 * ### Пример
 *
 * @code
 * enum { ST_PLAYING = 1, ST_PAUSED, ST_RESETTING };
 * enum { EV_PAUSE = 1, EV_GAME_OVER };
 *
 * static void on_enter_resetting(gs_fsm_context_t ctx) {
 *   respawn((Session *)ctx);
 * }
 *
 * static const gs_fsm_transition_t table[] = {
 *   {ST_PLAYING, EV_PAUSE, ST_PAUSED, NULL, NULL},
 *   {ST_PAUSED, EV_PAUSE, ST_PLAYING, NULL, NULL},
 *   {ST_PLAYING, EV_GAME_OVER, ST_RESETTING, NULL, on_enter_resetting},
 *   {ST_RESETTING, GS_FSM_EVENT_NONE, ST_PLAYING, NULL, NULL},
 * };
 *
 * gs_fsm_t fsm;
 * gs_fsm_init(&fsm, &session, table, 4, ST_PLAYING);
 * gs_fsm_process_event(&fsm, EV_GAME_OVER);  // PLAYING -> RESETTING
 * gs_fsm_update(&fsm);                       // RESETTING -> PLAYING
 * @endcode
 *
 * @{
 */

#ifndef GSNAKE_FSM_H
#define GSNAKE_FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def GS_FSM_EVENT_NONE
 * @brief Событие автоматического перехода.
 *
 * Переход с этим событием выполняется не по внешнему триггеру, а вызовом
 * @ref gs_fsm_update. Значение зарезервировано: пользовательские события
 * должны быть отличны от нуля.
 */
#define GS_FSM_EVENT_NONE 0

/** @brief Идентификатор события. `0` зарезервирован под @ref GS_FSM_EVENT_NONE. */
typedef int gs_fsm_event_t;

/** @brief Идентификатор состояния. */
typedef int gs_fsm_state_t;

/** @brief Непрозрачный пользовательский контекст, передаваемый в колбэки. */
typedef void *gs_fsm_context_t;

/**
 * @brief Колбэк входа или выхода из состояния.
 *
 * @param ctx Контекст, переданный в @ref gs_fsm_init (может быть NULL).
 *
 * @note Вложенный вызов @ref gs_fsm_process_event или @ref gs_fsm_update из
 *       колбэка игнорируется (возвращает false) - автомат защищён флагом
 *       `processing`.
 */
typedef void (*gs_fsm_cb_t)(gs_fsm_context_t ctx);

/**
 * @struct gs_fsm_transition_t
 * @brief Правило "из `src` по `event` в `dst`".
 *
 * Порядок записей в таблице значим: при нескольких подходящих правилах
 * срабатывает первое.
 */
typedef struct {
  gs_fsm_state_t src;    ///< исходное состояние
  gs_fsm_event_t event;  ///< событие-триггер
  gs_fsm_state_t dst;    ///< целевое состояние
  gs_fsm_cb_t on_exit;   ///< вызывается до смены состояния (может быть NULL)
  gs_fsm_cb_t on_enter;  ///< вызывается после смены состояния (может быть NULL)
} gs_fsm_transition_t;

/**
 * @struct gs_fsm_t
 * @brief Экземпляр автомата.
 *
 * @note Таблица переходов не копируется и должна жить дольше автомата.
 * @note Поля не предназначены для прямого изменения - только через API.
 */
typedef struct {
  const gs_fsm_transition_t *transitions;
  size_t count;
  gs_fsm_state_t current;
  gs_fsm_context_t ctx;
  bool processing;
} gs_fsm_t;

/**
 * @brief Инициализировать автомат.
 *
 * @param[out] fsm         Автомат (не NULL).
 * @param[in]  ctx         Контекст для колбэков (может быть NULL).
 * @param[in]  transitions Таблица переходов (не NULL).
 * @param[in]  count       Число записей (> 0).
 * @param[in]  start_state Начальное состояние.
 * @return true при успехе, false при некорректных аргументах.
 *
 * @note on_enter начального состояния не вызывается.
 */
bool gs_fsm_init(gs_fsm_t *fsm, gs_fsm_context_t ctx,
                 const gs_fsm_transition_t *transitions, size_t count,
                 gs_fsm_state_t start_state);

/**
 * @brief Отвязать автомат от таблицы и контекста.
 *
 * После вызова автомат не обрабатывает события до повторной инициализации.
 * Безопасна при NULL.
 */
void gs_fsm_destroy(gs_fsm_t *fsm);

/**
 * @brief Обработать событие.
 *
 * Ищет первое правило с `src == current` и `event == event` и выполняет
 * on_exit, смену состояния, on_enter.
 *
 * @return true, если переход выполнен.
 *
 * @note Событие @ref GS_FSM_EVENT_NONE здесь не принимается - для
 *       автоматических переходов используйте @ref gs_fsm_update.
 */
bool gs_fsm_process_event(gs_fsm_t *fsm, gs_fsm_event_t event);

/**
 * @brief Выполнить автоматический переход из текущего состояния, если он есть.
 *
 * @return true, если переход выполнен.
 */
bool gs_fsm_update(gs_fsm_t *fsm);

/**
 * @brief Текущее состояние автомата.
 *
 * @return Текущее состояние, либо -1 при NULL.
 */
gs_fsm_state_t gs_fsm_current(const gs_fsm_t *fsm);

#ifdef __cplusplus
}
#endif

#endif /* GSNAKE_FSM_H */

/** @} */  // end of FSM module
