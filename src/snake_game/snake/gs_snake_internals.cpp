/**
 * @file gs_snake_internals.cpp
 * @brief Реализация игровой сессии gsnake::SnakeGame на C++17
 *
 * Содержит:
 * - таблицу переходов конечного автомата сессии и колбэки входа;
 * - порядок систем ядра внутри кадра (ввод, движение, конец игры, еда, рост);
 * - сбор снимка GameInfo_t для отрисовки;
 * - статические точки входа для C API (непрозрачный указатель void*).
 *
 * Архитектурные особенности:
 * - **Непрозрачный указатель**: экземпляр SnakeGame виден C-коду только как
 *   void*, создание и уничтожение - через create() / destroy().
 * - **Явное состояние**: ядро не хранит глобальных данных, всё состояние
 *   змейки лежит в SnakeState и передаётся в системы по ссылке.
 * - **Конечный автомат на таблице**: пауза, конец игры и перезапуск -
 *   переходы gs_fsm, сброс змейки выполняется в колбэке входа в RESETTING.
 *
 * @note Все статические методы noexcept: исключения не пересекают границу C.
 * @note Потокобезопасность не гарантируется - все вызовы из одного потока.
 *
 * @see gs_snake_internals.hpp - объявление класса
 * @see gs_snake.cpp           - C API обёртка (extern "C")
 * @see gs_snake_systems.hpp   - системы ядра
 */

#include "gs_snake_internals.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <new>
#include <stdexcept>

extern "C" {
#include "gs_game_cmn.h"
}

namespace gsnake {

/**
 * @internal
 * @brief Таблица переходов конечного автомата сессии
 *
 * Каждая запись: { состояние, событие, новое_состояние, on_exit, on_enter }.
 *
 * - PLAYING + PAUSE_TOGGLE → PAUSED: часы, ввод и еда замораживаются.
 * - PAUSED + PAUSE_TOGGLE → PLAYING: продолжение.
 * - PLAYING + GAME_OVER → RESETTING: столкновение, змейка пересоздаётся.
 * - PLAYING/PAUSED + RESTART → RESETTING: ручной перезапуск, еда убирается.
 * - RESETTING → PLAYING: автоматически (GS_FSM_EVENT_NONE), в том же кадре.
 *
 * @warning Событие GAME_OVER из PAUSED не обрабатывается: на паузе движение
 *          не выполняется, поэтому столкновение возникнуть не может.
 */
const gs_fsm_transition_t SnakeGame::transitions_[] = {
    {to_fsm_state(SessionState::PLAYING),
     to_fsm_event(SessionEvent::PAUSE_TOGGLE),
     to_fsm_state(SessionState::PAUSED), nullptr,
     &SnakeGame::on_enter_paused_},

    {to_fsm_state(SessionState::PAUSED),
     to_fsm_event(SessionEvent::PAUSE_TOGGLE),
     to_fsm_state(SessionState::PLAYING), nullptr,
     &SnakeGame::on_enter_playing_},

    {to_fsm_state(SessionState::PLAYING), to_fsm_event(SessionEvent::GAME_OVER),
     to_fsm_state(SessionState::RESETTING), nullptr,
     &SnakeGame::on_enter_resetting_},

    {to_fsm_state(SessionState::PLAYING), to_fsm_event(SessionEvent::RESTART),
     to_fsm_state(SessionState::RESETTING), nullptr,
     &SnakeGame::on_enter_resetting_},

    {to_fsm_state(SessionState::PAUSED), to_fsm_event(SessionEvent::RESTART),
     to_fsm_state(SessionState::RESETTING), nullptr,
     &SnakeGame::on_enter_resetting_},

    {to_fsm_state(SessionState::RESETTING), to_fsm_event(SessionEvent::NONE),
     to_fsm_state(SessionState::PLAYING), nullptr,
     &SnakeGame::on_enter_playing_},
};

CoreConfig make_core_config(const GameConfig_t& config) noexcept {
  CoreConfig core;
  core.arena = Arena{config.arena_width, config.arena_height};
  core.start = from_c(config.start);
  core.start_direction = from_c(config.start_direction);
  core.tick_period_ms = config.tick_period_ms;
  return core;
}

/**
 * @brief Создаёт новую сессию
 * @param[in] config Конфигурация; nullptr - значения по умолчанию
 * @return void* Непрозрачный указатель на сессию, или nullptr при ошибке
 *
 * Перед созданием конфигурация проверяется gsnake_is_valid_config().
 * Недопустимая конфигурация и нехватка памяти приводят к nullptr; причина
 * пишется в журнал.
 *
 * @warning Освобождать результат только через destroy() (snake_destroy()).
 */
void* SnakeGame::create(const GameConfig_t* config) noexcept {
  const GameConfig_t cfg =
      config != nullptr ? *config : gsnake_default_config();
  if (!gsnake_is_valid_config(&cfg)) {
    spdlog::warn(
        "[SnakeGame] rejected config: arena {}x{}, start ({}, {}), tick {} ms, "
        "food {} ms, max food {}",
        cfg.arena_width, cfg.arena_height, cfg.start.x, cfg.start.y,
        cfg.tick_period_ms, cfg.food_period_ms, cfg.max_food);
    return nullptr;
  }

  try {
    return new SnakeGame(cfg);
  } catch (const std::bad_alloc&) {
    spdlog::error("[SnakeGame] out of memory while creating a session");
    return nullptr;
  } catch (const std::exception& e) {
    spdlog::error("[SnakeGame] session creation failed: {}", e.what());
    return nullptr;
  }
}

void SnakeGame::destroy(void* game) noexcept {
  if (game != nullptr) {
    delete static_cast<SnakeGame*>(game);
  }
}

void SnakeGame::set_key(void* game, GameKey_t key, KeyState_t state) noexcept {
  if (game == nullptr) return;
  auto* self = static_cast<SnakeGame*>(game);
  if (!self->keys_.set(key, state)) {
    spdlog::debug("[SnakeGame] ignored key {} state {}", static_cast<int>(key),
                  static_cast<int>(state));
  }
}

/**
 * @brief Обрабатывает управляющее действие
 * @param[in] game   Сессия; nullptr игнорируется
 * @param[in] action GS_ACTION_PAUSE или GS_ACTION_RESTART
 *
 * - GS_ACTION_PAUSE переключает PLAYING ↔ PAUSED;
 * - GS_ACTION_RESTART из PLAYING или PAUSED пересоздаёт змейку, убирает еду
 *   и отпускает все клавиши; сессия сразу возвращается в PLAYING.
 *
 * @note Перезапуск не увеличивает счётчик сбросов: он считает только
 *       столкновения.
 */
void SnakeGame::handle_action(void* game, GameAction_t action) noexcept {
  if (game == nullptr) return;
  auto* self = static_cast<SnakeGame*>(game);

  switch (action) {
    case GS_ACTION_PAUSE:
      self->processEvent_(SessionEvent::PAUSE_TOGGLE);
      break;
    case GS_ACTION_RESTART:
      self->restart_requested_ = true;
      self->processEvent_(SessionEvent::RESTART);
      self->restart_requested_ = false;
      break;
    default:
      spdlog::debug("[SnakeGame] ignored action {}", static_cast<int>(action));
      break;
  }
}

/**
 * @brief Выполняет один кадр сессии
 * @param[in] game       Сессия; nullptr игнорируется
 * @param[in] elapsed_ms Время с предыдущего кадра, мс
 *
 * Кадр в состоянии PLAYING выполняет системы строго по порядку:
 * 1. ввод - выбор направления;
 * 2. движение - тик часов, сдвиг цепочки, проверка столкновений;
 * 3. конец игры - событие GAME_OVER и сброс через автомат;
 * 4. еда - только если тик сработал и сброса не было;
 * 5. рост - добавление сегментов в PendingTailPosition;
 * 6. таймер появления еды - по уже устоявшейся цепочке.
 *
 * В конце кадра отпускаются клавиши, пришедшие как GS_KEY_TAPPED.
 * В состоянии PAUSED кадр только отпускает такие клавиши.
 *
 * @note Один вызов сдвигает змейку не более чем на одну клетку.
 */
void SnakeGame::update(void* game, int elapsed_ms) noexcept {
  if (game == nullptr) return;
  auto* self = static_cast<SnakeGame*>(game);
  try {
    self->update_(elapsed_ms);
  } catch (const std::exception& e) {
    spdlog::error("[SnakeGame] frame failed: {}", e.what());
  }
}

/**
 * @brief Возвращает снимок состояния для отрисовки
 * @param[in] game Сессия; nullptr → nullptr
 * @return Указатель на внутренний GameInfo_t
 *
 * Перед возвратом пересобирает снимок: цепочку (голова первой), еду в
 * порядке появления и матрицу клеток (строка 0 - верх арены, y = H-1).
 *
 * @warning Указатель и все буферы внутри него действительны только до
 *          следующего snake_update(), snake_handle_action() или
 *          snake_destroy().
 */
const GameInfo_t* SnakeGame::get_info(const void* game) noexcept {
  if (game == nullptr) return nullptr;
  // Снимок - кэш представления, логическое состояние не меняется
  auto* self = const_cast<SnakeGame*>(static_cast<const SnakeGame*>(game));
  try {
    self->updateInfo_();
  } catch (const std::bad_alloc&) {
    spdlog::error("[SnakeGame] out of memory while building a snapshot");
    return nullptr;
  }
  return &self->info_;
}

/**
 * @private
 * @brief Конструктор - канонический старт сессии
 *
 * Создаёт змейку в стартовой клетке, готовит буферы снимка и запускает
 * автомат в состоянии PLAYING. Отдельного экрана ожидания нет: змейка
 * существует с момента создания сессии.
 *
 * @throw std::bad_alloc при нехватке памяти, std::logic_error при ошибке
 *        инициализации автомата (оба перехватываются в create()).
 */
SnakeGame::SnakeGame(const GameConfig_t& config)
    : state_(make_core_config(config)),
      food_(state_.config.arena, config.food_period_ms, config.max_food,
            config.seed) {
  field_.assign(static_cast<std::size_t>(state_.config.arena.cells()),
                GS_CELL_EMPTY);

  spawn_snake(state_);
  best_length_ = state_.chain.size();

  if (!gs_fsm_init(&fsm_, this, transitions_,
                   sizeof(transitions_) / sizeof(transitions_[0]),
                   to_fsm_state(SessionState::PLAYING))) {
    throw std::logic_error("session state machine rejected its table");
  }

  spdlog::info(
      "[SnakeGame] session created: arena {}x{}, start ({}, {}) heading {}, "
      "tick {} ms",
      state_.config.arena.width, state_.config.arena.height,
      state_.config.start.x, state_.config.start.y,
      to_string(state_.config.start_direction), state_.config.tick_period_ms);
}

SnakeGame::~SnakeGame() noexcept {
  gs_fsm_destroy(&fsm_);
  spdlog::info("[SnakeGame] session closed: {} ticks, {} resets, best length {}",
               ticks_, resets_, best_length_);
}

void SnakeGame::update_(int elapsed_ms) {
  if (getState() != SessionState::PLAYING) {
    keys_.release_taps();
    return;
  }

  handle_input(state_, keys_);

  const TickResult tick = movement(state_, elapsed_ms);
  if (tick == TickResult::MOVED) ++ticks_;

  if (state_.game_over != GAME_OVER_NONE) {
    // Сброс раньше еды: рост этого тика отбрасывается
    handleGameOver_();
  } else if (tick == TickResult::MOVED) {
    eaten_since_reset_ += detect_food(state_, food_);
    apply_growth(state_);
    best_length_ = std::max(best_length_, state_.chain.size());
  }

  food_.update(elapsed_ms, chain_positions(state_));
  keys_.release_taps();
}

void SnakeGame::processEvent_(SessionEvent ev) noexcept {
  if (ev == SessionEvent::NONE) return;
  if (gs_fsm_process_event(&fsm_, to_fsm_event(ev))) {
    // RESETTING не задерживается: сразу автоматический переход в PLAYING
    gs_fsm_update(&fsm_);
  }
}

void SnakeGame::handleGameOver_() noexcept {
  const std::optional<GridPosition> head = head_position(state_);
  spdlog::info(
      "[SnakeGame] game over ({}) at ({}, {}), length {}, eaten {}",
      describe_game_over(state_.game_over), head ? head->x : 0,
      head ? head->y : 0, state_.chain.size(), eaten_since_reset_);
  ++resets_;
  processEvent_(SessionEvent::GAME_OVER);
}

void SnakeGame::updateInfo_() {
  const std::vector<GridPosition> chain = chain_positions(state_);
  const Arena& arena = state_.config.arena;

  chain_buf_.clear();
  for (const GridPosition& p : chain) chain_buf_.push_back(to_c(p));
  food_buf_.clear();
  for (const GridPosition& p : food_.positions()) food_buf_.push_back(to_c(p));

  std::fill(field_.begin(), field_.end(), static_cast<int>(GS_CELL_EMPTY));
  auto put = [&](GridPosition p, CellValue_t value) {
    if (!arena.contains(p)) return;
    const int row = arena.height - 1 - p.y;
    field_[static_cast<std::size_t>(row * arena.width + p.x)] = value;
  };
  for (const GridPosition& p : food_.positions()) put(p, GS_CELL_FOOD);
  for (std::size_t i = chain.size(); i-- > 1;) put(chain[i], GS_CELL_BODY);
  if (!chain.empty()) put(chain.front(), GS_CELL_HEAD);

  info_.width = arena.width;
  info_.height = arena.height;
  info_.chain = chain_buf_.data();
  info_.chain_length = static_cast<int>(chain_buf_.size());
  info_.has_head = head_position(state_).has_value() ? 1 : 0;
  info_.food = food_buf_.data();
  info_.food_count = static_cast<int>(food_buf_.size());
  info_.field = field_.data();
  info_.pause = paused_ ? 1 : 0;
  info_.resets = resets_;
  info_.best_length = static_cast<int>(best_length_);
  info_.ticks = ticks_;
}

void SnakeGame::on_enter_playing_(gs_fsm_context_t ctx) {
  static_cast<SnakeGame*>(ctx)->paused_ = false;
}

void SnakeGame::on_enter_paused_(gs_fsm_context_t ctx) {
  static_cast<SnakeGame*>(ctx)->paused_ = true;
}

/**
 * @internal
 * @brief Вход в RESETTING: уничтожить змейку и создать каноническую
 *
 * Отложенный рост и PendingTailPosition отбрасываются (reset_snake()).
 * При ручном перезапуске дополнительно убирается вся еда и отпускаются
 * клавиши.
 *
 * @note Колбэк вызывается из C-кода автомата, поэтому исключения наружу не
 *       выпускаются: при нехватке памяти цепочка остаётся пустой, а сессия
 *       продолжает работать без змейки до следующего перезапуска.
 */
void SnakeGame::on_enter_resetting_(gs_fsm_context_t ctx) {
  auto* self = static_cast<SnakeGame*>(ctx);
  try {
    reset_snake(self->state_);
  } catch (const std::bad_alloc&) {
    spdlog::error("[SnakeGame] out of memory while respawning the snake");
  }
  self->eaten_since_reset_ = 0;

  if (self->restart_requested_) {
    self->food_.clear();
    self->keys_.release_all();
    spdlog::info("[SnakeGame] restarted by player");
  }
}

}  // namespace gsnake
