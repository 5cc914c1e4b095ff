/**
 * @file gs_snake_systems.cpp
 * @brief Реализация систем ядра змейки: ввод, движение, столкновения, рост,
 * сброс
 */

#include "gs_snake_systems.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <utility>

namespace gsnake {

namespace {

// Приоритет опроса клавиш: первая удерживаемая определяет направление
constexpr std::array<std::pair<GameKey_t, Direction>, GS_KEY_COUNT> kKeyMap{{
    {GS_KEY_ARROW_LEFT, Direction::LEFT},
    {GS_KEY_ARROW_RIGHT, Direction::RIGHT},
    {GS_KEY_ARROW_DOWN, Direction::DOWN},
    {GS_KEY_ARROW_UP, Direction::UP},
    {GS_KEY_A, Direction::LEFT},
    {GS_KEY_D, Direction::RIGHT},
    {GS_KEY_S, Direction::DOWN},
    {GS_KEY_W, Direction::UP},
}};

}  // namespace

const char* to_string(Direction d) noexcept {
  switch (d) {
    case Direction::LEFT:
      return "left";
    case Direction::UP:
      return "up";
    case Direction::RIGHT:
      return "right";
    case Direction::DOWN:
      return "down";
  }
  return "?";
}

const char* describe_game_over(unsigned causes) noexcept {
  const bool boundary = (causes & GAME_OVER_BOUNDARY) != 0;
  const bool self = (causes & GAME_OVER_SELF) != 0;
  if (boundary && self) return "boundary+self";
  if (boundary) return "boundary";
  if (self) return "self";
  return "none";
}

SnakeState::SnakeState(const CoreConfig& cfg)
    : config(cfg),
      direction(cfg.start_direction),
      movement_clock(cfg.tick_period_ms) {}

void spawn_snake(SnakeState& state) {
  const GridPosition head = state.config.start;
  const GridPosition tail = step(head, opposite(state.config.start_direction));

  state.chain.reserve(2);
  state.chain.push_back(state.pool.create(head));
  state.chain.push_back(state.pool.create(tail));
  state.direction = state.config.start_direction;
}

void despawn_snake(SnakeState& state) noexcept {
  for (const SegmentHandle& h : state.chain) {
    state.pool.destroy(h);
  }
  state.chain.clear();
}

void reset_snake(SnakeState& state) {
  despawn_snake(state);
  state.pending_tail.reset();
  state.pending_growth = 0;
  state.game_over = GAME_OVER_NONE;
  spawn_snake(state);
}

std::optional<Direction> read_direction(const InputSource& input) noexcept {
  for (const auto& [key, dir] : kKeyMap) {
    if (input.is_held(key)) return dir;
  }
  return std::nullopt;
}

void handle_input(SnakeState& state, const InputSource& input) noexcept {
  if (state.chain.empty()) return;

  const std::optional<Direction> candidate = read_direction(input);
  if (candidate && *candidate != opposite(state.direction)) {
    state.direction = *candidate;
  }
}

TickResult movement(SnakeState& state, int elapsed_ms) {
  if (!state.movement_clock.tick(elapsed_ms)) return TickResult::IDLE;
  if (state.chain.empty()) return TickResult::IDLE;

  // Снимок до любых изменений
  std::vector<GridPosition> snapshot;
  snapshot.reserve(state.chain.size());
  for (const SegmentHandle& h : state.chain) {
    if (auto p = state.pool.position(h)) snapshot.push_back(*p);
  }
  if (snapshot.size() != state.chain.size()) {
    spdlog::error(
        "[SnakeCore] chain inconsistency: {} of {} segments resolvable, tick "
        "aborted",
        snapshot.size(), state.chain.size());
    return TickResult::ABORTED;
  }

  const GridPosition head = step(snapshot.front(), state.direction);

  if (!state.config.arena.contains(head)) {
    state.game_over |= GAME_OVER_BOUNDARY;
  }
  if (std::find(snapshot.begin(), snapshot.end(), head) != snapshot.end()) {
    state.game_over |= GAME_OVER_SELF;
  }

  state.pool.set_position(state.chain.front(), head);
  for (std::size_t i = 1; i < state.chain.size(); ++i) {
    state.pool.set_position(state.chain[i], snapshot[i - 1]);
  }
  state.pending_tail = snapshot.back();

  return TickResult::MOVED;
}

int detect_food(SnakeState& state, FoodSource& food) {
  const std::optional<GridPosition> head = head_position(state);
  if (!head) return 0;

  // Копия: remove() изменяет список источника
  const std::vector<GridPosition> items = food.positions();
  int eaten = 0;
  for (const GridPosition& p : items) {
    if (p == *head && food.remove(p)) {
      ++state.pending_growth;
      ++eaten;
    }
  }
  return eaten;
}

int apply_growth(SnakeState& state) {
  int grown = 0;
  if (state.pending_tail) {
    for (; grown < state.pending_growth; ++grown) {
      state.chain.push_back(state.pool.create(*state.pending_tail));
    }
    if (grown > 0) {
      spdlog::debug("[SnakeCore] grew by {} at ({}, {}), length {}", grown,
                    state.pending_tail->x, state.pending_tail->y,
                    state.chain.size());
    }
  }
  state.pending_growth = 0;
  return grown;
}

std::vector<GridPosition> chain_positions(const SnakeState& state) {
  std::vector<GridPosition> out;
  out.reserve(state.chain.size());
  for (const SegmentHandle& h : state.chain) {
    if (auto p = state.pool.position(h)) out.push_back(*p);
  }
  return out;
}

std::optional<GridPosition> head_position(const SnakeState& state) noexcept {
  if (state.chain.empty()) return std::nullopt;
  return state.pool.position(state.chain.front());
}

}  // namespace gsnake
