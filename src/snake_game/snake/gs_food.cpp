/**
 * @file gs_food.cpp
 * @brief Реализация поля еды
 */

#include "gs_food.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gsnake {

namespace {

unsigned make_seed(unsigned seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return rd();
}

}  // namespace

FoodField::FoodField(Arena arena, int spawn_period_ms, int max_food,
                     unsigned seed)
    : arena_(arena),
      max_food_(max_food),
      spawn_clock_(spawn_period_ms),
      gen_(make_seed(seed)) {}

bool FoodField::remove(GridPosition p) noexcept {
  auto it = std::find(food_.begin(), food_.end(), p);
  if (it == food_.end()) return false;
  food_.erase(it);
  return true;
}

bool FoodField::update(int elapsed_ms,
                       const std::vector<GridPosition>& occupied) {
  if (!spawn_clock_.tick(elapsed_ms)) return false;
  return spawn_(occupied);
}

void FoodField::place(GridPosition p) { food_.push_back(p); }

void FoodField::clear() noexcept {
  food_.clear();
  spawn_clock_.reset();
}

bool FoodField::spawn_(const std::vector<GridPosition>& occupied) {
  if (max_food_ > 0 && food_.size() >= static_cast<std::size_t>(max_food_)) {
    return false;
  }

  // Занятость по индексу y * width + x, только клетки внутри арены
  std::vector<bool> taken(static_cast<std::size_t>(arena_.cells()), false);
  auto mark = [&](GridPosition p) {
    if (arena_.contains(p)) {
      taken[static_cast<std::size_t>(p.y * arena_.width + p.x)] = true;
    }
  };
  std::for_each(occupied.begin(), occupied.end(), mark);
  std::for_each(food_.begin(), food_.end(), mark);

  std::vector<GridPosition> free_cells;
  free_cells.reserve(taken.size());
  for (int y = 0; y < arena_.height; ++y) {
    for (int x = 0; x < arena_.width; ++x) {
      if (!taken[static_cast<std::size_t>(y * arena_.width + x)]) {
        free_cells.emplace_back(x, y);
      }
    }
  }

  if (free_cells.empty()) {
    spdlog::debug("[FoodField] no free cell, spawn skipped");
    return false;
  }

  std::uniform_int_distribution<std::size_t> dist(0, free_cells.size() - 1);
  const GridPosition p = free_cells[dist(gen_)];
  food_.push_back(p);
  spdlog::debug("[FoodField] food spawned at ({}, {})", p.x, p.y);
  return true;
}

}  // namespace gsnake
