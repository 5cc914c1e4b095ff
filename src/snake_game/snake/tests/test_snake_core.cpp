#include <gtest/gtest.h>

#include <algorithm>
#include <ostream>
#include <utility>
#include <vector>

#include "gs_clock.hpp"
#include "gs_food.hpp"
#include "gs_input.hpp"
#include "gs_segment_pool.hpp"
#include "gs_snake_systems.hpp"

using gsnake::Arena;
using gsnake::CoreConfig;
using gsnake::Direction;
using gsnake::FoodField;
using gsnake::GridPosition;
using gsnake::KeyboardState;
using gsnake::RepeatingClock;
using gsnake::SegmentHandle;
using gsnake::SegmentPool;
using gsnake::SnakeState;
using gsnake::TickResult;

namespace gsnake {

void PrintTo(const GridPosition& p, std::ostream* os) {
  *os << "(" << p.x << ", " << p.y << ")";
}

}  // namespace gsnake

namespace {

constexpr int kTick = 150;

// Состояние с цепочкой из заданных позиций (голова первой)
void SetChain(SnakeState& state, const std::vector<GridPosition>& cells) {
  gsnake::despawn_snake(state);
  for (const GridPosition& p : cells) {
    state.chain.push_back(state.pool.create(p));
  }
}

CoreConfig StartAt(GridPosition start, Direction dir) {
  CoreConfig cfg;
  cfg.start = start;
  cfg.start_direction = dir;
  return cfg;
}

// Источник еды с произвольным списком (в т.ч. с повторами)
class ListFood : public gsnake::FoodSource {
 public:
  explicit ListFood(std::vector<GridPosition> items) : items_(std::move(items)) {}

  const std::vector<GridPosition>& positions() const noexcept override {
    return items_;
  }

  bool remove(GridPosition p) noexcept override {
    auto it = std::find(items_.begin(), items_.end(), p);
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
  }

 private:
  std::vector<GridPosition> items_;
};

}  // namespace

/* ===== Пул сегментов ===== */

TEST(SegmentPoolTest, CreateResolveDestroy) {
  SegmentPool pool;
  SegmentHandle a = pool.create({1, 2});
  SegmentHandle b = pool.create({3, 4});

  EXPECT_EQ(pool.size(), 2u);
  EXPECT_TRUE(pool.alive(a));
  EXPECT_EQ(pool.position(b), GridPosition(3, 4));

  EXPECT_TRUE(pool.set_position(a, {5, 5}));
  EXPECT_EQ(pool.position(a), GridPosition(5, 5));

  EXPECT_TRUE(pool.destroy(a));
  EXPECT_FALSE(pool.destroy(a));
  EXPECT_FALSE(pool.alive(a));
  EXPECT_EQ(pool.size(), 1u);
}

TEST(SegmentPoolTest, ReusedSlotInvalidatesStaleHandle) {
  SegmentPool pool;
  SegmentHandle old = pool.create({0, 0});
  ASSERT_TRUE(pool.destroy(old));

  SegmentHandle fresh = pool.create({7, 7});
  EXPECT_EQ(fresh.index, old.index);
  EXPECT_NE(fresh.generation, old.generation);

  EXPECT_FALSE(pool.position(old).has_value());
  EXPECT_FALSE(pool.set_position(old, {1, 1}));
  EXPECT_EQ(pool.position(fresh), GridPosition(7, 7));
}

TEST(SegmentPoolTest, UnknownIndexIsNotAlive) {
  SegmentPool pool;
  EXPECT_FALSE(pool.alive(SegmentHandle{42, 0}));
  EXPECT_FALSE(pool.position(SegmentHandle{42, 0}).has_value());
}

/* ===== Часы движения ===== */

TEST(RepeatingClockTest, FiresOnPeriodAndKeepsRemainder) {
  RepeatingClock clock(100);
  EXPECT_FALSE(clock.tick(60));
  EXPECT_TRUE(clock.tick(60));
  EXPECT_EQ(clock.accumulated_ms(), 20);
  EXPECT_FALSE(clock.tick(79));
  EXPECT_TRUE(clock.tick(1));
  EXPECT_EQ(clock.accumulated_ms(), 0);
}

TEST(RepeatingClockTest, LongFrameFiresOnce) {
  RepeatingClock clock(100);
  EXPECT_TRUE(clock.tick(1000));
  EXPECT_FALSE(clock.tick(0));
  EXPECT_EQ(clock.accumulated_ms(), 0);

  EXPECT_TRUE(clock.tick(1050));
  EXPECT_EQ(clock.accumulated_ms(), 50);
}

TEST(RepeatingClockTest, NegativeElapsedAndBadPeriod) {
  RepeatingClock clock(0);
  EXPECT_EQ(clock.period_ms(), 1);
  EXPECT_FALSE(clock.tick(-10));
  EXPECT_TRUE(clock.tick(1));

  RepeatingClock other(100);
  other.tick(70);
  other.reset();
  EXPECT_FALSE(other.tick(70));
}

/* ===== Клавиатура ===== */

TEST(KeyboardStateTest, TapIsReleasedPressIsKept) {
  KeyboardState keys;
  ASSERT_TRUE(keys.set(GS_KEY_A, GS_KEY_TAPPED));
  ASSERT_TRUE(keys.set(GS_KEY_W, GS_KEY_PRESSED));
  EXPECT_TRUE(keys.is_held(GS_KEY_A));
  EXPECT_TRUE(keys.is_held(GS_KEY_W));

  keys.release_taps();
  EXPECT_FALSE(keys.is_held(GS_KEY_A));
  EXPECT_TRUE(keys.is_held(GS_KEY_W));

  keys.release_all();
  EXPECT_FALSE(keys.is_held(GS_KEY_W));
}

TEST(KeyboardStateTest, RejectsOutOfRange) {
  KeyboardState keys;
  EXPECT_FALSE(keys.set(static_cast<GameKey_t>(GS_KEY_COUNT), GS_KEY_PRESSED));
  EXPECT_FALSE(keys.set(GS_KEY_D, static_cast<KeyState_t>(7)));
  EXPECT_FALSE(keys.is_held(static_cast<GameKey_t>(-1)));
}

/* ===== Ввод ===== */

TEST(SnakeInputTest, ArrowsHavePriorityOverLetters) {
  KeyboardState keys;
  keys.set(GS_KEY_W, GS_KEY_PRESSED);
  keys.set(GS_KEY_ARROW_RIGHT, GS_KEY_PRESSED);
  EXPECT_EQ(gsnake::read_direction(keys), Direction::RIGHT);

  keys.set(GS_KEY_ARROW_LEFT, GS_KEY_PRESSED);
  EXPECT_EQ(gsnake::read_direction(keys), Direction::LEFT);

  keys.release_all();
  EXPECT_FALSE(gsnake::read_direction(keys).has_value());
}

TEST(SnakeInputTest, ReverseIsSuppressed) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  KeyboardState keys;
  keys.set(GS_KEY_ARROW_DOWN, GS_KEY_TAPPED);
  gsnake::handle_input(state, keys);
  EXPECT_EQ(state.direction, Direction::UP);

  keys.set(GS_KEY_D, GS_KEY_TAPPED);
  keys.set(GS_KEY_ARROW_DOWN, GS_KEY_RELEASED);
  gsnake::handle_input(state, keys);
  EXPECT_EQ(state.direction, Direction::RIGHT);
}

TEST(SnakeInputTest, HigherPriorityReverseBlocksLowerKey) {
  // Первая удерживаемая клавиша - противоположная; вторая не рассматривается
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  KeyboardState keys;
  keys.set(GS_KEY_ARROW_DOWN, GS_KEY_PRESSED);
  keys.set(GS_KEY_A, GS_KEY_PRESSED);
  gsnake::handle_input(state, keys);
  EXPECT_EQ(state.direction, Direction::UP);
}

/* ===== Движение ===== */

TEST(SnakeMovementTest, SpawnIsCanonical) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  const std::vector<GridPosition> expected{{3, 3}, {3, 2}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.direction, Direction::UP);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(3, 3));
}

TEST(SnakeMovementTest, TickShiftsChainFromSnapshot) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  const std::vector<GridPosition> expected{{3, 4}, {3, 3}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.pending_tail, GridPosition(3, 2));
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_NONE);
}

TEST(SnakeMovementTest, LongChainDoesNotCascade) {
  SnakeState state{CoreConfig{}};
  SetChain(state, {{3, 3}, {3, 2}, {3, 1}, {4, 1}});

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  const std::vector<GridPosition> expected{{3, 4}, {3, 3}, {3, 2}, {3, 1}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.pending_tail, GridPosition(4, 1));
}

TEST(SnakeMovementTest, ClockGatesMovement) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  EXPECT_EQ(gsnake::movement(state, kTick - 1), TickResult::IDLE);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(3, 3));
  EXPECT_EQ(gsnake::movement(state, 1), TickResult::MOVED);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(3, 4));

  // Десять периодов за кадр - одна клетка
  EXPECT_EQ(gsnake::movement(state, kTick * 10), TickResult::MOVED);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(3, 5));
}

TEST(SnakeMovementTest, DanglingSegmentAbortsWholeTick) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);
  ASSERT_TRUE(state.pool.destroy(state.chain[1]));

  EXPECT_EQ(gsnake::movement(state, kTick), TickResult::ABORTED);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(3, 3));
  EXPECT_FALSE(state.pending_tail.has_value());
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_NONE);
}

/* ===== Столкновения ===== */

struct BoundaryCase {
  GridPosition start;
  Direction dir;
  GridPosition outside;
};

class SnakeBoundaryTest : public ::testing::TestWithParam<BoundaryCase> {};

TEST_P(SnakeBoundaryTest, LeavingArenaIsGameOver) {
  const BoundaryCase& c = GetParam();
  SnakeState state{StartAt(c.start, c.dir)};
  gsnake::spawn_snake(state);

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(gsnake::head_position(state), c.outside);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_BOUNDARY);
}

INSTANTIATE_TEST_SUITE_P(
    AllEdges, SnakeBoundaryTest,
    ::testing::Values(BoundaryCase{{0, 3}, Direction::LEFT, {-1, 3}},
                      BoundaryCase{{3, 0}, Direction::DOWN, {3, -1}},
                      BoundaryCase{{9, 3}, Direction::RIGHT, {10, 3}},
                      BoundaryCase{{3, 9}, Direction::UP, {3, 10}}));

TEST(SnakeCollisionTest, LastInsideCellIsFine) {
  SnakeState state{StartAt({1, 3}, Direction::LEFT)};
  gsnake::spawn_snake(state);

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(gsnake::head_position(state), GridPosition(0, 3));
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_NONE);
}

TEST(SnakeCollisionTest, HeadIntoBody) {
  SnakeState state{CoreConfig{}};
  SetChain(state, {{2, 2}, {2, 3}, {3, 3}, {3, 2}, {3, 1}});
  state.direction = Direction::RIGHT;

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_SELF);
}

TEST(SnakeCollisionTest, TailCellCountsAsBody) {
  SnakeState state{CoreConfig{}};
  SetChain(state, {{2, 2}, {2, 3}, {3, 3}, {3, 2}});
  state.direction = Direction::RIGHT;

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_SELF);
}

TEST(SnakeCollisionTest, ForcedReverseHitsOwnSegment) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);
  state.direction = Direction::DOWN;

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_SELF);
}

TEST(SnakeCollisionTest, BothCausesAreReported) {
  SnakeState state{StartAt({0, 3}, Direction::LEFT)};
  SetChain(state, {{0, 3}, {-1, 3}});
  state.direction = Direction::LEFT;

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(state.game_over,
            gsnake::GAME_OVER_BOUNDARY | gsnake::GAME_OVER_SELF);
  EXPECT_STREQ(gsnake::describe_game_over(state.game_over), "boundary+self");
}

/* ===== Еда и рост ===== */

TEST(SnakeGrowthTest, EatingAppendsAtPendingTail) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);
  FoodField food(state.config.arena, 1000, 0, 1);
  food.place({3, 4});

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(gsnake::detect_food(state, food), 1);
  EXPECT_EQ(food.size(), 0u);
  EXPECT_EQ(state.pending_growth, 1);

  EXPECT_EQ(gsnake::apply_growth(state), 1);
  const std::vector<GridPosition> expected{{3, 4}, {3, 3}, {3, 2}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.pending_growth, 0);
}

TEST(SnakeGrowthTest, NoFoodNoGrowth) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);
  FoodField food(state.config.arena, 1000, 0, 1);
  food.place({5, 5});

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(gsnake::detect_food(state, food), 0);
  EXPECT_EQ(gsnake::apply_growth(state), 0);
  EXPECT_EQ(state.chain.size(), 2u);
  EXPECT_EQ(food.size(), 1u);
}

TEST(SnakeGrowthTest, SimultaneousHitsGrowOncePerItem) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);
  ListFood food({{3, 4}, {0, 0}, {3, 4}});

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  EXPECT_EQ(gsnake::detect_food(state, food), 2);
  EXPECT_EQ(food.positions().size(), 1u);

  EXPECT_EQ(gsnake::apply_growth(state), 2);
  const std::vector<GridPosition> expected{{3, 4}, {3, 3}, {3, 2}, {3, 2}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
}

TEST(SnakeGrowthTest, GrownSegmentFollowsOnNextTick) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  state.pending_growth = 1;
  ASSERT_EQ(gsnake::apply_growth(state), 1);

  ASSERT_EQ(gsnake::movement(state, kTick), TickResult::MOVED);
  const std::vector<GridPosition> expected{{3, 5}, {3, 4}, {3, 3}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_NONE);
}

/* ===== Сброс ===== */

TEST(SnakeResetTest, ResetRestoresCanonicalStart) {
  SnakeState state{CoreConfig{}};
  SetChain(state, {{7, 7}, {7, 6}, {7, 5}});
  state.direction = Direction::LEFT;
  state.pending_tail = GridPosition{7, 4};
  state.pending_growth = 3;
  state.game_over = gsnake::GAME_OVER_SELF;

  gsnake::reset_snake(state);

  const std::vector<GridPosition> expected{{3, 3}, {3, 2}};
  EXPECT_EQ(gsnake::chain_positions(state), expected);
  EXPECT_EQ(state.direction, Direction::UP);
  EXPECT_FALSE(state.pending_tail.has_value());
  EXPECT_EQ(state.pending_growth, 0);
  EXPECT_EQ(state.game_over, gsnake::GAME_OVER_NONE);
  EXPECT_EQ(state.pool.size(), 2u);
}

TEST(SnakeResetTest, ResetIsIdempotent) {
  SnakeState state{CoreConfig{}};
  gsnake::spawn_snake(state);

  gsnake::reset_snake(state);
  const std::vector<GridPosition> once = gsnake::chain_positions(state);
  gsnake::reset_snake(state);

  EXPECT_EQ(gsnake::chain_positions(state), once);
  EXPECT_EQ(state.pool.size(), 2u);
}

/* ===== Поле еды ===== */

TEST(FoodFieldTest, SpawnsOnPeriodIntoFreeCell) {
  const Arena arena{5, 5};
  std::vector<GridPosition> occupied;
  for (int y = 0; y < 5; ++y) {
    for (int x = 0; x < 5; ++x) {
      if (x != 4 || y != 4) occupied.emplace_back(x, y);
    }
  }

  FoodField food(arena, 1000, 0, 3);
  EXPECT_FALSE(food.update(999, occupied));
  EXPECT_TRUE(food.update(1, occupied));
  ASSERT_EQ(food.size(), 1u);
  EXPECT_EQ(food.positions().front(), GridPosition(4, 4));
}

TEST(FoodFieldTest, FullArenaSkipsSpawn) {
  const Arena arena{5, 5};
  std::vector<GridPosition> occupied;
  for (int y = 0; y < 5; ++y) {
    for (int x = 0; x < 4; ++x) occupied.emplace_back(x, y);
  }

  FoodField food(arena, 10, 0, 3);
  for (int i = 0; i < 5; ++i) EXPECT_TRUE(food.update(10, occupied));
  EXPECT_EQ(food.size(), 5u);
  EXPECT_FALSE(food.update(10, occupied));
  EXPECT_EQ(food.size(), 5u);
}

TEST(FoodFieldTest, SameSeedSameSequence) {
  const Arena arena{10, 10};
  const std::vector<GridPosition> occupied{{3, 3}, {3, 2}};
  FoodField a(arena, 100, 0, 42);
  FoodField b(arena, 100, 0, 42);
  for (int i = 0; i < 6; ++i) {
    a.update(100, occupied);
    b.update(100, occupied);
  }
  ASSERT_EQ(a.size(), 6u);
  EXPECT_EQ(a.positions(), b.positions());
  for (const GridPosition& p : a.positions()) {
    EXPECT_TRUE(arena.contains(p));
    EXPECT_EQ(std::count(occupied.begin(), occupied.end(), p), 0);
    EXPECT_EQ(std::count(a.positions().begin(), a.positions().end(), p), 1);
  }
}

TEST(FoodFieldTest, LimitStopsSpawning) {
  FoodField food(Arena{10, 10}, 100, 2, 5);
  food.update(100, {});
  food.update(100, {});
  EXPECT_FALSE(food.update(100, {}));
  EXPECT_EQ(food.size(), 2u);

  food.remove(food.positions().front());
  EXPECT_TRUE(food.update(100, {}));
}

TEST(FoodFieldTest, RemoveAndClear) {
  FoodField food(Arena{10, 10}, 1000, 0, 5);
  food.place({1, 1});
  food.place({2, 2});
  EXPECT_TRUE(food.remove({1, 1}));
  EXPECT_FALSE(food.remove({1, 1}));
  EXPECT_EQ(food.positions().front(), GridPosition(2, 2));

  food.update(600, {});
  food.clear();
  EXPECT_EQ(food.size(), 0u);
  EXPECT_FALSE(food.update(600, {}));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
