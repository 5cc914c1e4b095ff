#include <gtest/gtest.h>

#include <string>

extern "C" {
#include "gs_fsm.h"
}

namespace {

enum { ST_A = 1, ST_B, ST_C };
enum { EV_GO = 1, EV_BACK };

struct Trace {
  std::string log;
  gs_fsm_t* fsm = nullptr;
  bool nested_result = true;
};

void exit_a(gs_fsm_context_t ctx) { static_cast<Trace*>(ctx)->log += "xA;"; }
void enter_b(gs_fsm_context_t ctx) { static_cast<Trace*>(ctx)->log += "eB;"; }
void enter_c(gs_fsm_context_t ctx) { static_cast<Trace*>(ctx)->log += "eC;"; }
void enter_a(gs_fsm_context_t ctx) { static_cast<Trace*>(ctx)->log += "eA;"; }

void enter_b_nested(gs_fsm_context_t ctx) {
  auto* t = static_cast<Trace*>(ctx);
  t->nested_result = gs_fsm_process_event(t->fsm, EV_GO);
}

const gs_fsm_transition_t kTable[] = {
    {ST_A, EV_GO, ST_B, exit_a, enter_b},
    {ST_A, EV_GO, ST_C, nullptr, enter_c},  // затенено первым правилом
    {ST_B, GS_FSM_EVENT_NONE, ST_C, nullptr, enter_c},
    {ST_C, EV_BACK, ST_A, nullptr, enter_a},
};

constexpr size_t kTableSize = sizeof(kTable) / sizeof(kTable[0]);

}  // namespace

TEST(FsmTest, InitRejectsBadArguments) {
  gs_fsm_t fsm;
  EXPECT_FALSE(gs_fsm_init(nullptr, nullptr, kTable, kTableSize, ST_A));
  EXPECT_FALSE(gs_fsm_init(&fsm, nullptr, nullptr, kTableSize, ST_A));
  EXPECT_FALSE(gs_fsm_init(&fsm, nullptr, kTable, 0, ST_A));
  EXPECT_EQ(gs_fsm_current(nullptr), -1);
}

TEST(FsmTest, FirstMatchingRuleWinsWithCallbackOrder) {
  Trace trace;
  gs_fsm_t fsm;
  ASSERT_TRUE(gs_fsm_init(&fsm, &trace, kTable, kTableSize, ST_A));
  EXPECT_EQ(gs_fsm_current(&fsm), ST_A) << "on_enter стартового состояния не вызывается";
  EXPECT_TRUE(trace.log.empty());

  EXPECT_TRUE(gs_fsm_process_event(&fsm, EV_GO));
  EXPECT_EQ(gs_fsm_current(&fsm), ST_B);
  EXPECT_EQ(trace.log, "xA;eB;");
}

TEST(FsmTest, UnknownEventKeepsState) {
  gs_fsm_t fsm;
  ASSERT_TRUE(gs_fsm_init(&fsm, nullptr, kTable, kTableSize, ST_A));
  EXPECT_FALSE(gs_fsm_process_event(&fsm, EV_BACK));
  EXPECT_EQ(gs_fsm_current(&fsm), ST_A);
  EXPECT_FALSE(gs_fsm_process_event(&fsm, GS_FSM_EVENT_NONE))
      << "автоматические переходы только через gs_fsm_update";
}

TEST(FsmTest, UpdateTakesAutomaticTransitionOnly) {
  Trace trace;
  gs_fsm_t fsm;
  ASSERT_TRUE(gs_fsm_init(&fsm, &trace, kTable, kTableSize, ST_A));
  EXPECT_FALSE(gs_fsm_update(&fsm)) << "из A нет автоматического перехода";

  ASSERT_TRUE(gs_fsm_process_event(&fsm, EV_GO));
  EXPECT_TRUE(gs_fsm_update(&fsm));
  EXPECT_EQ(gs_fsm_current(&fsm), ST_C);

  EXPECT_TRUE(gs_fsm_process_event(&fsm, EV_BACK));
  EXPECT_EQ(gs_fsm_current(&fsm), ST_A);
  EXPECT_EQ(trace.log, "xA;eB;eC;eA;");
}

TEST(FsmTest, NestedProcessingIsRejected) {
  const gs_fsm_transition_t table[] = {
      {ST_A, EV_GO, ST_B, nullptr, enter_b_nested},
      {ST_B, EV_GO, ST_C, nullptr, nullptr},
  };
  Trace trace;
  gs_fsm_t fsm;
  trace.fsm = &fsm;
  ASSERT_TRUE(gs_fsm_init(&fsm, &trace, table, 2, ST_A));

  EXPECT_TRUE(gs_fsm_process_event(&fsm, EV_GO));
  EXPECT_FALSE(trace.nested_result);
  EXPECT_EQ(gs_fsm_current(&fsm), ST_B);
}

TEST(FsmTest, DestroyDetachesTable) {
  gs_fsm_t fsm;
  ASSERT_TRUE(gs_fsm_init(&fsm, nullptr, kTable, kTableSize, ST_A));
  gs_fsm_destroy(&fsm);
  EXPECT_FALSE(gs_fsm_process_event(&fsm, EV_GO));
  gs_fsm_destroy(nullptr);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
