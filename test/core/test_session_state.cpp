#include <gtest/gtest.h>

#include "core/session_state.hpp"

using S = SessionState;

TEST(SessionStateMachine, LoadPath) {
  EXPECT_TRUE(IsTransitionAllowed(S::uninitialized, S::initializing));
  EXPECT_TRUE(IsTransitionAllowed(S::initializing, S::ready));
  EXPECT_TRUE(IsTransitionAllowed(S::initializing, S::uninitialized));
  EXPECT_FALSE(IsTransitionAllowed(S::uninitialized, S::ready));
  EXPECT_FALSE(IsTransitionAllowed(S::ready, S::initializing));
}

TEST(SessionStateMachine, RunPath) {
  EXPECT_TRUE(IsTransitionAllowed(S::ready, S::executing));
  EXPECT_TRUE(IsTransitionAllowed(S::executing, S::ready));
  EXPECT_FALSE(IsTransitionAllowed(S::executing, S::executing));
  EXPECT_FALSE(IsTransitionAllowed(S::uninitialized, S::executing));
  EXPECT_FALSE(IsTransitionAllowed(S::initializing, S::executing));
}

TEST(SessionStateMachine, TerminatedIsAbsorbing) {
  for (S to : {S::uninitialized, S::initializing, S::ready, S::executing,
               S::terminated}) {
    EXPECT_FALSE(IsTransitionAllowed(S::terminated, to)) << ToString(to);
  }
  for (S from : {S::uninitialized, S::initializing, S::ready, S::executing}) {
    EXPECT_TRUE(IsTransitionAllowed(from, S::terminated)) << ToString(from);
  }
}

TEST(SessionStateMachine, TransitionErrorNamesBothStates) {
  TransitionError e{S::terminated, S::executing};
  EXPECT_EQ(e.Message(), "invalid session transition terminated -> executing");
}
