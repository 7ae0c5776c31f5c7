#include <gtest/gtest.h>

#include "BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"
#include "sanchez/stream/SessionStateMachine.h"

namespace sanchez::tests::contracts {

using sanchez::tests::RegisterExpectedDomainCoverage;
using sanchez::stream::SessionStateMachine;
using State = SessionStateMachine::State;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("SessionStateMachine",
                                 {"SM-001", "SM-002", "SM-003", "SM-004", "SM-005"});
  return true;
}();

class SessionStateMachineContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "SessionStateMachine"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"SM-001", "SM-002", "SM-003", "SM-004", "SM-005"};
  }
};

TEST_F(SessionStateMachineContractTest, SM_001_MetadataThenConfigStartsStreaming) {
  SessionStateMachine machine;
  EXPECT_EQ(machine.state(), State::kAwaitingMetadata);
  EXPECT_FALSE(machine.synchronized());

  EXPECT_TRUE(machine.OnMetadata());
  EXPECT_EQ(machine.state(), State::kAwaitingConfig);
  EXPECT_TRUE(machine.OnConfig());
  EXPECT_EQ(machine.state(), State::kStreaming);
  EXPECT_TRUE(machine.synchronized());

  EXPECT_TRUE(machine.OnEnd());
  EXPECT_EQ(machine.state(), State::kEnded);
  EXPECT_TRUE(machine.terminal());

  const auto snapshot = machine.Snapshot();
  EXPECT_EQ(snapshot.transitions.at({State::kAwaitingMetadata, State::kAwaitingConfig}), 1u);
  EXPECT_EQ(snapshot.transitions.at({State::kAwaitingConfig, State::kStreaming}), 1u);
  EXPECT_EQ(snapshot.transitions.at({State::kStreaming, State::kEnded}), 1u);
  EXPECT_EQ(snapshot.illegal_transition_total, 0u);
}

TEST_F(SessionStateMachineContractTest, SM_002_ReannouncementsKeepStreaming) {
  SessionStateMachine machine;
  machine.OnMetadata();
  machine.OnConfig();
  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(machine.OnMetadata());
    EXPECT_TRUE(machine.OnConfig());
  }
  EXPECT_EQ(machine.state(), State::kStreaming);
  EXPECT_EQ(machine.Snapshot().reannounce_total, 6u);
}

TEST_F(SessionStateMachineContractTest, SM_003_ConfigBeforeMetadataIsIllegal) {
  SessionStateMachine machine;
  EXPECT_FALSE(machine.OnConfig());
  EXPECT_EQ(machine.state(), State::kAwaitingMetadata);

  const auto snapshot = machine.Snapshot();
  EXPECT_EQ(snapshot.illegal_transition_total, 1u);
  EXPECT_EQ(snapshot.illegal_transitions.at({State::kAwaitingMetadata, State::kStreaming}), 1u);
}

TEST_F(SessionStateMachineContractTest, SM_004_TerminalStatesAbsorb) {
  SessionStateMachine machine;
  machine.OnMetadata();
  machine.OnConfig();
  ASSERT_TRUE(machine.OnDisconnect());

  EXPECT_FALSE(machine.OnEnd());
  EXPECT_FALSE(machine.OnMetadata());
  EXPECT_FALSE(machine.OnConfig());
  EXPECT_FALSE(machine.OnDisconnect());
  EXPECT_EQ(machine.state(), State::kDisconnected);
  EXPECT_EQ(machine.Snapshot().illegal_transition_total, 4u);
}

TEST_F(SessionStateMachineContractTest, SM_005_DisconnectIsReachableFromEverySyncState) {
  {
    SessionStateMachine machine;
    EXPECT_TRUE(machine.OnDisconnect());
    EXPECT_EQ(machine.state(), State::kDisconnected);
  }
  {
    SessionStateMachine machine;
    machine.OnMetadata();
    EXPECT_TRUE(machine.OnDisconnect());
    EXPECT_EQ(machine.state(), State::kDisconnected);
  }
  {
    SessionStateMachine machine;
    machine.OnMetadata();
    EXPECT_TRUE(machine.OnEnd());
    EXPECT_EQ(machine.state(), State::kEnded);
  }
  EXPECT_STREQ(stream::SessionStateToString(State::kAwaitingConfig), "awaiting_config");
}

}  // namespace sanchez::tests::contracts
