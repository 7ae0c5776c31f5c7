// Repository: Sanchez
// Component: Contract Test Base
// Purpose: Fixture base that records which contract rules a test domain covers.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TESTS_BASE_CONTRACT_TEST_H_
#define SANCHEZ_TESTS_BASE_CONTRACT_TEST_H_

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace sanchez::tests {

// ContractRegistry maps each domain to the rule ids it is expected to cover
// and the rule ids its fixtures actually exercised.
class ContractRegistry {
 public:
  static ContractRegistry& Instance() {
    static ContractRegistry registry;
    return registry;
  }

  void RegisterExpected(const std::string& domain, const std::vector<std::string>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    expected_[domain].insert(rules.begin(), rules.end());
  }

  void RegisterCovered(const std::string& domain, const std::vector<std::string>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    covered_[domain].insert(rules.begin(), rules.end());
  }

  // Expected rules of domains that ran at least one test but never claimed them.
  std::map<std::string, std::vector<std::string>> MissingRules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<std::string>> missing;
    for (const auto& [domain, rules] : expected_) {
      auto covered = covered_.find(domain);
      if (covered == covered_.end()) {
        continue;
      }
      for (const auto& rule : rules) {
        if (covered->second.count(rule) == 0) {
          missing[domain].push_back(rule);
        }
      }
    }
    return missing;
  }

 private:
  ContractRegistry() = default;

  mutable std::mutex mutex_;
  std::map<std::string, std::set<std::string>> expected_;
  std::map<std::string, std::set<std::string>> covered_;
};

// BaseContractTest registers the fixture's rule ids on SetUp.
class BaseContractTest : public ::testing::Test {
 protected:
  [[nodiscard]] virtual std::string DomainName() const = 0;
  [[nodiscard]] virtual std::vector<std::string> CoveredRuleIds() const = 0;

  void SetUp() override {
    ContractRegistry::Instance().RegisterCovered(DomainName(), CoveredRuleIds());
  }
};

}  // namespace sanchez::tests

#endif  // SANCHEZ_TESTS_BASE_CONTRACT_TEST_H_
