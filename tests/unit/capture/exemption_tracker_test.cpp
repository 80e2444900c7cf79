#include <cassert>
#include <iostream>

#include "internal/capture/exemption_tracker.hpp"

namespace {

using vigil::capture::ExemptionPolicy;
using vigil::capture::ExemptionReason;
using vigil::capture::ExemptionTracker;

constexpr const char* kPlayer = "8f14e45f-ceea-467a-9af0-0000000000aa";

void TestJoinGraceWindow() {
  ExemptionTracker tracker;
  tracker.OnConnect(kPlayer, "Steve", 10'000);

  assert(tracker.IsExempt(kPlayer, 10'000));
  assert(tracker.IsExempt(kPlayer, 12'499));
  assert(!tracker.IsExempt(kPlayer, 12'500));

  auto reasons = tracker.ActiveReasons(kPlayer, 11'000);
  assert(reasons.size() == 1);
  assert(reasons[0] == ExemptionReason::kJustJoined);
}

void TestTransferGraceWindow() {
  ExemptionTracker tracker;
  tracker.OnConnect(kPlayer, "Steve", 0);
  tracker.OnTransfer(kPlayer, 100'000);

  assert(tracker.IsExempt(kPlayer, 100'499));
  assert(!tracker.IsExempt(kPlayer, 100'500));
  assert(tracker.ActiveReasons(kPlayer, 100'000)[0] == ExemptionReason::kWorldChange);
}

void TestUnknownEntityIsNotExempt() {
  ExemptionTracker tracker;
  assert(!tracker.IsExempt(kPlayer, 1));
  assert(tracker.ActiveReasons(kPlayer, 1).empty());
  assert(tracker.TrackedEntities() == 0);
}

void TestClientCategoryByPrefix() {
  ExemptionTracker tracker;

  // id prefix applies even before a connect event
  assert(tracker.IsExempt("00000000-0000-0000-0009-01f2d4c6a8b1", 5));

  tracker.OnConnect("1b2c3d4e-0000-0000-0000-000000000001", ".BedrockSteve", 0);
  assert(tracker.IsExempt("1b2c3d4e-0000-0000-0000-000000000001", 1'000'000));
  auto reasons = tracker.ActiveReasons("1b2c3d4e-0000-0000-0000-000000000001", 1'000'000);
  assert(reasons.size() == 1);
  assert(reasons[0] == ExemptionReason::kBedrockClient);

  ExemptionPolicy policy;
  policy.client_category_exempt = false;
  tracker.UpdatePolicy(policy);
  assert(!tracker.IsExempt("00000000-0000-0000-0009-01f2d4c6a8b1", 5));
}

void TestTimedExemptionExtendsNeverShortens() {
  ExemptionTracker tracker;
  tracker.Exempt(kPlayer, ExemptionReason::kTeleport, 3'000, 1'000);
  tracker.Exempt(kPlayer, ExemptionReason::kTeleport, 500, 1'500);
  assert(tracker.IsExempt(kPlayer, 3'999));
  assert(!tracker.IsExempt(kPlayer, 4'000));

  tracker.Exempt(kPlayer, ExemptionReason::kVelocity, 0, 5'000);
  assert(!tracker.IsExempt(kPlayer, 5'000));

  tracker.Exempt(kPlayer, ExemptionReason::kVelocity, 1'000, 5'000);
  tracker.Exempt(kPlayer, ExemptionReason::kFlying, 2'000, 5'000);
  auto reasons = tracker.ActiveReasons(kPlayer, 5'500);
  assert(reasons.size() == 2);
}

void TestDisconnectClearsState() {
  ExemptionTracker tracker;
  tracker.OnConnect(kPlayer, "Steve", 0);
  tracker.Exempt(kPlayer, ExemptionReason::kDead, 60'000, 0);
  assert(tracker.TrackedEntities() == 1);

  tracker.OnDisconnect(kPlayer);
  assert(tracker.TrackedEntities() == 0);
  assert(!tracker.IsExempt(kPlayer, 10));
}

void TestSweepEvictsIdleEntities() {
  ExemptionPolicy policy;
  policy.entity_ttl_ms = 60'000;
  ExemptionTracker tracker(policy);

  tracker.OnConnect("idle", "Idle", 0);
  tracker.OnConnect("busy", "Busy", 0);
  tracker.Exempt("busy", ExemptionReason::kSleeping, 120'000, 0);

  assert(tracker.Sweep(30'000) == 0);
  assert(tracker.Sweep(60'000) == 1);
  assert(tracker.TrackedEntities() == 1);
  assert(tracker.IsExempt("busy", 60'000));
}

void TestSweepKeepsClientCategoryUntilDisconnect() {
  ExemptionTracker tracker;
  const char*      bedrock = "1a2b3c4d-0000-0000-0000-000000000002";

  tracker.OnConnect(bedrock, ".BedrockSteve", 0);
  tracker.OnConnect(kPlayer, "Steve", 0);
  assert(tracker.IsExempt(bedrock, 60'000));

  // both idle past the entity ttl; only the plain entity goes
  const int64_t later = 11 * 60 * 1000;
  assert(tracker.Sweep(later) == 1);
  assert(tracker.IsExempt(bedrock, later));
  assert(tracker.ActiveReasons(bedrock, later)[0] == ExemptionReason::kBedrockClient);

  tracker.OnDisconnect(bedrock);
  assert(!tracker.IsExempt(bedrock, later));
}

void TestReasonNames() {
  assert(vigil::capture::ToString(ExemptionReason::kSlowFalling) == "slow_falling");
  assert(vigil::capture::ParseExemptionReason(" Teleport ") == ExemptionReason::kTeleport);
  assert(!vigil::capture::ParseExemptionReason("lagging").has_value());
}

void TestPolicyFromConfig() {
  vigil::runtime::config::ExemptionConfig config;
  config.set_join_grace_ms(5'000);
  config.set_client_category_exempt(false);
  config.add_exempt_name_prefixes("*");

  auto policy = ExemptionPolicy::FromConfig(config);
  assert(policy.join_grace_ms == 5'000);
  assert(policy.transfer_grace_ms == 500);
  assert(!policy.client_category_exempt);
  assert(policy.exempt_name_prefixes.size() == 1);
  assert(policy.MatchesClientCategory("abc", std::string_view("*pocket")));
  assert(!policy.MatchesClientCategory("abc", std::string_view(".java")));
}

} // namespace

int main() {
  TestJoinGraceWindow();
  TestTransferGraceWindow();
  TestUnknownEntityIsNotExempt();
  TestClientCategoryByPrefix();
  TestTimedExemptionExtendsNeverShortens();
  TestDisconnectClearsState();
  TestSweepEvictsIdleEntities();
  TestSweepKeepsClientCategoryUntilDisconnect();
  TestReasonNames();
  TestPolicyFromConfig();
  std::cout << "vigil_exemption_tracker_test: pass\n";
  return 0;
}
