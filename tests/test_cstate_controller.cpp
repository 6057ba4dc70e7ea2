#include "minitest.hpp"
#include "fixtures.hpp"
#include "control/CstateController.hpp"

using idlectl::control::CstateController;
using idlectl::control::ControlError;

static void expect_policy(const idlectl::control::MemoryControlFs& fs, unsigned ncpus, unsigned nstates, int t) {
  for (unsigned c = 0; c < ncpus; ++c)
    for (unsigned s = 0; s < nstates; ++s)
      ASSERT_EQ(fixtures::disabled(fs, c, s), static_cast<int>(s) > t);
}

TEST(cstate_apply_enforces_threshold_everywhere) {
  auto fs = fixtures::make_host(4, 6);
  CstateController ctl(fs);
  auto rep = ctl.apply(2);
  ASSERT_TRUE(rep.ok());
  ASSERT_EQ(rep.cpus, 4u);
  ASSERT_EQ(rep.applied.size(), 24u);
  expect_policy(fs, 4, 6, 2);
  for (const auto& r : rep.applied) ASSERT_EQ(r.enabled, r.state <= 2u);
}

TEST(cstate_apply_ignores_prior_state) {
  // start fully disabled: shallow states must be re-enabled
  auto fs = fixtures::make_host(2, 4, "1\n");
  CstateController ctl(fs);
  ASSERT_TRUE(ctl.apply(1).ok());
  expect_policy(fs, 2, 4, 1);
}

TEST(cstate_apply_is_idempotent) {
  auto once = fixtures::make_host(3, 5);
  auto twice = fixtures::make_host(3, 5);
  CstateController a(once), b(twice);
  ASSERT_TRUE(a.apply(3).ok());
  ASSERT_TRUE(b.apply(3).ok());
  ASSERT_TRUE(b.apply(3).ok());
  for (unsigned c = 0; c < 3; ++c)
    for (unsigned s = 0; s < 5; ++s)
      ASSERT_EQ(fixtures::disabled(once, c, s), fixtures::disabled(twice, c, s));
}

TEST(cstate_lower_threshold_disables_superset) {
  for (int t1 = -1; t1 < 6; ++t1) {
    for (int t2 = t1 + 1; t2 < 7; ++t2) {
      auto f1 = fixtures::make_host(2, 6);
      auto f2 = fixtures::make_host(2, 6);
      CstateController c1(f1), c2(f2);
      ASSERT_TRUE(c1.apply(t1).ok());
      ASSERT_TRUE(c2.apply(t2).ok());
      for (unsigned c = 0; c < 2; ++c)
        for (unsigned s = 0; s < 6; ++s)
          if (fixtures::disabled(f2, c, s)) ASSERT_TRUE(fixtures::disabled(f1, c, s));
    }
  }
}

TEST(cstate_threshold_zero_leaves_only_state0) {
  auto fs = fixtures::make_host(2, 4);
  CstateController ctl(fs);
  ASSERT_TRUE(ctl.apply(0).ok());
  for (unsigned c = 0; c < 2; ++c) {
    ASSERT_FALSE(fixtures::disabled(fs, c, 0));
    for (unsigned s = 1; s < 4; ++s) ASSERT_TRUE(fixtures::disabled(fs, c, s));
  }
}

TEST(cstate_threshold_at_or_above_max_enables_all) {
  for (int t : {3, 9, 1000}) {
    auto fs = fixtures::make_host(2, 4, "1\n");
    CstateController ctl(fs);
    ASSERT_TRUE(ctl.apply(t).ok());
    for (unsigned c = 0; c < 2; ++c)
      for (unsigned s = 0; s < 4; ++s) ASSERT_FALSE(fixtures::disabled(fs, c, s));
  }
}

TEST(cstate_negative_threshold_disables_all) {
  auto fs = fixtures::make_host(2, 3);
  CstateController ctl(fs);
  ASSERT_TRUE(ctl.apply(-1).ok());
  for (unsigned c = 0; c < 2; ++c)
    for (unsigned s = 0; s < 3; ++s) ASSERT_TRUE(fixtures::disabled(fs, c, s));
}

TEST(cstate_two_cpu_scenario) {
  auto fs = fixtures::make_host(2, 4);
  CstateController ctl(fs);
  ASSERT_TRUE(ctl.apply(1).ok());
  for (unsigned c = 0; c < 2; ++c) {
    auto recs = ctl.read_states(c);
    ASSERT_EQ(recs.size(), 4u);
    ASSERT_TRUE(recs[0].enabled);
    ASSERT_TRUE(recs[1].enabled);
    ASSERT_FALSE(recs[2].enabled);
    ASSERT_FALSE(recs[3].enabled);

    auto lines = ctl.verification_lines(c);
    ASSERT_EQ(lines.size(), 4u);
    ASSERT_EQ(lines[0], fixtures::disable_path(c, 0) + ":0");
    ASSERT_EQ(lines[1], fixtures::disable_path(c, 1) + ":0");
    ASSERT_EQ(lines[2], fixtures::disable_path(c, 2) + ":1");
    ASSERT_EQ(lines[3], fixtures::disable_path(c, 3) + ":1");
  }
  ASSERT_EQ(ctl.verification_lines_all().size(), 8u);
}

TEST(cstate_permission_failure_stops_pass) {
  auto fs = fixtures::make_host(2, 4);
  fs.deny_writes(fixtures::disable_path(1, 2));
  CstateController ctl(fs);
  auto rep = ctl.apply(1);
  ASSERT_FALSE(rep.ok());
  ASSERT_EQ(rep.status.error, ControlError::Permission);
  ASSERT_EQ(rep.failed_path, fixtures::disable_path(1, 2));
  // cpu0 fully applied, cpu1 states 0..1 applied, nothing after the failure
  ASSERT_EQ(rep.applied.size(), 6u);
  ASSERT_EQ(fs.write_count(), 6u);
  ASSERT_TRUE(fixtures::disabled(fs, 0, 3));
  ASSERT_FALSE(fixtures::disabled(fs, 1, 2));
  ASSERT_FALSE(fixtures::disabled(fs, 1, 3));
}

TEST(cstate_missing_disable_file_is_fatal) {
  auto fs = fixtures::make_host(1, 3);
  fs.remove_file(fixtures::disable_path(0, 1));
  CstateController ctl(fs);
  auto rep = ctl.apply(0);
  ASSERT_FALSE(rep.ok());
  ASSERT_EQ(rep.status.error, ControlError::NotFound);
  ASSERT_EQ(rep.applied.size(), 1u);
}

TEST(cstate_rerun_after_failure_self_corrects) {
  auto fs = fixtures::make_host(2, 4);
  fs.deny_writes(fixtures::disable_path(0, 3));
  CstateController ctl(fs);
  ASSERT_FALSE(ctl.apply(1).ok());
  ASSERT_FALSE(fixtures::disabled(fs, 1, 3));
  fs.allow_writes(fixtures::disable_path(0, 3));
  ASSERT_TRUE(ctl.apply(1).ok());
  expect_policy(fs, 2, 4, 1);
}

TEST(cstate_verification_for_absent_cpu_is_empty) {
  auto fs = fixtures::make_host(2, 2);
  CstateController ctl(fs);
  ASSERT_TRUE(ctl.verification_lines(5).empty());
  ASSERT_TRUE(ctl.read_states(5).empty());
}

TEST(cstate_malformed_state_not_written) {
  auto fs = fixtures::make_host(1, 2);
  auto odd = fixtures::cpu_dir(0) + "/cpuidle/stateX/disable";
  fs.add_file(odd, "0\n");
  CstateController ctl(fs);
  auto rep = ctl.apply(-1);
  ASSERT_TRUE(rep.ok());
  ASSERT_EQ(rep.rejected.size(), 3u); // cpuidle, cpufreq, stateX
  ASSERT_EQ(*fs.contents(odd), std::string("0\n"));
}
