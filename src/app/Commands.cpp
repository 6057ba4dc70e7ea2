#include "app/Commands.hpp"
#include "control/CstateController.hpp"
#include "control/Topology.hpp"
#include "msr/MsrController.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <vector>
#include <ostream>
#include <string>

namespace idlectl::app {

auto parse_threshold(std::string_view arg) -> std::optional<model::Threshold> {
  if (arg.empty()) return std::nullopt;
  model::Threshold v = 0;
  auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), v);
  if (ec != std::errc() || ptr != arg.data() + arg.size()) return std::nullopt;
  return v;
}

auto parse_cstate_args(int argc, const char* const* argv) -> std::optional<model::Threshold> {
  if (argc != 2 || !argv[1]) return std::nullopt;
  return parse_threshold(argv[1]);
}

void print_cstate_usage(std::ostream& err, const char* prog) {
  err << "Usage: " << (prog ? prog : "cstate_control") << " <cstate>\n"
      << "  Where <cstate> is a number between 0 and 9; the lowest desired cstate to allow.\n";
}

int run_cstate_control(const Config& cfg, control::IControlFs& fs,
                       model::Threshold threshold, std::ostream& out) {
  control::CstateController ctl(fs);
  auto rep = ctl.apply(threshold);
  if (rep.cpus == 0) {
    IDLECTL_LOG_WARN("cstate_control", "no cpu<N> entries under %s (%s)", control::kCpuRoot, fs.name());
  }
  if (!rep.rejected.empty()) {
    IDLECTL_LOG_INFO("cstate_control", "%zu entries did not match the topology pattern", rep.rejected.size());
  }

  // Printed on failure too: it is how a partial application becomes visible.
  auto lines = cfg.verify_all ? ctl.verification_lines_all() : ctl.verification_lines(cfg.verify_cpu);
  for (const auto& l : lines) out << l << "\n";
  out.flush();

  if (!rep.ok()) {
    IDLECTL_LOG_ERROR("cstate_control", "stopped after %zu of the idle states: %s: %s",
                      rep.applied.size(), rep.failed_path.c_str(), control::describe(rep.status).c_str());
    if (rep.status.error == control::ControlError::Permission)
      IDLECTL_LOG_ERROR("cstate_control", "writing cpuidle controls requires root");
    return kExitFailure;
  }
  return kExitOk;
}

auto parse_mwait_args(int argc, const char* const* argv) -> std::optional<bool> {
  if (argc == 1) return true;
  if (argc != 2 || !argv[1]) return std::nullopt;
  std::string_view a(argv[1]);
  if (a == "on" || a == "enable") return true;
  if (a == "off" || a == "disable") return false;
  return std::nullopt;
}

void print_mwait_usage(std::ostream& err, const char* prog) {
  err << "Usage: " << (prog ? prog : "mwait_workaround") << " [on|off]\n"
      << "  Sets (on, default) or clears (off) the configured MSR bit on every cpu\n"
      << "  and prints the value read back.\n";
}

int run_mwait_workaround(const Config& cfg, const control::IControlFs& fs,
                         msr::IMsrDevice& dev, bool set, std::ostream& out) {
  if (cfg.msr_bit < 0 || cfg.msr_bit > 63) {
    IDLECTL_LOG_ERROR("mwait_workaround", "msr bit %d out of range 0..63", cfg.msr_bit);
    return kExitFailure;
  }
  std::vector<model::ProcessorId> cpus;
  for (const auto& p : control::Topology(fs).processors()) cpus.push_back(p.id);
  if (cpus.empty()) {
    IDLECTL_LOG_ERROR("mwait_workaround", "no cpu<N> entries under %s", control::kCpuRoot);
    return kExitFailure;
  }

  msr::MsrController ctl(dev);
  auto rep = ctl.apply_bit(cpus, cfg.msr_register, static_cast<unsigned>(cfg.msr_bit), set);
  for (const auto& l : msr::MsrController::format_values(rep)) out << l << "\n";
  out.flush();

  if (!rep.ok()) {
    IDLECTL_LOG_ERROR("mwait_workaround", "cpu%u: %s", rep.failed_cpu, control::describe(rep.status).c_str());
    if (rep.status.error == control::ControlError::NotFound)
      IDLECTL_LOG_ERROR("mwait_workaround", "is the msr module loaded? (modprobe msr)");
    return kExitFailure;
  }
  if (!rep.all_verified()) return kExitFailure;
  return kExitOk;
}

int cstate_control_main(int argc, const char* const* argv, const Config& cfg,
                        control::IControlFs& fs, std::ostream& out, std::ostream& err) {
  auto threshold = parse_cstate_args(argc, argv);
  if (!threshold) {
    print_cstate_usage(err, argc > 0 ? argv[0] : nullptr);
    return kExitFailure;
  }
  return run_cstate_control(cfg, fs, *threshold, out);
}

int mwait_workaround_main(int argc, const char* const* argv, const Config& cfg,
                          const control::IControlFs& fs, msr::IMsrDevice& dev,
                          std::ostream& out, std::ostream& err) {
  auto set = parse_mwait_args(argc, argv);
  if (!set) {
    print_mwait_usage(err, argc > 0 ? argv[0] : nullptr);
    return kExitFailure;
  }
  return run_mwait_workaround(cfg, fs, dev, *set, out);
}

} // namespace idlectl::app
