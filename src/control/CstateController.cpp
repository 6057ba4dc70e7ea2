#include "control/CstateController.hpp"
#include "util/Log.hpp"
#include "util/Sysfs.hpp"

namespace idlectl::control {

CstateController::CstateController(IControlFs& fs, std::string root)
    : fs_(fs), topology_(fs, std::move(root)) {}

ApplyReport CstateController::apply(model::Threshold threshold) {
  ApplyReport rep;
  auto scan = topology_.scan();
  rep.cpus = scan.processors.size();
  rep.rejected = std::move(scan.rejected);
  rep.applied.reserve(scan.states.size());

  for (const auto& st : scan.states) {
    bool allow = model::state_allowed(st.state, threshold);
    auto path = st.disable_path();
    auto status = fs_.write_control(path, allow ? "0" : "1");
    if (!status) {
      IDLECTL_LOG_ERROR("CstateController", "write %s failed: %s",
                        path.c_str(), describe(status).c_str());
      rep.status = status;
      rep.failed_path = path;
      return rep;
    }
    IDLECTL_LOG_INFO("CstateController", "set cpu%u/state%u disable=%d", st.cpu, st.state, allow ? 0 : 1);
    rep.applied.push_back(model::IdleStateRecord{st.cpu, st.state, allow});
  }
  return rep;
}

std::vector<model::IdleStateRecord> CstateController::read_states(model::ProcessorId cpu) const {
  std::vector<model::IdleStateRecord> out;
  auto entry = topology_.find_processor(cpu);
  if (!entry) return out;
  for (const auto& st : topology_.idle_states(*entry)) {
    auto txt = fs_.read_control(st.disable_path());
    if (!txt) {
      IDLECTL_LOG_WARN("CstateController", "cannot read %s", st.disable_path().c_str());
      continue;
    }
    auto v = idlectl::util::trim_value(*txt);
    if (v != "0" && v != "1") {
      IDLECTL_LOG_WARN("CstateController", "unexpected value in %s", st.disable_path().c_str());
      continue;
    }
    out.push_back(model::IdleStateRecord{st.cpu, st.state, v == "0"});
  }
  return out;
}

std::vector<std::string> CstateController::lines_for(const ProcessorEntry& cpu) const {
  std::vector<std::string> out;
  for (const auto& st : topology_.idle_states(cpu)) {
    auto path = st.disable_path();
    auto txt = fs_.read_control(path);
    if (!txt) {
      IDLECTL_LOG_WARN("CstateController", "cannot read %s", path.c_str());
      continue;
    }
    out.push_back(path + ":" + std::string(idlectl::util::trim_value(*txt)));
  }
  return out;
}

std::vector<std::string> CstateController::verification_lines(model::ProcessorId cpu) const {
  auto entry = topology_.find_processor(cpu);
  if (!entry) {
    IDLECTL_LOG_WARN("CstateController", "reference cpu%u not present", cpu);
    return {};
  }
  auto lines = lines_for(*entry);
  if (lines.empty()) IDLECTL_LOG_WARN("CstateController", "cpu%u exposes no idle states", cpu);
  return lines;
}

std::vector<std::string> CstateController::verification_lines_all() const {
  std::vector<std::string> out;
  for (const auto& cpu : topology_.processors()) {
    auto lines = lines_for(cpu);
    out.insert(out.end(), lines.begin(), lines.end());
  }
  return out;
}

} // namespace idlectl::control
