#pragma once

#include <iosfwd>
#include <optional>
#include <string_view>
#include "app/Config.hpp"
#include "control/IControlFs.hpp"
#include "model/IdleState.hpp"
#include "msr/IMsrDevice.hpp"

namespace idlectl::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;

// Whole-string signed decimal; "3x", "" and overflow are rejected.
[[nodiscard]] auto parse_threshold(std::string_view arg) -> std::optional<model::Threshold>;

// cstate_control <threshold>: exactly one argument.
[[nodiscard]] auto parse_cstate_args(int argc, const char* const* argv) -> std::optional<model::Threshold>;
void print_cstate_usage(std::ostream& err, const char* prog);

// Applies the policy, then prints the verification dump to out.
int run_cstate_control(const Config& cfg, control::IControlFs& fs,
                       model::Threshold threshold, std::ostream& out);

// mwait_workaround [on|off]: returns true to set the bit, false to clear it.
[[nodiscard]] auto parse_mwait_args(int argc, const char* const* argv) -> std::optional<bool>;
void print_mwait_usage(std::ostream& err, const char* prog);

int run_mwait_workaround(const Config& cfg, const control::IControlFs& fs,
                         msr::IMsrDevice& dev, bool set, std::ostream& out);

// Entry points behind the two executables: usage errors return before any
// control file or register is touched.
int cstate_control_main(int argc, const char* const* argv, const Config& cfg,
                        control::IControlFs& fs, std::ostream& out, std::ostream& err);
int mwait_workaround_main(int argc, const char* const* argv, const Config& cfg,
                          const control::IControlFs& fs, msr::IMsrDevice& dev,
                          std::ostream& out, std::ostream& err);

} // namespace idlectl::app
