#pragma once

#include <cstddef>
#include <cstdint>

#include "lusolve/arena.hpp"
#include "lusolve/condition.hpp"
#include "lusolve/explanation.hpp"
#include "lusolve/matrix.hpp"
#include "lusolve/slab.hpp"

#include "lusolve_shell/config.hpp"

namespace lusolve_shell {

struct Options {
		const char* matrix_text = nullptr; // "1 2; 3 4"
		const char* rhs_text = nullptr;    // "5 6"
		bool steps = false;
		bool unpivoted = false;
		bool verbose = false;
		lusolve::ConditionMethod method = lusolve::ConditionMethod::NormInverse;
};

enum class ArgsStatus : std::uint8_t {
		Ok,
		Help,
		Invalid,
};

ArgsStatus parse_args(int argc, const char* const* argv, Options* out) noexcept;
void print_usage(const char* prog) noexcept;

// process exit codes
constexpr int kExitOk = 0;
constexpr int kExitNumeric = 1; // singular system or broken unpivoted factors
constexpr int kExitUsage = 2;   // bad arguments, unparsable or malformed input

class App {
	  public:
		// parses the system, sizes the arenas after it
		bool init(const Options& opts) noexcept;
		int run() noexcept;

	  private:
		Options opts_{};

		lusolve::Slab input_slab_{};
		lusolve::Slab work_slab_{};
		lusolve::Arena input_{};
		lusolve::Arena persist_{};
		lusolve::Arena scratch_{};

		lusolve::MatrixView a_{};
		lusolve::VectorView b_{};
		lusolve::VectorMutView x_{};

		char step_caption_[kCaptionBytes]{};
		char* step_latex_ = nullptr; // kLatexBytes from persist_
		lusolve::Explanation expl_{};

		int run_pivoted() noexcept;
		int run_unpivoted() noexcept;

		void report_error(const char* what, const lusolve::Error& err) const noexcept;
		void report_solution() const noexcept;
		void report_condition() noexcept;
		void print_steps() noexcept;
};

} // namespace lusolve_shell
