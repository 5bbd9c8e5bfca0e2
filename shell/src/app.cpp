#include <spdlog/spdlog.h>

#include "lusolve_shell/app.hpp"

#include "lusolve_shell/input.hpp"

#include "lusolve/lu.hpp"
#include "lusolve/ops.hpp"
#include "lusolve/solve.hpp"
#include "lusolve/triangular.hpp"

#include <cmath>
#include <cstring>

namespace lusolve_shell {
namespace {

// factors, permutation, inverse and a handful of vectors for the largest n
constexpr std::size_t kWorkMatrices = 12;

bool arg_is(const char* arg, const char* name) noexcept {
		return std::strcmp(arg, name) == 0;
}

bool parse_method(const char* s, lusolve::ConditionMethod* out) noexcept {
		if (arg_is(s, "inverse")) {
				*out = lusolve::ConditionMethod::NormInverse;
				return true;
		}
		if (arg_is(s, "svd")) {
				*out = lusolve::ConditionMethod::SingularValues;
				return true;
		}
		if (arg_is(s, "normal")) {
				*out = lusolve::ConditionMethod::NormalEquations;
				return true;
		}
		return false;
}

} // namespace

ArgsStatus parse_args(int argc, const char* const* argv, Options* out) noexcept {
		if (!out || !argv)
				return ArgsStatus::Invalid;

		Options opts;
		for (int i = 1; i < argc; i++) {
				const char* arg = argv[i];
				if (arg_is(arg, "-h") || arg_is(arg, "--help"))
						return ArgsStatus::Help;
				if (arg_is(arg, "--steps")) {
						opts.steps = true;
						continue;
				}
				if (arg_is(arg, "--unpivoted")) {
						opts.unpivoted = true;
						continue;
				}
				if (arg_is(arg, "-v") || arg_is(arg, "--verbose")) {
						opts.verbose = true;
						continue;
				}
				if (arg_is(arg, "--condition")) {
						if (i + 1 >= argc || !parse_method(argv[i + 1], &opts.method))
								return ArgsStatus::Invalid;
						i++;
						continue;
				}
				if (arg[0] == '-' && arg[1] == '-')
						return ArgsStatus::Invalid;

				if (!opts.matrix_text)
						opts.matrix_text = arg;
				else if (!opts.rhs_text)
						opts.rhs_text = arg;
				else
						return ArgsStatus::Invalid;
		}

		if (!opts.matrix_text || !opts.rhs_text)
				return ArgsStatus::Invalid;
		*out = opts;
		return ArgsStatus::Ok;
}

void print_usage(const char* prog) noexcept {
		spdlog::info("usage: {} [--steps] [--unpivoted] [--condition inverse|svd|normal] [-v] \"<A rows separated by ;>\" \"<b>\"",
		        prog ? prog : "lusolve");
		spdlog::info("example: {} \"2 1 0; -4 3 -1; 4 -3 4\" \"4 2 -2\"", prog ? prog : "lusolve");
}

bool App::init(const Options& opts) noexcept {
		opts_ = opts;
		if (opts_.verbose || LUSOLVE_SHELL_ENABLE_DEBUG)
				spdlog::set_level(spdlog::level::debug);

		// every entry takes at least one character plus a separator
		const std::size_t text_len = std::strlen(opts_.matrix_text) + std::strlen(opts_.rhs_text);
		const std::size_t input_bytes = (text_len + 2u) * sizeof(double) + 4096u;
		if (!lusolve::is_ok(input_slab_.init(input_bytes))) {
				spdlog::error("cannot allocate {} bytes for the input", input_bytes);
				return false;
		}
		input_.reset(input_slab_.data(), input_slab_.size());

		lusolve::MatrixMutView a;
		ParseStatus s = parse_matrix(opts_.matrix_text, input_, &a);
		if (s != ParseStatus::Ok) {
				spdlog::error("matrix: {}", parse_status_name(s));
				return false;
		}
		lusolve::VectorMutView b;
		s = parse_vector(opts_.rhs_text, input_, &b);
		if (s != ParseStatus::Ok) {
				spdlog::error("right-hand side: {}", parse_status_name(s));
				return false;
		}
		a_ = a.view();
		b_ = b.view();
		spdlog::debug("parsed A {}x{}, b of length {}", a_.rows, a_.cols, b_.size);

		const lusolve::Index n = a_.rows;
		const std::size_t persist_bytes = lusolve::slab_bytes_for(n, kWorkMatrices / 2) + (opts_.steps ? kLatexBytes : 0u);
		const std::size_t scratch_bytes = lusolve::slab_bytes_for(n, kWorkMatrices / 2);
		if (!lusolve::is_ok(work_slab_.init(persist_bytes + scratch_bytes))) {
				spdlog::error("cannot allocate {} bytes of work space for n = {}", persist_bytes + scratch_bytes, n);
				return false;
		}
		persist_.reset(work_slab_.data(), persist_bytes);
		scratch_.reset(work_slab_.data() + persist_bytes, scratch_bytes);
		spdlog::debug("slab={}B persist={}B scratch={}B", work_slab_.size(), persist_bytes, scratch_bytes);

		if (!lusolve::is_ok(lusolve::vector_alloc(persist_, n, &x_))) {
				spdlog::error("cannot allocate the solution vector");
				return false;
		}
		if (opts_.steps) {
				step_latex_ = persist_.allocate_array<char>(kLatexBytes);
				if (!step_latex_) {
						spdlog::error("cannot allocate the step buffer");
						return false;
				}
		}
		return true;
}

int App::run() noexcept {
		if (!a_.data || !b_.data)
				return kExitUsage;
		return opts_.unpivoted ? run_unpivoted() : run_pivoted();
}

int App::run_pivoted() noexcept {
		lusolve::SolveReport report;
		const lusolve::Error err = lusolve::solve_checked(a_, b_, scratch_, x_, &report);
		if (!lusolve::is_ok(err)) {
				report_error("solve", err);
				return err.code == lusolve::ErrorCode::Singular ? kExitNumeric : kExitUsage;
		}

		if (opts_.steps) {
				const lusolve::ExplainOptions eo{.enable = true, .persist = &persist_};
				const lusolve::Error serr = lusolve::op_solve(a_, b_, scratch_, x_, &expl_, eo);
				if (!lusolve::is_ok(serr))
						report_error("steps", serr);
				else
						print_steps();
		}

		report_solution();
		spdlog::info("relative residual ||Ax - b|| / ||b|| = {:.3e}", report.residual);
		if (opts_.method != lusolve::ConditionMethod::NormInverse) {
				report_condition();
				return kExitOk;
		}
		if (std::isnan(report.condition)) {
				spdlog::debug("condition analysis compiled out");
				return kExitOk;
		}
		spdlog::info("condition number {:.3e}, relative error bound {:.3e}", report.condition, report.error_bound);
		if (report.ill_conditioned)
				spdlog::warn("ill-conditioned system: kappa(A) = {:.3e} > {:.0e}, expect to lose about {:.0f} of ~16 digits",
				        report.condition,
				        lusolve::kIllConditioned,
				        std::log10(report.condition));
		return kExitOk;
}

int App::run_unpivoted() noexcept {
		const lusolve::Index n = a_.rows;
		if (!a_.square()) {
				report_error("factorize", lusolve::err_not_square(a_.dim()));
				return kExitUsage;
		}
		if (b_.size != n) {
				report_error("factorize", lusolve::err_dim_mismatch(a_.dim(), {b_.size, 1}));
				return kExitUsage;
		}

		lusolve::LuFactors f;
		lusolve::ErrorCode ec = lusolve::lu_factors_alloc(persist_, n, &f);
		if (!lusolve::is_ok(ec)) {
				report_error("factorize", lusolve::err_from(ec, a_.dim()));
				return kExitUsage;
		}

		lusolve::Error err;
		if (opts_.steps) {
				err = lusolve::op_lu(a_, f, &expl_, lusolve::ExplainOptions{.enable = true, .persist = &persist_});
				if (lusolve::is_ok(err))
						print_steps();
				if (err.code == lusolve::ErrorCode::FeatureDisabled) {
						spdlog::warn("step explanations compiled out");
						err = lusolve::factorize_lu(a_, f);
				}
		} else {
				err = lusolve::factorize_lu(a_, f);
		}
		if (!lusolve::is_ok(err)) {
				report_error("factorize", err);
				return kExitUsage;
		}

		if (!lusolve::matrix_is_finite(f.l.view()) || !lusolve::matrix_is_finite(f.u.view())) {
				spdlog::error("zero pivot without pivoting: L and U are not finite, rerun without --unpivoted");
				return kExitNumeric;
		}

		ec = lusolve::forward_substitute(f.l.view(), b_, x_);
		if (lusolve::is_ok(ec))
				ec = lusolve::backward_substitute(f.u.view(), x_.view(), x_);
		if (!lusolve::is_ok(ec)) {
				report_error("substitute", lusolve::err_from(ec, a_.dim()));
				return kExitUsage;
		}
		if (!lusolve::vector_is_finite(x_.view())) {
				spdlog::error("solution is not finite, U has a zero on its diagonal");
				return kExitNumeric;
		}

		report_solution();
		report_condition();
		return kExitOk;
}

void App::report_error(const char* what, const lusolve::Error& err) const noexcept {
		switch (err.code) {
		case lusolve::ErrorCode::Singular:
				spdlog::error("{}: matrix is singular, no nonzero pivot in column {}", what, err.i + 1);
				break;
		case lusolve::ErrorCode::NotSquare:
				spdlog::error("{}: matrix is {}x{}, expected square", what, err.a.rows, err.a.cols);
				break;
		case lusolve::ErrorCode::DimensionMismatch:
				spdlog::error("{}: shapes {}x{} and {}x{} do not match", what, err.a.rows, err.a.cols, err.b.rows, err.b.cols);
				break;
		default:
				spdlog::error("{}: {}", what, lusolve::error_code_name(err.code));
				break;
		}
}

void App::report_solution() const noexcept {
		for (lusolve::Index i = 0; i < x_.size; i++)
				spdlog::info("x[{}] = {:.17g}", i + 1, x_.at(i));
}

void App::report_condition() noexcept {
		double kappa = 0.0;
		const lusolve::Error err = lusolve::condition_number(a_, scratch_, &kappa, opts_.method);
		if (err.code == lusolve::ErrorCode::FeatureDisabled) {
				spdlog::debug("condition analysis compiled out");
				return;
		}
		if (!lusolve::is_ok(err)) {
				report_error("condition", err);
				return;
		}
		spdlog::info("condition number {:.3e}, relative error bound {:.3e}", kappa, lusolve::relative_error_bound(kappa));
		if (!(kappa <= lusolve::kIllConditioned))
				spdlog::warn("ill-conditioned system: kappa(A) = {:.3e} > {:.0e}", kappa, lusolve::kIllConditioned);
}

void App::print_steps() noexcept {
		const lusolve::StepRenderBuffers bufs{step_caption_, sizeof(step_caption_), step_latex_, kLatexBytes, &scratch_};
		const std::size_t count = expl_.step_count();
		for (std::size_t i = 0; i < count; i++) {
				const lusolve::ErrorCode ec = expl_.render_step(i, bufs);
				if (!lusolve::is_ok(ec)) {
						spdlog::warn("step {}: {}", i, lusolve::error_code_name(ec));
						continue;
				}
				spdlog::info("step {}/{}: {}", i, count - 1, step_caption_);
				spdlog::info("  {}", step_latex_);
		}
}

} // namespace lusolve_shell
