#include "lusolve/ops.hpp"

#if LUSOLVE_ENABLE_EXPLAIN
#include "lusolve/latex.hpp"
#include "lusolve/permutation.hpp"
#include "lusolve/solve.hpp"
#include "lusolve/triangular.hpp"
#include "lusolve/writer.hpp"

namespace lusolve {
namespace {

enum SolveStep : std::size_t {
		kAugmented = 0,
		kFactor,
		kForward,
		kBackward,
		kSolveStepCount,
};

struct SolveCtx {
		MatrixView a;
		VectorView b;
};

std::size_t solve_step_count(const void*) noexcept {
		return kSolveStepCount;
}

const char* solve_caption(std::size_t index) noexcept {
		switch (index) {
		case kAugmented:
				return "$[A \\mid b]$";
		case kFactor:
				return "$P A = L U$";
		case kForward:
				return "$L z = P b$ (forward substitution)";
		case kBackward:
				return "$U x = z$ (backward substitution)";
		default:
				return "";
		}
}

ErrorCode solve_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const SolveCtx*>(vctx);
		if (!ctx->a.data || !ctx->b.data)
				return ErrorCode::Internal;

		if (out.caption) {
				Writer w{out.caption, out.caption_cap, 0};
				ErrorCode ec = w.append(solve_caption(index));
				if (!is_ok(ec))
						return ec;
		}

		const latex::Buffer latex_out{out.latex, out.latex_cap};
		if (index == kAugmented)
				return latex::write_augmented_display(ctx->a, ctx->b, latex_out);

		Arena& scratch = *out.scratch;
		const Index n = ctx->a.rows;
		PivotedLuFactors f;
		ErrorCode ec = pivoted_lu_factors_alloc(scratch, n, &f);
		if (!is_ok(ec))
				return ec;
		Error err = factorize_lu_pivoted(ctx->a, scratch, f);
		if (!is_ok(err))
				return err.code;
		if (index == kFactor)
				return latex::write_pivoted_lu_display(f.l.view(), f.u.view(), f.p.view(), latex_out);

		VectorMutView z;
		ec = vector_alloc(scratch, n, &z);
		if (!is_ok(ec))
				return ec;
		ec = apply_permutation(f.p.view(), ctx->b, z);
		if (!is_ok(ec))
				return ec;
		ec = forward_substitute(f.l.view(), z.view(), z);
		if (!is_ok(ec))
				return ec;
		if (index == kForward)
				return latex::write_vector_display("z", z.view(), latex_out);

		VectorMutView x;
		ec = vector_alloc(scratch, n, &x);
		if (!is_ok(ec))
				return ec;
		ec = backward_substitute(f.u.view(), z.view(), x);
		if (!is_ok(ec))
				return ec;
		return latex::write_vector_display("x", x.view(), latex_out);
}

constexpr ExplanationVTable kSolveVTable = {
        .step_count = &solve_step_count,
        .render_step = &solve_render_step,
};

} // namespace

Error op_solve(MatrixView a, VectorView b, Arena& scratch, VectorMutView x, Explanation* expl, const ExplainOptions& opts) noexcept {
		ArenaScratchScope scratch_scope(scratch);
		Error err = solve(a, b, scratch, x);
		if (!is_ok(err))
				return err;

		if (opts.enable) {
				if (!opts.persist || !expl)
						return {ErrorCode::Internal};

				return expl->bind(*opts.persist, SolveCtx{.a = a, .b = b}, &kSolveVTable);
		}
		return err;
}

} // namespace lusolve
#endif // LUSOLVE_ENABLE_EXPLAIN
