#include "lusolve/ops.hpp"

#if LUSOLVE_ENABLE_EXPLAIN
#include "lusolve/latex.hpp"
#include "lusolve/lu_detail.hpp"
#include "lusolve/row_ops.hpp"
#include "lusolve/writer.hpp"

namespace lusolve {
namespace {

ErrorCode write_caption(const StepRenderBuffers& out, const char* text) noexcept {
		if (!out.caption)
				return ErrorCode::Ok;
		Writer w{out.caption, out.caption_cap, 0};
		return w.append(text);
}

ErrorCode write_op_caption(const StepRenderBuffers& out, const RowOp& op) noexcept {
		if (!out.caption)
				return ErrorCode::Ok;
		return row_op_caption(op, out.caption, out.caption_cap);
}

// unpivoted: step 0 is A, step k >= 1 the factors after k outer steps. a 1x1
// matrix has no elimination step, it gets a single final step
struct LuCtx {
		MatrixView input;
};

std::size_t lu_elim_steps(Index n) noexcept {
		return n > 1 ? static_cast<std::size_t>(n - 1) : 1u;
}

std::size_t lu_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const LuCtx*>(vctx);
		return lu_elim_steps(ctx->input.rows) + 1;
}

ErrorCode lu_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const LuCtx*>(vctx);
		if (!ctx->input.data)
				return ErrorCode::Internal;

		const Index n = ctx->input.rows;
		if (index == 0) {
				ErrorCode ec = write_caption(out, "$A$");
				if (!is_ok(ec))
						return ec;
				return latex::write_matrix_display(ctx->input, {}, {out.latex, out.latex_cap});
		}

		LuFactors f;
		ErrorCode ec = lu_factors_alloc(*out.scratch, n, &f);
		if (!is_ok(ec))
				return ec;

		// the last step also sets L_nn, i.e. it is the complete factorization
		const bool last = index == lu_elim_steps(n);
		const Index nstep = last ? n : static_cast<Index>(index);
		Error err = factorize_lu_steps(ctx->input, nstep, f);
		if (!is_ok(err))
				return err.code;

		RowOp op;
		op.kind = RowOpKind::Eliminate;
		op.step = static_cast<Index>(index - 1);
		op.pivot = f.u.at(op.step, op.step);
		ec = write_op_caption(out, op);
		if (!is_ok(ec))
				return ec;

		return latex::write_lu_display(f.l.view(), f.u.view(), nstep, {out.latex, out.latex_cap});
}

constexpr ExplanationVTable kLuVTable = {
        .step_count = &lu_step_count,
        .render_step = &lu_render_step,
};

// pivoted: step 0 is A, step k in 1..n-1 the working matrix after k pivot
// steps, step n the final L, U and p
struct PivotedLuCtx {
		MatrixView input;
};

std::size_t pivoted_lu_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const PivotedLuCtx*>(vctx);
		return static_cast<std::size_t>(ctx->input.rows) + 1;
}

ErrorCode pivoted_lu_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const PivotedLuCtx*>(vctx);
		if (!ctx->input.data)
				return ErrorCode::Internal;

		const Index n = ctx->input.rows;
		if (index == 0) {
				ErrorCode ec = write_caption(out, "$A$");
				if (!is_ok(ec))
						return ec;
				return latex::write_matrix_display(ctx->input, {}, {out.latex, out.latex_cap});
		}

		Arena& scratch = *out.scratch;
		MatrixMutView ak;
		ErrorCode ec = matrix_clone(scratch, ctx->input, &ak);
		if (!is_ok(ec))
				return ec;
		MatrixMutView l_raw;
		ec = matrix_alloc(scratch, n, n, &l_raw);
		if (!is_ok(ec))
				return ec;
		PivotedLuFactors f;
		ec = pivoted_lu_factors_alloc(scratch, n, &f);
		if (!is_ok(ec))
				return ec;

		detail::PivotObserver obs;
		obs.target = index;
		Error err = detail::lu_pivoted_eliminate(ak, l_raw, f.u, f.p, &obs);
		if (!is_ok(err))
				return err.code;
		if (obs.count < index)
				return ErrorCode::StepOutOfRange;

		RowOp op;
		op.kind = RowOpKind::Pivot;
		op.step = obs.last.step;
		op.pivot_row = obs.last.pivot_row;
		op.pivot = obs.last.pivot;
		ec = write_op_caption(out, op);
		if (!is_ok(ec))
				return ec;

		if (index < n)
				return latex::write_matrix_display(ak.view(), {}, {out.latex, out.latex_cap});

		ec = apply_permutation_rows(f.p.view(), l_raw.view(), f.l);
		if (!is_ok(ec))
				return ec;
		return latex::write_pivoted_lu_display(f.l.view(), f.u.view(), f.p.view(), {out.latex, out.latex_cap});
}

constexpr ExplanationVTable kPivotedLuVTable = {
        .step_count = &pivoted_lu_step_count,
        .render_step = &pivoted_lu_render_step,
};

template <typename Ctx> Error make_explanation(MatrixView a, const ExplanationVTable* vtable, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (!opts.persist || !expl)
				return {ErrorCode::Internal};

		Ctx ctx{};
		ctx.input = a;
		return expl->bind(*opts.persist, ctx, vtable);
}

} // namespace

Error op_lu(MatrixView a, LuFactors out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (a.rows < 1 || a.rows > kMaxDim)
				return err_invalid_dim(a.dim());
		Error err = factorize_lu(a, out);
		if (!is_ok(err))
				return err;

		if (opts.enable)
				return make_explanation<LuCtx>(a, &kLuVTable, expl, opts);
		return err;
}

Error op_lu_pivoted(MatrixView a, Arena& scratch, PivotedLuFactors out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (a.rows < 1 || a.rows > kMaxDim)
				return err_invalid_dim(a.dim());

		ArenaScratchScope scratch_scope(scratch);
		Error err = factorize_lu_pivoted(a, scratch, out);
		if (!is_ok(err))
				return err;

		if (opts.enable)
				return make_explanation<PivotedLuCtx>(a, &kPivotedLuVTable, expl, opts);
		return err;
}

} // namespace lusolve
#endif // LUSOLVE_ENABLE_EXPLAIN
