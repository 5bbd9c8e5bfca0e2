#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/config.hpp"
#include "lusolve/error.hpp"
#include "lusolve/explanation.hpp"
#include "lusolve/lu.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve {
struct ExplainOptions {
		bool enable = false;
		Arena* persist = nullptr; // required when enable==true
};

// explained variants of the factorizations and the solver. the numeric result
// is the same as factorize_lu(), factorize_lu_pivoted() and solve()
//
// memory model:
// - matrix and vector data must outlive any Explanation created from it
// - when opts.enable==true, opts.persist must be a valid long lived arena for
//   the explanation context
// - step rendering requires StepRenderBuffers::scratch to be a valid arena, it
//   is cleared by the renderer on each call
//

// steps: A, then L and U after each outer elimination step
Error op_lu(In MatrixView a, Out LuFactors out, Out Explanation* expl, In const ExplainOptions& opts) noexcept;

// steps: A, then the working matrix after each pivot step, then L, U and p
Error op_lu_pivoted(
        In MatrixView a, InOut Arena& scratch, Out PivotedLuFactors out, Out Explanation* expl, In const ExplainOptions& opts) noexcept;

// steps: [A | b], P A = L U, z from L z = P b, x from U x = z
Error op_solve(In MatrixView a,
        In VectorView b,
        InOut Arena& scratch,
        Out VectorMutView x,
        Out Explanation* expl,
        In const ExplainOptions& opts) noexcept;

} // namespace lusolve
