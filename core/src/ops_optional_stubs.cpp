#include "lusolve/condition.hpp"
#include "lusolve/ops.hpp"

#if !LUSOLVE_ENABLE_EXPLAIN
namespace lusolve {

Error op_lu(MatrixView a, LuFactors out, Explanation* expl, const ExplainOptions& opts) noexcept {
		(void)a;
		(void)out;
		(void)expl;
		(void)opts;
		return err_feature_disabled();
}

Error op_lu_pivoted(MatrixView a, Arena& scratch, PivotedLuFactors out, Explanation* expl, const ExplainOptions& opts) noexcept {
		(void)a;
		(void)scratch;
		(void)out;
		(void)expl;
		(void)opts;
		return err_feature_disabled();
}

Error op_solve(MatrixView a, VectorView b, Arena& scratch, VectorMutView x, Explanation* expl, const ExplainOptions& opts) noexcept {
		(void)a;
		(void)b;
		(void)scratch;
		(void)x;
		(void)expl;
		(void)opts;
		return err_feature_disabled();
}

} // namespace lusolve
#endif // !LUSOLVE_ENABLE_EXPLAIN

#if !LUSOLVE_ENABLE_CONDITION
namespace lusolve {

Error matrix_norm2(MatrixView m, double* out) noexcept {
		(void)m;
		(void)out;
		return err_feature_disabled();
}

Error condition_number(MatrixView a, Arena& scratch, double* out, ConditionMethod method) noexcept {
		(void)a;
		(void)scratch;
		(void)out;
		(void)method;
		return err_feature_disabled();
}

Error condition_number_symmetric(MatrixView a, double* out) noexcept {
		(void)a;
		(void)out;
		return err_feature_disabled();
}

Error condition_number_spd(MatrixView a, double* out) noexcept {
		(void)a;
		(void)out;
		return err_feature_disabled();
}

} // namespace lusolve
#endif // !LUSOLVE_ENABLE_CONDITION
