#include "lusolve/explanation.hpp"

namespace lusolve {

std::size_t Explanation::step_count() const noexcept {
		return available() ? vtable_->step_count(ctx_) : 0;
}

ErrorCode Explanation::render_step(std::size_t index, const StepRenderBuffers& out) const noexcept {
		if (!available() || !out.scratch)
				return ErrorCode::Internal;
		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';
		if (index >= vtable_->step_count(ctx_))
				return ErrorCode::StepOutOfRange;

		ArenaScratchScope scope(*out.scratch);
		return vtable_->render_step(ctx_, index, out);
}

} // namespace lusolve
