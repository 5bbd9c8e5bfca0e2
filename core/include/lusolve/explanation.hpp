#pragma once

#include <cstddef>
#include <type_traits>

#include "lusolve/arena.hpp"
#include "lusolve/error.hpp"

namespace lusolve {
// caller owned output for one rendered step. scratch is emptied around every
// render_step() call, the factors of a step never outlive it
struct StepRenderBuffers {
		char* caption = nullptr;
		std::size_t caption_cap = 0;
		char* latex = nullptr;
		std::size_t latex_cap = 0;
		Arena* scratch = nullptr;
};

// steps of one kind of op, over its context record
struct ExplanationVTable {
		std::size_t (*step_count)(In const void* ctx) noexcept;
		ErrorCode (*render_step)(In const void* ctx, In std::size_t index, In const StepRenderBuffers& out) noexcept;
};

// handle to the steps of one op_* call
//
// the op stores a small record (the views of its inputs) in the persist arena
// and each step is refactorized from it when rendered, so nothing per step is
// kept. the record is plain data, never destroyed: the handle copies freely and
// stays valid until persist is rolled back past it or the inputs go away
class Explanation {
	  public:
		Explanation() noexcept = default;

		// copies ctx into persist and points the handle at it. on Overflow the
		// handle and persist are left as they were
		template <typename Ctx> Error bind(InOut Arena& persist, In const Ctx& ctx, In const ExplanationVTable* vtable) noexcept {
				static_assert(std::is_trivially_copyable_v<Ctx>, "explanation contexts are plain records");
				if (!vtable)
						return {ErrorCode::Internal};
				Ctx* stored = persist.create<Ctx>();
				if (!stored)
						return err_overflow();
				*stored = ctx;
				ctx_ = stored;
				vtable_ = vtable;
				return {};
		}

		bool available() const noexcept { return vtable_ != nullptr && ctx_ != nullptr; }

		// 0 when nothing is bound
		std::size_t step_count() const noexcept;

		// writes the caption and LaTeX of step `index` (0 based). both outputs
		// are emptied first. StepOutOfRange past the last step, BufferTooSmall
		// when an output does not fit
		ErrorCode render_step(In std::size_t index, In const StepRenderBuffers& out) const noexcept;

		// detaches, the record stays in persist
		void reset() noexcept {
				ctx_ = nullptr;
				vtable_ = nullptr;
		}

	  private:
		const void* ctx_ = nullptr;
		const ExplanationVTable* vtable_ = nullptr;
};

} // namespace lusolve
