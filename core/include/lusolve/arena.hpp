#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>

namespace lusolve {
class ArenaScope;
class ArenaScratchScope;

// workspace for factorizations and solves over a caller owned buffer
// (usually a Slab sized by slab_bytes_for). working copies of A, the raw
// multipliers, permutations and explanation contexts are carved from it.
// only the Eigen backed analyzer in condition.hpp touches the heap
//
// allocations are released only by rolling back, through ArenaScope or
// ArenaScratchScope
class Arena {
	  public:
		Arena() noexcept = default;
		Arena(void* buffer, std::size_t capacity) noexcept { reset(buffer, capacity); }

		Arena(const Arena&) = delete;
		Arena& operator=(const Arena&) = delete;

		// forgets every allocation and the peak
		void reset(void* buffer, std::size_t capacity) noexcept {
				base_ = static_cast<std::uint8_t*>(buffer);
				cap_ = base_ ? capacity : 0;
				used_ = 0;
				peak_ = 0;
		}

		std::size_t used() const noexcept { return used_; }
		std::size_t capacity() const noexcept { return cap_; }
		std::size_t remaining() const noexcept { return cap_ - used_; }
		// high-water mark since reset(), what a Slab for the same calls must hold
		std::size_t peak() const noexcept { return peak_; }

		// count value initialized T, nullptr when count is 0 or the arena is
		// exhausted. a failed call leaves used() unchanged
		template <typename T> T* allocate_array(std::size_t count) noexcept {
				if (count == 0 || count > static_cast<std::size_t>(-1) / sizeof(T))
						return nullptr;
				T* data = static_cast<T*>(carve(sizeof(T) * count, alignof(T)));
				if (!data)
						return nullptr;
				for (std::size_t i = 0; i < count; i++)
						new (data + i) T{};
				return data;
		}

		// one value initialized T. never destroyed, T must be trivially
		// destructible
		template <typename T> T* create() noexcept {
				static_assert(std::is_trivially_destructible_v<T>, "arena objects are never destroyed");
				void* mem = carve(sizeof(T), alignof(T));
				return mem ? new (mem) T{} : nullptr;
		}

	  private:
		friend class ArenaScope;
		friend class ArenaScratchScope;

		void* carve(std::size_t size, std::size_t align) noexcept {
				if (!base_)
						return nullptr;
				void* p = base_ + used_;
				std::size_t space = cap_ - used_;
				if (!std::align(align, size, p, space))
						return nullptr;
				used_ = static_cast<std::size_t>(static_cast<std::uint8_t*>(p) - base_) + size;
				if (used_ > peak_)
						peak_ = used_;
				return p;
		}

		void rewind(std::size_t mark) noexcept {
				if (mark < used_)
						used_ = mark;
		}

		std::uint8_t* base_ = nullptr;
		std::size_t cap_ = 0;
		std::size_t used_ = 0;
		std::size_t peak_ = 0;
};

// rolls the arena back to where it stood on construction unless commit()
// is called. nested scopes must close in reverse order
class ArenaScope final {
	  public:
		explicit ArenaScope(Arena& arena) noexcept : arena_(&arena), mark_(arena.used_) {}

		ArenaScope(const ArenaScope&) = delete;
		ArenaScope& operator=(const ArenaScope&) = delete;

		~ArenaScope() noexcept {
				if (arena_)
						arena_->rewind(mark_);
		}

		// keep everything allocated since construction, e.g. an explanation
		// context that has to outlive the op that built it
		void commit() noexcept { arena_ = nullptr; }

	  private:
		Arena* arena_;
		std::size_t mark_;
};

// owns the whole scratch arena for one top level call (op_*, a rendered
// step): empty on entry, empty again on exit
class ArenaScratchScope final {
	  public:
		explicit ArenaScratchScope(Arena& arena) noexcept : arena_(arena) { arena_.rewind(0); }

		ArenaScratchScope(const ArenaScratchScope&) = delete;
		ArenaScratchScope& operator=(const ArenaScratchScope&) = delete;

		~ArenaScratchScope() noexcept { arena_.rewind(0); }

	  private:
		Arena& arena_;
};
} // namespace lusolve
