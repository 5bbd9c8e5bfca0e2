#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include "lusolve/config.hpp"
#include "lusolve/error.hpp"

namespace lusolve {
// heap backing store for arenas, owned by the application
class Slab {
	  public:
		Slab() noexcept = default;
		Slab(const Slab&) = delete;
		Slab& operator=(const Slab&) = delete;

		~Slab() { free(); }

		ErrorCode init(std::size_t bytes) noexcept {
				free();
				if (bytes == 0)
						return ErrorCode::InvalidDimension;

				void* mem = std::malloc(bytes);
				if (!mem)
						return ErrorCode::Overflow;
				data_ = static_cast<std::uint8_t*>(mem);
				size_ = bytes;
				return ErrorCode::Ok;
		}

		void free() noexcept {
				if (data_)
						std::free(data_);
				data_ = nullptr;
				size_ = 0;
		}

		std::uint8_t* data() noexcept { return data_; }
		const std::uint8_t* data() const noexcept { return data_; }
		std::size_t size() const noexcept { return size_; }

	  private:
		std::uint8_t* data_ = nullptr;
		std::size_t size_ = 0;
};

// bytes needed to hold `matrices` n x n doubles plus alignment slack, a
// convenience for sizing a Slab
constexpr std::size_t slab_bytes_for(Index n, std::size_t matrices) noexcept {
		return matrices * (static_cast<std::size_t>(n) * static_cast<std::size_t>(n) * sizeof(double) + alignof(double)) + 4096u;
}
} // namespace lusolve
