#pragma once

#include <cstdint>

#include "lusolve/config.hpp"

// parameter direction annotations
#define In
#define Out
#define InOut

namespace lusolve {
struct Dim {
		Index rows = 0;
		Index cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled,
		InvalidDimension,
		DimensionMismatch,
		NotSquare,
		Singular,
		NotSymmetric,
		NotPositiveDefinite,
		InvalidPermutation,
		NonFinite,
		Overflow,
		BufferTooSmall,
		IndexOutOfRange,
		StepOutOfRange,
		Internal,
};

// a and b are the shapes involved, i is the elimination step for Singular
// and the offending entry for InvalidPermutation
struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
		Index i = 0;
		Index j = 0;
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

constexpr Error err_dim_mismatch(Dim a, Dim b) noexcept {
		return {ErrorCode::DimensionMismatch, a, b};
}
constexpr Error err_not_square(Dim a) noexcept {
		return {ErrorCode::NotSquare, a};
}
constexpr Error err_singular(Dim a, Index step) noexcept {
		return {ErrorCode::Singular, a, {}, step};
}
constexpr Error err_overflow(void) noexcept {
		return {ErrorCode::Overflow};
}
constexpr Error err_invalid_dim(Dim a) noexcept {
		return {ErrorCode::InvalidDimension, a};
}
constexpr Error err_feature_disabled() noexcept {
		return {ErrorCode::FeatureDisabled};
}
constexpr Error err_from(ErrorCode code, Dim a) noexcept {
		return {code, a};
}

// stable lower_snake name, never null
const char* error_code_name(ErrorCode code) noexcept;
} // namespace lusolve
