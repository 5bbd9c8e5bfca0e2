#pragma once

// -----------------------------------------------------------------------------
// Feature flags
// -----------------------------------------------------------------------------
#ifndef LUSOLVE_SHELL_ENABLE_DEBUG
#define LUSOLVE_SHELL_ENABLE_DEBUG 0
#endif

namespace lusolve_shell {
// step buffers for --steps, one rendered step at a time
constexpr unsigned kCaptionBytes = 256;
constexpr unsigned kLatexBytes = 64u * 1024u;
} // namespace lusolve_shell
