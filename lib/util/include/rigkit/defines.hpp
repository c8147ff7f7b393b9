#pragma once
#include <cstdint>

namespace rigkit {
struct Version {
	std::uint32_t major{};
	std::uint32_t minor{};
	std::uint32_t patch{};
};

inline constexpr auto version_v = Version{0, 3, 0};

#if defined(RIGKIT_DEBUG)
inline constexpr bool debug_v = true;
#else
inline constexpr bool debug_v = false;
#endif
} // namespace rigkit
