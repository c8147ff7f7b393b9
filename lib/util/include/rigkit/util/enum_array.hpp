#pragma once
#include <concepts>
#include <type_traits>
#include <cstddef>

namespace rigkit {
template <typename Type>
concept EnumCount = std::is_enum_v<Type> && requires { Type::eCOUNT_; };

///
/// \brief Fixed-size array indexed by the enumerators of E (which must end with eCOUNT_).
///
template <EnumCount E, typename T, std::size_t Size = static_cast<std::size_t>(E::eCOUNT_)>
struct EnumArray {
	T t[Size]{};

	constexpr T const& operator[](E const e) const { return t[static_cast<std::size_t>(e)]; }
	constexpr T& operator[](E const e) { return t[static_cast<std::size_t>(e)]; }

	static constexpr std::size_t size() { return Size; }
};
} // namespace rigkit
