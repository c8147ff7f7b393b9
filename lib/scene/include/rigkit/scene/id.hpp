#pragma once
#include <concepts>
#include <cstdint>
#include <functional>

namespace rigkit {
///
/// \brief Represents a strongly-typed integral ID.
///
/// Primarily used for items owned by a Scene.
///
template <typename Type, std::integral Value = std::size_t>
class Id {
  public:
	using id_type = Value;

	struct Hasher {
		std::size_t operator()(Id const& id) const { return std::hash<Value>{}(id.value()); }
	};

	///
	/// \brief Implicit constructor
	/// \param value The underlying value of this instance
	///
	constexpr Id(Value value = {}) : m_value(value) {}

	constexpr Value value() const { return m_value; }
	constexpr operator Value() const { return value(); }

	bool operator==(Id const&) const = default;

  private:
	Value m_value{};
};
} // namespace rigkit
