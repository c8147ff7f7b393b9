#pragma once
#include <rigkit/rig/vocabulary.hpp>
#include <rigkit/scene/scene.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit {
struct CanonicalizeInfo {
	///
	/// \brief Only bones whose names start with prefix are considered.
	///
	std::string_view prefix{mixamo::prefix_v};
	std::span<std::string_view const> vocabulary{mixamo::canonical_names()};
	///
	/// \brief Maximum number of unknown names to log (all are still returned).
	///
	std::size_t display_cap{10};
};

struct CanonicalizeResult {
	std::size_t renamed{};
	std::size_t skipped{};
	std::size_t already_correct{};
	std::vector<std::string> unknown_names{};
};

///
/// \brief Strip a trailing disambiguation suffix ("_" followed by 2 or 3 decimal digits).
/// \returns The remainder, or nullopt if name has no such suffix (or the remainder would be empty)
///
std::optional<std::string_view> strip_numeric_suffix(std::string_view name);

///
/// \brief Resolve the canonical form of a bone name.
/// \returns name itself if canonical, the suffix-stripped name if that is canonical, nullopt otherwise
///
std::optional<std::string_view> canonical_name(std::string_view name, std::span<std::string_view const> vocabulary = mixamo::canonical_names());

///
/// \brief Rename suffixed bones of every armature in scene to their canonical names.
///
/// Renames for each armature are planned against its current bone names, then committed;
/// a rename whose target is already used by a different bone is skipped.
/// Names that cannot be resolved are left untouched and reported in unknown_names.
///
CanonicalizeResult canonicalize(Scene& scene, CanonicalizeInfo const& info = {});
} // namespace rigkit
