#pragma once
#include <span>
#include <string_view>

namespace rigkit::mixamo {
///
/// \brief Namespace prefix of every Mixamo joint name.
///
inline constexpr std::string_view prefix_v{"mixamorig:"};
///
/// \brief Wrapper joint inserted above the skeleton root by glTF importers.
///
inline constexpr std::string_view root_joint_v{"_rootJoint"};

///
/// \brief The closed set of canonical Mixamo joint names.
///
std::span<std::string_view const> canonical_names();
bool is_canonical(std::string_view name);
} // namespace rigkit::mixamo
