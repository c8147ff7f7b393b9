#pragma once
#include <rigkit/scene/scene.hpp>
#include <string>

namespace rigkit {
///
/// \brief Render the node forest as an indented tree, one "- name (TYPE)" line per node.
///
std::string print_hierarchy(Scene const& scene);
///
/// \brief Render the bone hierarchy of armature as an indented tree, one "- name" line per bone.
///
std::string print_bones(Armature const& armature);
} // namespace rigkit
