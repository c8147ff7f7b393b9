#pragma once
#include <rigkit/rig/vocabulary.hpp>
#include <rigkit/scene/scene.hpp>
#include <rigkit/util/ptr.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit {
struct FlattenInfo {
	///
	/// \brief Name assigned to both the armature node and its armature data block.
	///
	std::string armature_name{"Armature"};
	///
	/// \brief Empties whose names contain any of these (case-insensitive) are always deleted.
	///
	std::vector<std::string> wrapper_tokens{"sketchfab", "fbx"};
	std::string root_joint{mixamo::root_joint_v};
	///
	/// \brief Whether to remove the importer's wrapper joint above the skeleton root.
	///
	bool strip_root_joint{};
};

struct FlattenReport {
	struct Binding {
		Id<Node> mesh{};
		std::string modifier{};
	};

	Id<Node> armature{};
	///
	/// \brief Mesh -> armature modifier associations recorded before any re-parenting.
	///
	std::vector<Binding> bindings{};
	std::vector<Id<Node>> detached{};
	std::vector<std::string> deleted{};
	bool root_joint_removed{};
};

///
/// \brief Whether name contains any of tokens, ignoring case.
///
bool is_wrapper_name(std::string_view name, std::span<std::string const> tokens);

///
/// \brief Collect the empties that flatten() deletes.
///
/// An empty with an armature below it is never collected. Otherwise it is collected if
/// nothing below it is a mesh, or if its name is a wrapper name.
///
std::vector<Id<Node>> find_wrappers(Scene const& scene, std::span<std::string const> tokens);

///
/// \brief Remove the wrapper joint root_joint from the armature of node, promoting its first child bone to a root.
/// \returns false if there is no such root bone or it has no children
///
/// Enters eEdit mode on node for the duration of the call.
///
bool remove_root_joint(Scene& scene, Id<Node> node, std::string_view root_joint) noexcept(false);

///
/// \brief Flatten an imported hierarchy so the first armature sits at the scene root.
/// \param scene Scene to modify
/// \param info Flatten options
/// \param out_report Optional report of what was changed
/// \returns false if the scene contains no armature node
///
/// World transforms of the armature and all meshes are preserved while detaching;
/// the armature's translation and rotation are then reset (scale is kept).
///
bool flatten(Scene& scene, FlattenInfo const& info = {}, Ptr<FlattenReport> out_report = {}) noexcept(false);
} // namespace rigkit
