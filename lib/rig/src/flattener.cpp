#include <rigkit/rig/flattener.hpp>
#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/scene/print.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace rigkit {
namespace {
std::string to_lower(std::string_view in) {
	auto ret = std::string{in};
	for (char& c : ret) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
	return ret;
}

std::vector<FlattenReport::Binding> find_bindings(Scene const& scene, std::span<Id<Node> const> meshes, Id<Node> armature) {
	auto ret = std::vector<FlattenReport::Binding>{};
	for (auto const id : meshes) {
		for (auto const& modifier : scene.get(id).modifiers) {
			if (modifier.type == Modifier::Type::eArmature && modifier.object == armature) {
				ret.push_back({id, modifier.name});
				break;
			}
		}
	}
	return ret;
}

struct Descendants {
	bool armature{};
	bool mesh{};
};

Descendants rig_descendants(Scene const& scene, Id<Node> id) {
	auto ret = Descendants{};
	for (auto const descendant : scene.descendants(id)) {
		auto const& node = scene.get(descendant);
		ret.armature |= node.is(NodeType::eArmature);
		ret.mesh |= node.is(NodeType::eMesh);
	}
	return ret;
}

void log_result(Scene const& scene, Id<Node> armature) {
	auto const& node = scene.get(armature);
	logger::info("Hierarchy flattened; armature is now named: {}", node.name);
	auto const* data = scene.armature(armature);
	if (!data || data->bone_count() == 0) {
		logger::info("Root bone: None");
	} else {
		for (auto const root : data->roots()) { logger::info("Root bone: {}", data->bones()[root].name); }
		logger::info("Bone hierarchy:\n{}", print_bones(*data));
	}
	logger::info("Final scene hierarchy:\n{}", print_hierarchy(scene));
}
} // namespace

bool is_wrapper_name(std::string_view const name, std::span<std::string const> tokens) {
	auto const lower = to_lower(name);
	return std::any_of(tokens.begin(), tokens.end(), [&lower](std::string const& token) {
		return !token.empty() && lower.find(to_lower(token)) != std::string::npos;
	});
}

std::vector<Id<Node>> find_wrappers(Scene const& scene, std::span<std::string const> tokens) {
	auto ret = std::vector<Id<Node>>{};
	for (auto const& node : scene.nodes()) {
		if (!node.is(NodeType::eEmpty)) { continue; }
		auto const descendants = rig_descendants(scene, node.id());
		if (descendants.armature) { continue; }
		if (!descendants.mesh || is_wrapper_name(node.name, tokens)) { ret.push_back(node.id()); }
	}
	return ret;
}

bool remove_root_joint(Scene& scene, Id<Node> const node, std::string_view const root_joint) noexcept(false) {
	auto scope = ModeScope{scene, InteractionMode::eEdit, node};
	auto& armature = scene.edit_bones(node);
	auto const joint = armature.find_id(root_joint);
	if (!joint || armature.bones()[*joint].parent) { return false; }
	auto const children = armature.children(*joint);
	if (children.empty()) {
		logger::warn("Root joint {} has no child bone; leaving it in place", root_joint);
		return false;
	}
	auto& child = armature.bones()[children.front()];
	child.parent.reset();
	child.connected = false;
	auto const child_name = child.name;
	armature.remove(*joint);
	logger::info("Removed {} bone, {} is now the root", root_joint, child_name);
	return true;
}

bool flatten(Scene& scene, FlattenInfo const& info, Ptr<FlattenReport> out_report) noexcept(false) {
	auto const armature = scene.find_first(NodeType::eArmature);
	if (!armature) {
		logger::error("No armature found in scene {}", scene.name);
		return false;
	}
	auto report = FlattenReport{.armature = *armature};
	logger::info("Found armature: {}", scene.get(*armature).name);

	auto const meshes = scene.find_all(NodeType::eMesh);
	logger::info("Found {} mesh objects", meshes.size());
	report.bindings = find_bindings(scene, meshes, *armature);
	if (report.bindings.empty()) { logger::warn("No rigged mesh bound to armature {}", scene.get(*armature).name); }

	if (auto const parent = scene.get(*armature).parent()) {
		auto const parent_name = scene.get(*parent).name;
		if (scene.clear_parent(*armature)) { logger::info("Unparented armature from {}", parent_name); }
	}

	auto& armature_node = scene.get(*armature);
	auto const old_name = std::exchange(armature_node.name, info.armature_name);
	if (auto* data = scene.armature(*armature)) { data->name = info.armature_name; }
	logger::info("Renamed armature from '{}' to '{}'", old_name, info.armature_name);

	for (auto const mesh : meshes) {
		auto const parent = scene.get(mesh).parent();
		if (!parent || *parent == *armature || !scene.clear_parent(mesh)) { continue; }
		report.detached.push_back(mesh);
		logger::info("Unparented mesh '{}'", scene.get(mesh).name);
	}

	if (info.strip_root_joint) { report.root_joint_removed = remove_root_joint(scene, *armature, info.root_joint); }

	for (auto const wrapper : find_wrappers(scene, info.wrapper_tokens)) {
		auto name = scene.get(wrapper).name;
		if (!scene.remove(wrapper)) { continue; }
		logger::info("Deleting empty wrapper: {}", name);
		report.deleted.push_back(std::move(name));
	}

	auto& transform = scene.get(*armature).transform;
	transform.set_position({});
	transform.set_orientation(quat_identity_v);

	log_result(scene, *armature);
	if (out_report) { *out_report = std::move(report); }
	return true;
}
} // namespace rigkit
