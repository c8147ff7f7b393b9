#include <fmt/format.h>
#include <glm/matrix.hpp>
#include <rigkit/scene/scene.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>

namespace rigkit {
namespace {
template <typename Nodes>
auto find_node(Nodes&& nodes, Id<Node> const id) -> decltype(&nodes.front()) {
	auto const it = std::lower_bound(nodes.begin(), nodes.end(), id, [](Node const& n, Id<Node> i) { return n.id() < i; });
	if (it == nodes.end() || it->id() != id) { return nullptr; }
	return &*it;
}
} // namespace

Id<Node> Scene::add(Node node, std::optional<Id<Node>> parent) noexcept(false) {
	if (parent && !find(*parent)) { throw SceneError{fmt::format("Scene {}: Invalid parent Node Id: {}", name, parent->value())}; }
	if (node.armature && *node.armature >= m_resources.armatures.size()) {
		throw SceneError{fmt::format("Scene {}: Invalid armature [{}] in node {}", name, node.armature->value(), node.name)};
	}
	for (auto const& modifier : node.modifiers) {
		if (modifier.object && !find(*modifier.object)) {
			throw SceneError{fmt::format("Scene {}: Invalid modifier target [{}] in node {}", name, modifier.object->value(), node.name)};
		}
	}
	auto const ret = Id<Node>{m_next_node++};
	node.m_id = ret;
	node.m_parent.reset();
	node.m_children.clear();
	m_nodes.push_back(std::move(node));
	if (parent) { link(m_nodes.back(), *parent); }
	return ret;
}

Id<Armature> Scene::add(Armature armature) {
	auto const id = m_resources.armatures.size();
	m_resources.armatures.m_array.push_back(std::move(armature));
	return id;
}

Id<Clip> Scene::add(Clip clip) {
	auto const id = m_resources.clips.size();
	m_resources.clips.m_array.push_back(std::move(clip));
	return id;
}

Ptr<Node> Scene::find(Id<Node> id) { return find_node(m_nodes, id); }

Ptr<Node const> Scene::find(Id<Node> id) const { return find_node(m_nodes, id); }

Ptr<Node const> Scene::find(std::string_view node_name) const {
	auto const it = std::find_if(m_nodes.begin(), m_nodes.end(), [node_name](Node const& n) { return n.name == node_name; });
	return it == m_nodes.end() ? nullptr : &*it;
}

Node& Scene::get(Id<Node> id) noexcept(false) { return const_cast<Node&>(std::as_const(*this).get(id)); }

Node const& Scene::get(Id<Node> id) const noexcept(false) {
	auto const* ret = find(id);
	if (!ret) { throw SceneError{fmt::format("Scene {}: Invalid Node Id: {}", name, id.value())}; }
	return *ret;
}

std::optional<Id<Node>> Scene::find_first(NodeType type) const {
	for (auto const& node : m_nodes) {
		if (node.is(type)) { return node.id(); }
	}
	return {};
}

std::vector<Id<Node>> Scene::find_all(NodeType type) const {
	auto ret = std::vector<Id<Node>>{};
	for (auto const& node : m_nodes) {
		if (node.is(type)) { ret.push_back(node.id()); }
	}
	return ret;
}

Ptr<Armature> Scene::armature(Id<Node> node) { return const_cast<Ptr<Armature>>(std::as_const(*this).armature(node)); }

Ptr<Armature const> Scene::armature(Id<Node> node) const {
	auto const* n = find(node);
	if (!n || !n->is(NodeType::eArmature) || !n->armature) { return {}; }
	return m_resources.armatures.find(*n->armature);
}

Armature& Scene::edit_bones(Id<Node> node) noexcept(false) {
	if (m_mode != InteractionMode::eEdit || m_active != node) {
		throw SceneError{fmt::format("Scene {}: Bone edits on node [{}] require EDIT mode with it active", name, node.value())};
	}
	auto* ret = armature(node);
	if (!ret) { throw SceneError{fmt::format("Scene {}: Node [{}] has no armature", name, node.value())}; }
	return *ret;
}

Armature& Scene::pose_bones(Id<Node> node) noexcept(false) {
	if (m_mode != InteractionMode::ePose || m_active != node) {
		throw SceneError{fmt::format("Scene {}: Pose edits on node [{}] require POSE mode with it active", name, node.value())};
	}
	auto* ret = armature(node);
	if (!ret) { throw SceneError{fmt::format("Scene {}: Node [{}] has no armature", name, node.value())}; }
	return *ret;
}

std::vector<Id<Node>> Scene::roots() const {
	auto ret = std::vector<Id<Node>>{};
	for (auto const& node : m_nodes) {
		if (!node.parent()) { ret.push_back(node.id()); }
	}
	return ret;
}

std::vector<Id<Node>> Scene::descendants(Id<Node> id) const {
	auto ret = std::vector<Id<Node>>{};
	auto stack = std::vector<Id<Node>>{};
	auto const& root = get(id);
	stack.assign(root.children().rbegin(), root.children().rend());
	while (!stack.empty()) {
		auto const current = stack.back();
		stack.pop_back();
		ret.push_back(current);
		auto const& node = get(current);
		stack.insert(stack.end(), node.children().rbegin(), node.children().rend());
	}
	return ret;
}

glm::mat4 Scene::world_matrix(Id<Node> id) const noexcept(false) {
	auto const* node = &get(id);
	auto ret = node->transform.matrix();
	while (node->parent()) {
		node = &get(*node->parent());
		ret = node->transform.matrix() * ret;
	}
	return ret;
}

void Scene::set_world_matrix(Id<Node> id, glm::mat4 const& world) noexcept(false) {
	auto& node = get(id);
	auto const parent_world = node.parent() ? world_matrix(*node.parent()) : matrix_identity_v;
	node.transform.set_matrix(glm::inverse(parent_world) * world);
}

void Scene::set_parent(Id<Node> id, std::optional<Id<Node>> parent) noexcept(false) {
	if (parent) { check_parent(id, *parent); }
	auto const world = world_matrix(id);
	auto& node = get(id);
	unlink(node);
	if (parent) { link(node, *parent); }
	set_world_matrix(id, world);
}

bool Scene::clear_parent(Id<Node> id) noexcept(false) {
	if (!get(id).parent()) { return false; }
	set_parent(id, std::nullopt);
	return true;
}

bool Scene::remove(Id<Node> id) {
	auto const* node = find(id);
	if (!node) { return false; }
	auto const parent = node->parent();
	auto const children = node->m_children;
	for (auto const child : children) { set_parent(child, parent); }
	unlink(get(id));
	for (auto& other : m_nodes) {
		for (auto& modifier : other.modifiers) {
			if (modifier.object == id) { modifier.object.reset(); }
		}
	}
	if (m_active == id) { m_active.reset(); }
	auto const it = std::lower_bound(m_nodes.begin(), m_nodes.end(), id, [](Node const& n, Id<Node> i) { return n.id() < i; });
	m_nodes.erase(it);
	return true;
}

void Scene::clear() {
	logger::debug("[Scene] {}: clearing {} nodes, {} clips", name, m_nodes.size(), m_resources.clips.size());
	m_nodes.clear();
	m_resources = {};
	m_active.reset();
}

void Scene::check_parent(Id<Node> id, Id<Node> parent) const noexcept(false) {
	if (parent == id) { throw SceneError{fmt::format("Scene {}: Node [{}] cannot be its own parent", name, id.value())}; }
	get(parent);
	for (auto const descendant : descendants(id)) {
		if (descendant == parent) { throw SceneError{fmt::format("Scene {}: Parenting [{}] to [{}] would form a cycle", name, id.value(), parent.value())}; }
	}
}

void Scene::unlink(Node& node) {
	if (!node.m_parent) { return; }
	if (auto* parent = find(*node.m_parent)) { std::erase(parent->m_children, node.m_id); }
	node.m_parent.reset();
}

void Scene::link(Node& node, Id<Node> parent) {
	node.m_parent = parent;
	get(parent).m_children.push_back(node.m_id);
}
} // namespace rigkit
