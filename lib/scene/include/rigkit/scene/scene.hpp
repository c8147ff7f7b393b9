#pragma once
#include <glm/mat4x4.hpp>
#include <rigkit/scene/animation.hpp>
#include <rigkit/scene/armature.hpp>
#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/scene/node.hpp>
#include <rigkit/scene/resource_array.hpp>
#include <rigkit/util/ptr.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rigkit {
///
/// \brief Data blocks referenced by nodes.
///
struct SceneResources {
	ResourceArray<Armature> armatures{};
	ResourceArray<Clip> clips{};
};

///
/// \brief Models a scene graph: a forest of Nodes plus the data blocks they reference.
///
/// Node Ids are stable: removing a node does not invalidate the Ids of other nodes.
/// Nodes are kept in creation order.
///
class Scene {
  public:
	using Resources = SceneResources;

	///
	/// \brief Add a Node.
	/// \param node Node instance to add
	/// \param parent Node to parent to (if any)
	/// \returns Id to stored Node
	///
	/// node.transform is interpreted as local to parent.
	///
	Id<Node> add(Node node, std::optional<Id<Node>> parent = std::nullopt) noexcept(false);
	///
	/// \brief Add an Armature data block.
	/// \param armature Armature instance to add
	/// \returns Id to stored Armature
	///
	Id<Armature> add(Armature armature);
	///
	/// \brief Add a Clip.
	/// \param clip Clip instance to add
	/// \returns Id to stored Clip
	///
	Id<Clip> add(Clip clip);

	///
	/// \brief Obtain a pointer to the Node with the given Id.
	/// \returns nullptr if no such node exists
	///
	Ptr<Node> find(Id<Node> id);
	Ptr<Node const> find(Id<Node> id) const;
	///
	/// \brief Obtain the first node (in creation order) with the given name.
	///
	Ptr<Node const> find(std::string_view name) const;
	///
	/// \brief Obtain a reference to the Node with the given Id.
	///
	/// Throws SceneError if no such node exists.
	///
	Node& get(Id<Node> id) noexcept(false);
	Node const& get(Id<Node> id) const noexcept(false);

	///
	/// \brief Obtain the first node of the given type, in creation order.
	///
	std::optional<Id<Node>> find_first(NodeType type) const;
	///
	/// \brief Obtain all nodes of the given type, in creation order.
	///
	std::vector<Id<Node>> find_all(NodeType type) const;

	///
	/// \brief Obtain the armature data block of an armature node.
	/// \returns nullptr if node is not an armature or has no data
	///
	Ptr<Armature> armature(Id<Node> node);
	Ptr<Armature const> armature(Id<Node> node) const;
	///
	/// \brief Obtain the armature of the active node for bone topology edits.
	///
	/// Throws SceneError unless the scene is in eEdit mode with node active.
	///
	Armature& edit_bones(Id<Node> node) noexcept(false);
	///
	/// \brief Obtain the armature of the active node for pose edits.
	///
	/// Throws SceneError unless the scene is in ePose mode with node active.
	///
	Armature& pose_bones(Id<Node> node) noexcept(false);

	std::span<Node const> nodes() const { return m_nodes; }
	std::size_t node_count() const { return m_nodes.size(); }
	std::vector<Id<Node>> roots() const;
	///
	/// \brief Obtain all descendants of a node (depth-first, pre-order).
	///
	std::vector<Id<Node>> descendants(Id<Node> id) const;

	///
	/// \brief Obtain the world (model) matrix of a node.
	///
	glm::mat4 world_matrix(Id<Node> id) const noexcept(false);
	///
	/// \brief Set the local transform of a node such that its world matrix equals world.
	///
	void set_world_matrix(Id<Node> id, glm::mat4 const& world) noexcept(false);
	///
	/// \brief Re-parent a node, preserving its world transform.
	///
	/// Throws SceneError if parent is the node itself or one of its descendants.
	///
	void set_parent(Id<Node> id, std::optional<Id<Node>> parent) noexcept(false);
	///
	/// \brief Detach a node from its parent, preserving its world transform.
	/// \returns false if the node had no parent
	///
	bool clear_parent(Id<Node> id) noexcept(false);
	///
	/// \brief Delete a node.
	/// \returns false if no such node exists
	///
	/// Children of the removed node are re-parented to its parent, world transforms preserved.
	/// Modifiers targeting the removed node are unbound.
	///
	bool remove(Id<Node> id);
	///
	/// \brief Delete all nodes, armatures and clips.
	///
	void clear();

	InteractionMode mode() const { return m_mode; }
	std::optional<Id<Node>> active() const { return m_active; }

	Resources& resources() { return m_resources; }
	Resources const& resources() const { return m_resources; }

	std::string name{"Scene"};

  private:
	void check_parent(Id<Node> id, Id<Node> parent) const noexcept(false);
	void unlink(Node& node);
	void link(Node& node, Id<Node> parent);

	std::vector<Node> m_nodes{};
	Resources m_resources{};
	std::optional<Id<Node>> m_active{};
	Id<Node>::id_type m_next_node{};
	InteractionMode m_mode{InteractionMode::eObject};

	friend class ModeScope;
};
} // namespace rigkit
