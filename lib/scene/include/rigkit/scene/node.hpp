#pragma once
#include <rigkit/scene/id.hpp>
#include <rigkit/util/enum_array.hpp>
#include <rigkit/util/transform.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit {
class Armature;

enum class NodeType : std::uint8_t { eArmature, eMesh, eEmpty, eOther, eCOUNT_ };

inline constexpr auto node_type_str = EnumArray<NodeType, std::string_view>{"ARMATURE", "MESH", "EMPTY", "OTHER"};

struct Node;

///
/// \brief Mesh deformer; an armature modifier binds a mesh to an armature node.
///
struct Modifier {
	enum class Type : std::uint8_t { eArmature, eOther };

	std::string name{};
	Type type{Type::eArmature};
	std::optional<Id<Node>> object{};
};

///
/// \brief Scene object.
///
/// Hierarchy links are owned by Scene; use Scene::set_parent / clear_parent to change them.
///
struct Node {
	Transform transform{};
	std::vector<Modifier> modifiers{};
	std::string name{};
	NodeType type{NodeType::eEmpty};
	std::optional<Id<Armature>> armature{};

	Id<Node> id() const { return m_id; }
	std::optional<Id<Node>> parent() const { return m_parent; }
	std::span<Id<Node> const> children() const { return m_children; }

	bool is(NodeType const t) const { return type == t; }

  private:
	std::vector<Id<Node>> m_children{};
	std::optional<Id<Node>> m_parent{};
	Id<Node> m_id{};

	friend class Scene;
};
} // namespace rigkit
