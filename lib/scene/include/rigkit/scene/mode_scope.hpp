#pragma once
#include <rigkit/scene/id.hpp>
#include <rigkit/util/enum_array.hpp>
#include <rigkit/util/pinned.hpp>
#include <optional>
#include <string_view>

namespace rigkit {
class Scene;
struct Node;

///
/// \brief Host interaction mode; bone topology is editable only in eEdit, pose data only in ePose.
///
enum class InteractionMode : std::uint8_t { eObject, eEdit, ePose, eCOUNT_ };

inline constexpr auto interaction_mode_str = EnumArray<InteractionMode, std::string_view>{"OBJECT", "EDIT", "POSE"};

///
/// \brief RAII mode switch: enters a mode with a given active node, restores both on destruction.
///
/// Entering eEdit / ePose requires the target to be an armature node (throws SceneError otherwise).
///
class ModeScope : public Pinned {
  public:
	ModeScope(Scene& scene, InteractionMode mode, std::optional<Id<Node>> active = {}) noexcept(false);
	~ModeScope();

	InteractionMode previous() const { return m_previous; }

  private:
	Scene& m_scene;
	std::optional<Id<Node>> m_previous_active{};
	InteractionMode m_previous{};
};
} // namespace rigkit
