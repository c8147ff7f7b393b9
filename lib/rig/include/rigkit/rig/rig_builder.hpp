#pragma once
#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>
#include <rigkit/scene/scene.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace rigkit {
///
/// \brief Declarative description of a single bone.
///
/// head is an offset from the parent's tail (or from the rig origin for a root bone);
/// tail is an offset from the resulting head.
///
struct BoneSpec {
	std::string_view name{};
	///
	/// \brief Empty for root bones.
	///
	std::string_view parent{};
	glm::vec3 head{};
	glm::vec3 tail{};
	float roll{};
};

struct ClipSpec {
	std::string_view name{};
	float seconds{};
	bool looping{};
};

///
/// \brief A bone with its armature-space head / tail computed.
///
struct ResolvedBone {
	std::string_view name{};
	std::string_view parent{};
	glm::vec3 head{};
	glm::vec3 tail{};
	float roll{};
	bool connected{};
};

inline constexpr glm::vec3 pelvis_origin_v{0.0f, 0.0f, 1.0f};
///
/// \brief Mid-clip keyframe rotation (w, x, y, z).
///
inline constexpr glm::quat perturbation_v{0.998f, 0.01f, 0.01f, 0.01f};

///
/// \brief The 65-bone Mixamo skeleton, parents listed before children.
///
std::span<BoneSpec const> mixamo_bone_table();
///
/// \brief The player clip set, in declaration order.
///
std::span<ClipSpec const> player_clip_table();
///
/// \brief Bones animated by clips prefixed "lower_".
///
std::span<std::string_view const> lower_body_bones();
///
/// \brief Bones animated by all other clips.
///
std::span<std::string_view const> upper_body_bones();

///
/// \brief Number of frames for a clip of the given duration: max(2, round(seconds * fps)).
///
std::uint32_t frame_count(float seconds, float fps);

///
/// \brief Compute armature-space heads and tails for bones.
/// \returns Resolved bones, each listed after its parent
///
/// Bones whose parent appears later in the table are deferred until it resolves.
/// Throws SceneError if a parent does not exist or the parent links form a cycle.
///
std::vector<ResolvedBone> resolve(std::span<BoneSpec const> bones, glm::vec3 origin = pelvis_origin_v) noexcept(false);

struct RigInfo {
	std::string_view armature_name{"Armature"};
	float frame_rate{24.0f};
	glm::vec3 origin{pelvis_origin_v};
	std::span<BoneSpec const> bones{mixamo_bone_table()};
	std::span<ClipSpec const> clips{player_clip_table()};
	std::span<std::string_view const> lower_body{lower_body_bones()};
	std::span<std::string_view const> upper_body{upper_body_bones()};
	std::string_view lower_prefix{"lower_"};
};

struct Rig {
	Id<Node> armature{};
	///
	/// \brief Generated clips, in declaration order.
	///
	std::vector<Id<Clip>> clips{};
};

///
/// \brief Replace the contents of scene with a generated armature and placeholder clips.
///
/// Every clip gets one muted NLA track; tracks are created in reverse declaration order,
/// so the first declared clip ends up on top of the stack. No clip is left active.
///
Rig build_rig_and_animations(Scene& scene, RigInfo const& info = {}) noexcept(false);
} // namespace rigkit
