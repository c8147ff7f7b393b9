#pragma once
#include <rigkit/scene/id.hpp>
#include <rigkit/util/transform.hpp>
#include <glm/vec3.hpp>
#include <optional>
#include <string>

namespace rigkit {
enum class RotationMode : std::uint8_t { eEulerXYZ, eQuaternion, eCOUNT_ };

///
/// \brief A single joint of an Armature.
///
/// head and tail are in armature space; roll is in radians.
///
struct Bone {
	struct Pose {
		RotationMode rotation_mode{RotationMode::eEulerXYZ};
		glm::quat rotation{quat_identity_v};
	};

	std::string name{};
	std::optional<Id<Bone>> parent{};
	glm::vec3 head{};
	glm::vec3 tail{0.0f, 0.0f, 1.0f};
	float roll{};
	///
	/// \brief Whether head coincides with the parent's tail.
	///
	bool connected{};
	Pose pose{};
};
} // namespace rigkit
