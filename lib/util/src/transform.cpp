#include <glm/gtx/matrix_decompose.hpp>
#include <rigkit/util/transform.hpp>

namespace rigkit {
Transform& Transform::set_matrix(glm::mat4 const& mat) {
	glm::vec3 scale, pos, skew;
	glm::vec4 persp;
	glm::quat orn;
	if (!glm::decompose(mat, scale, orn, pos, skew, persp)) { return *this; }
	m_data = {.position = pos, .orientation = orn, .scale = scale};
	return set_dirty();
}
} // namespace rigkit
