#include <fmt/format.h>
#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/scene/scene.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>

namespace rigkit {
ModeScope::ModeScope(Scene& scene, InteractionMode mode, std::optional<Id<Node>> active) noexcept(false)
	: m_scene(scene), m_previous_active(scene.m_active), m_previous(scene.m_mode) {
	auto const target = active ? active : scene.m_active;
	if (mode != InteractionMode::eObject) {
		if (!target || !scene.armature(*target)) {
			throw SceneError{fmt::format("Scene {}: {} mode requires an active armature", scene.name, interaction_mode_str[mode])};
		}
	}
	if (target && !scene.find(*target)) { throw SceneError{fmt::format("Scene {}: Invalid active Node Id: {}", scene.name, target->value())}; }
	scene.m_active = target;
	scene.m_mode = mode;
	logger::debug("[ModeScope] {} -> {}", interaction_mode_str[m_previous], interaction_mode_str[mode]);
}

ModeScope::~ModeScope() {
	m_scene.m_mode = m_previous;
	m_scene.m_active = m_previous_active && m_scene.find(*m_previous_active) ? m_previous_active : std::nullopt;
}
} // namespace rigkit
