#include <fmt/format.h>
#include <rigkit/scene/armature.hpp>
#include <rigkit/util/error.hpp>

namespace rigkit {
Id<Bone> Armature::add(Bone bone) noexcept(false) {
	if (find(bone.name)) { throw SceneError{fmt::format("Armature {}: Duplicate bone name: {}", name, bone.name)}; }
	if (bone.parent && *bone.parent >= m_bones.size()) {
		throw SceneError{fmt::format("Armature {}: Invalid parent [{}] for bone {}", name, bone.parent->value(), bone.name)};
	}
	if (!bone.parent) { bone.connected = false; }
	auto const ret = m_bones.size();
	m_bones.push_back(std::move(bone));
	return ret;
}

Ptr<Bone const> Armature::find(Id<Bone> id) const {
	if (id >= m_bones.size()) { return {}; }
	return &m_bones[id];
}

Ptr<Bone> Armature::find(Id<Bone> id) { return const_cast<Ptr<Bone>>(std::as_const(*this).find(id)); }

Ptr<Bone const> Armature::find(std::string_view bone_name) const {
	if (auto const id = find_id(bone_name)) { return &m_bones[*id]; }
	return {};
}

Ptr<Bone> Armature::find(std::string_view bone_name) { return const_cast<Ptr<Bone>>(std::as_const(*this).find(bone_name)); }

std::optional<Id<Bone>> Armature::find_id(std::string_view bone_name) const {
	for (std::size_t i = 0; i < m_bones.size(); ++i) {
		if (m_bones[i].name == bone_name) { return i; }
	}
	return {};
}

bool Armature::rename(Id<Bone> id, std::string new_name) {
	auto* bone = find(id);
	if (!bone) { return false; }
	if (auto const existing = find_id(new_name); existing && *existing != id) { return false; }
	bone->name = std::move(new_name);
	return true;
}

bool Armature::remove(Id<Bone> id) {
	if (id >= m_bones.size()) { return false; }
	auto const parent = m_bones[id].parent;
	for (auto& bone : m_bones) {
		if (bone.parent && *bone.parent == id) {
			bone.parent = parent;
			if (!parent) { bone.connected = false; }
		}
	}
	m_bones.erase(m_bones.begin() + static_cast<std::ptrdiff_t>(id.value()));
	for (auto& bone : m_bones) {
		if (bone.parent && *bone.parent > id) { bone.parent = bone.parent->value() - 1; }
	}
	return true;
}

std::vector<Id<Bone>> Armature::roots() const {
	auto ret = std::vector<Id<Bone>>{};
	for (std::size_t i = 0; i < m_bones.size(); ++i) {
		if (!m_bones[i].parent) { ret.push_back(i); }
	}
	return ret;
}

std::vector<Id<Bone>> Armature::children(Id<Bone> id) const {
	auto ret = std::vector<Id<Bone>>{};
	for (std::size_t i = 0; i < m_bones.size(); ++i) {
		if (m_bones[i].parent && *m_bones[i].parent == id) { ret.push_back(i); }
	}
	return ret;
}
} // namespace rigkit
