#pragma once
#include <rigkit/scene/animation.hpp>
#include <rigkit/scene/bone.hpp>
#include <rigkit/util/ptr.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace rigkit {
///
/// \brief Armature data block: a named set of bones plus its animation state.
///
/// Bone Ids are indices into bones(); removing a bone shifts the Ids of all bones after it.
///
class Armature {
  public:
	explicit Armature(std::string name = "Armature") : name(std::move(name)) {}

	///
	/// \brief Add a bone.
	/// \param bone Bone to add (its parent, if any, must already exist)
	/// \returns Id of the new bone
	///
	/// Throws SceneError on duplicate names or invalid parents.
	///
	Id<Bone> add(Bone bone) noexcept(false);

	Ptr<Bone const> find(Id<Bone> id) const;
	Ptr<Bone> find(Id<Bone> id);
	Ptr<Bone const> find(std::string_view bone_name) const;
	Ptr<Bone> find(std::string_view bone_name);
	std::optional<Id<Bone>> find_id(std::string_view bone_name) const;

	///
	/// \brief Rename a bone.
	/// \returns false if another bone already uses new_name
	///
	bool rename(Id<Bone> id, std::string new_name);
	///
	/// \brief Remove a bone, re-parenting its children to its parent.
	/// \returns false if id is out of range
	///
	bool remove(Id<Bone> id);

	std::vector<Id<Bone>> roots() const;
	std::vector<Id<Bone>> children(Id<Bone> id) const;

	std::span<Bone const> bones() const { return m_bones; }
	std::span<Bone> bones() { return m_bones; }
	std::size_t bone_count() const { return m_bones.size(); }

	std::string name{};
	AnimationData animation{};

  private:
	std::vector<Bone> m_bones{};
};
} // namespace rigkit
