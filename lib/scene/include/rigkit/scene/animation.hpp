#pragma once
#include <rigkit/scene/id.hpp>
#include <rigkit/util/transform.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit {
template <typename T>
struct Timeline {
	struct Keyframe {
		T value{};
		std::uint32_t frame{};
	};

	std::vector<Keyframe> keyframes{};

	///
	/// \brief Insert a keyframe, replacing any existing keyframe at the same frame.
	///
	Keyframe& insert(std::uint32_t frame, T value) {
		auto it = std::lower_bound(keyframes.begin(), keyframes.end(), frame, [](Keyframe const& k, std::uint32_t f) { return k.frame < f; });
		if (it != keyframes.end() && it->frame == frame) {
			it->value = value;
			return *it;
		}
		return *keyframes.insert(it, Keyframe{value, frame});
	}

	std::optional<T> at(std::uint32_t frame) const {
		for (auto const& keyframe : keyframes) {
			if (keyframe.frame == frame) { return keyframe.value; }
		}
		return {};
	}
};

///
/// \brief Rotation keyframes bound to a bone by name.
///
struct Channel {
	std::string bone{};
	Timeline<glm::quat> rotation{};
};

///
/// \brief A named animation (an "action"): per-bone rotation channels over a frame range.
///
struct Clip {
	std::string name{};
	std::uint32_t frame_count{};
	float frame_rate{24.0f};
	///
	/// \brief Informational only.
	///
	bool looping{};
	std::vector<Channel> channels{};

	Channel& channel(std::string_view bone);
	Channel const* find(std::string_view bone) const;
};

///
/// \brief A non-linear animation track holding a single Clip strip.
///
struct NlaTrack {
	std::string name{};
	Id<Clip> clip{};
	std::uint32_t start_frame{1};
	bool mute{};
};

///
/// \brief Animation state of an armature.
///
struct AnimationData {
	std::optional<Id<Clip>> active{};
	///
	/// \brief Track stack, bottom first.
	///
	std::vector<NlaTrack> tracks{};

	///
	/// \brief Create a track on top of the stack.
	///
	NlaTrack& push_track(NlaTrack track) { return tracks.emplace_back(std::move(track)); }
};
} // namespace rigkit
