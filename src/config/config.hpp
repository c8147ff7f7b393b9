#pragma once
#include <rigkit/rig/canonicalizer.hpp>
#include <rigkit/rig/flattener.hpp>
#include <rigkit/rig/rig_builder.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace rigkit {
struct Config {
	struct {
		std::string armature_name{"Armature"};
		std::vector<std::string> wrapper_tokens{"sketchfab", "fbx"};
		std::string root_joint{mixamo::root_joint_v};
		bool strip_root_joint{};
	} flatten{};

	struct {
		std::string prefix{mixamo::prefix_v};
		std::size_t display_cap{10};
	} canonicalize{};

	struct {
		float frame_rate{24.0f};
	} generate{};

	FlattenInfo flatten_info() const;
	CanonicalizeInfo canonicalize_info() const;
	RigInfo rig_info() const;

	static Config load(char const* path);
	bool save(char const* path) const;
};
} // namespace rigkit
