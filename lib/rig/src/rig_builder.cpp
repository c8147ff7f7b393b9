#include <fmt/format.h>
#include <rigkit/rig/rig_builder.hpp>
#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/util/enumerate.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <unordered_map>

namespace rigkit {
namespace {
constexpr auto pi_v = std::numbers::pi_v<float>;

BoneSpec const g_bones[] = {
	{"mixamorig:Hips", {}, {}, {0.0f, 0.0f, 0.1f}, 0.0f},
	{"mixamorig:Spine", "mixamorig:Hips", {}, {0.0f, 0.0f, 0.12f}, 0.0f},
	{"mixamorig:Spine1", "mixamorig:Spine", {}, {0.0f, 0.0f, 0.12f}, 0.0f},
	{"mixamorig:Spine2", "mixamorig:Spine1", {}, {0.0f, 0.0f, 0.12f}, 0.0f},
	{"mixamorig:Neck", "mixamorig:Spine2", {}, {0.0f, 0.0f, 0.08f}, 0.0f},
	{"mixamorig:Head", "mixamorig:Neck", {}, {0.0f, 0.0f, 0.2f}, 0.0f},
	{"mixamorig:HeadTop_End", "mixamorig:Head", {}, {0.0f, 0.0f, 0.1f}, 0.0f},
	{"mixamorig:LeftShoulder", "mixamorig:Spine2", {0.05f, 0.0f, -0.02f}, {0.12f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftArm", "mixamorig:LeftShoulder", {}, {0.28f, 0.0f, 0.0f}, pi_v},
	{"mixamorig:LeftForeArm", "mixamorig:LeftArm", {}, {0.25f, 0.0f, 0.0f}, pi_v},
	{"mixamorig:LeftHand", "mixamorig:LeftForeArm", {}, {0.08f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandThumb1", "mixamorig:LeftHand", {-0.02f, 0.02f, 0.0f}, {0.03f, 0.02f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandThumb2", "mixamorig:LeftHandThumb1", {}, {0.025f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandThumb3", "mixamorig:LeftHandThumb2", {}, {0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandThumb4", "mixamorig:LeftHandThumb3", {}, {0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandIndex1", "mixamorig:LeftHand", {}, {0.04f, 0.01f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandIndex2", "mixamorig:LeftHandIndex1", {}, {0.025f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandIndex3", "mixamorig:LeftHandIndex2", {}, {0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandIndex4", "mixamorig:LeftHandIndex3", {}, {0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandMiddle1", "mixamorig:LeftHand", {}, {0.045f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandMiddle2", "mixamorig:LeftHandMiddle1", {}, {0.03f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandMiddle3", "mixamorig:LeftHandMiddle2", {}, {0.022f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandMiddle4", "mixamorig:LeftHandMiddle3", {}, {0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandRing1", "mixamorig:LeftHand", {}, {0.04f, -0.01f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandRing2", "mixamorig:LeftHandRing1", {}, {0.028f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandRing3", "mixamorig:LeftHandRing2", {}, {0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandRing4", "mixamorig:LeftHandRing3", {}, {0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandPinky1", "mixamorig:LeftHand", {}, {0.035f, -0.02f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandPinky2", "mixamorig:LeftHandPinky1", {}, {0.022f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandPinky3", "mixamorig:LeftHandPinky2", {}, {0.018f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftHandPinky4", "mixamorig:LeftHandPinky3", {}, {0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightShoulder", "mixamorig:Spine2", {-0.05f, 0.0f, -0.02f}, {-0.12f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightArm", "mixamorig:RightShoulder", {}, {-0.28f, 0.0f, 0.0f}, -pi_v},
	{"mixamorig:RightForeArm", "mixamorig:RightArm", {}, {-0.25f, 0.0f, 0.0f}, -pi_v},
	{"mixamorig:RightHand", "mixamorig:RightForeArm", {}, {-0.08f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandThumb1", "mixamorig:RightHand", {0.02f, 0.02f, 0.0f}, {-0.03f, 0.02f, 0.0f}, 0.0f},
	{"mixamorig:RightHandThumb2", "mixamorig:RightHandThumb1", {}, {-0.025f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandThumb3", "mixamorig:RightHandThumb2", {}, {-0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandThumb4", "mixamorig:RightHandThumb3", {}, {-0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandIndex1", "mixamorig:RightHand", {}, {-0.04f, 0.01f, 0.0f}, 0.0f},
	{"mixamorig:RightHandIndex2", "mixamorig:RightHandIndex1", {}, {-0.025f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandIndex3", "mixamorig:RightHandIndex2", {}, {-0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandIndex4", "mixamorig:RightHandIndex3", {}, {-0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandMiddle1", "mixamorig:RightHand", {}, {-0.045f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandMiddle2", "mixamorig:RightHandMiddle1", {}, {-0.03f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandMiddle3", "mixamorig:RightHandMiddle2", {}, {-0.022f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandMiddle4", "mixamorig:RightHandMiddle3", {}, {-0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandRing1", "mixamorig:RightHand", {}, {-0.04f, -0.01f, 0.0f}, 0.0f},
	{"mixamorig:RightHandRing2", "mixamorig:RightHandRing1", {}, {-0.028f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandRing3", "mixamorig:RightHandRing2", {}, {-0.02f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandRing4", "mixamorig:RightHandRing3", {}, {-0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandPinky1", "mixamorig:RightHand", {}, {-0.035f, -0.02f, 0.0f}, 0.0f},
	{"mixamorig:RightHandPinky2", "mixamorig:RightHandPinky1", {}, {-0.022f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandPinky3", "mixamorig:RightHandPinky2", {}, {-0.018f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:RightHandPinky4", "mixamorig:RightHandPinky3", {}, {-0.015f, 0.0f, 0.0f}, 0.0f},
	{"mixamorig:LeftUpLeg", "mixamorig:Hips", {0.1f, 0.0f, 0.0f}, {0.1f, 0.0f, -0.45f}, 0.0f},
	{"mixamorig:LeftLeg", "mixamorig:LeftUpLeg", {}, {0.0f, 0.0f, -0.42f}, 0.0f},
	{"mixamorig:LeftFoot", "mixamorig:LeftLeg", {}, {0.0f, -0.12f, 0.03f}, 0.0f},
	{"mixamorig:LeftToeBase", "mixamorig:LeftFoot", {}, {0.0f, -0.08f, 0.0f}, 0.0f},
	{"mixamorig:LeftToe_End", "mixamorig:LeftToeBase", {}, {0.0f, -0.04f, 0.0f}, 0.0f},
	{"mixamorig:RightUpLeg", "mixamorig:Hips", {-0.1f, 0.0f, 0.0f}, {-0.1f, 0.0f, -0.45f}, 0.0f},
	{"mixamorig:RightLeg", "mixamorig:RightUpLeg", {}, {0.0f, 0.0f, -0.42f}, 0.0f},
	{"mixamorig:RightFoot", "mixamorig:RightLeg", {}, {0.0f, -0.12f, 0.03f}, 0.0f},
	{"mixamorig:RightToeBase", "mixamorig:RightFoot", {}, {0.0f, -0.08f, 0.0f}, 0.0f},
	{"mixamorig:RightToe_End", "mixamorig:RightToeBase", {}, {0.0f, -0.04f, 0.0f}, 0.0f},
};

ClipSpec const g_clips[] = {
	{"lower_idle", 2.0f, true},	   {"lower_walk", 1.0f, true},	   {"lower_run", 0.6f, true},	   {"lower_crouch_idle", 2.0f, true},
	{"lower_crouch_walk", 1.0f, true}, {"rifle_idle", 2.0f, true},	   {"rifle_reload", 2.5f, false},  {"rifle_fire", 0.1f, false},
	{"pistol_idle", 2.0f, true},	   {"pistol_reload", 1.8f, false}, {"pistol_fire", 0.15f, false},  {"sniper_idle", 2.0f, true},
	{"sniper_reload", 3.5f, false},	   {"sniper_fire", 1.5f, false},   {"knife_idle", 2.0f, true},	   {"knife_attack", 0.5f, false},
};

constexpr std::string_view g_lower_body[] = {
	"mixamorig:Hips",		"mixamorig:Spine",	   "mixamorig:LeftUpLeg",  "mixamorig:LeftLeg",  "mixamorig:LeftFoot",
	"mixamorig:LeftToeBase", "mixamorig:RightUpLeg", "mixamorig:RightLeg", "mixamorig:RightFoot", "mixamorig:RightToeBase",
};

constexpr std::string_view g_upper_body[] = {
	"mixamorig:Spine1",			 "mixamorig:Spine2",		  "mixamorig:Neck",			   "mixamorig:Head",
	"mixamorig:LeftShoulder",	 "mixamorig:LeftArm",		  "mixamorig:LeftForeArm",	   "mixamorig:LeftHand",
	"mixamorig:LeftHandThumb1",	 "mixamorig:LeftHandThumb2",  "mixamorig:LeftHandThumb3",  "mixamorig:LeftHandIndex1",
	"mixamorig:LeftHandIndex2",	 "mixamorig:LeftHandIndex3",  "mixamorig:LeftHandMiddle1", "mixamorig:LeftHandMiddle2",
	"mixamorig:LeftHandMiddle3", "mixamorig:LeftHandRing1",	  "mixamorig:LeftHandRing2",   "mixamorig:LeftHandRing3",
	"mixamorig:LeftHandPinky1",	 "mixamorig:LeftHandPinky2",  "mixamorig:LeftHandPinky3",  "mixamorig:RightShoulder",
	"mixamorig:RightArm",		 "mixamorig:RightForeArm",	  "mixamorig:RightHand",	   "mixamorig:RightHandThumb1",
	"mixamorig:RightHandThumb2", "mixamorig:RightHandThumb3", "mixamorig:RightHandIndex1", "mixamorig:RightHandIndex2",
	"mixamorig:RightHandIndex3", "mixamorig:RightHandMiddle1", "mixamorig:RightHandMiddle2", "mixamorig:RightHandMiddle3",
	"mixamorig:RightHandRing1",	 "mixamorig:RightHandRing2",  "mixamorig:RightHandRing3",  "mixamorig:RightHandPinky1",
	"mixamorig:RightHandPinky2", "mixamorig:RightHandPinky3",
};

Id<Node> build_armature(Scene& out_scene, RigInfo const& info) {
	auto const resolved = resolve(info.bones, info.origin);
	auto node = Node{};
	node.name = std::string{info.armature_name};
	node.type = NodeType::eArmature;
	node.armature = out_scene.add(Armature{std::string{info.armature_name}});
	auto const ret = out_scene.add(std::move(node));

	auto scope = ModeScope{out_scene, InteractionMode::eEdit, ret};
	auto& armature = out_scene.edit_bones(ret);
	for (auto const& in : resolved) {
		auto bone = Bone{};
		bone.name = std::string{in.name};
		if (!in.parent.empty()) { bone.parent = armature.find_id(in.parent); }
		bone.head = in.head;
		bone.tail = in.tail;
		bone.roll = in.roll;
		bone.connected = in.connected;
		armature.add(std::move(bone));
	}
	logger::info("Created armature with {} bones", armature.bone_count());
	return ret;
}

Clip make_clip(Armature& armature, ClipSpec const& spec, RigInfo const& info) {
	auto ret = Clip{};
	ret.name = std::string{spec.name};
	ret.frame_count = frame_count(spec.seconds, info.frame_rate);
	ret.frame_rate = info.frame_rate;
	ret.looping = spec.looping;
	auto const& bones = spec.name.starts_with(info.lower_prefix) ? info.lower_body : info.upper_body;
	for (auto const name : bones) {
		auto* bone = armature.find(name);
		if (!bone) { continue; }
		bone->pose.rotation_mode = RotationMode::eQuaternion;
		auto& channel = ret.channel(name);
		channel.rotation.insert(1, quat_identity_v);
		if (ret.frame_count > 4) { channel.rotation.insert(ret.frame_count / 2, perturbation_v); }
		channel.rotation.insert(ret.frame_count, quat_identity_v);
	}
	return ret;
}
} // namespace

std::span<BoneSpec const> mixamo_bone_table() { return g_bones; }
std::span<ClipSpec const> player_clip_table() { return g_clips; }
std::span<std::string_view const> lower_body_bones() { return g_lower_body; }
std::span<std::string_view const> upper_body_bones() { return g_upper_body; }

std::uint32_t frame_count(float const seconds, float const fps) {
	auto const frames = std::lround(seconds * fps);
	return static_cast<std::uint32_t>(std::max(frames, 2L));
}

std::vector<ResolvedBone> resolve(std::span<BoneSpec const> bones, glm::vec3 const origin) noexcept(false) {
	auto ret = std::vector<ResolvedBone>{};
	ret.reserve(bones.size());
	auto tails = std::unordered_map<std::string_view, glm::vec3>{};
	auto pending = std::vector<BoneSpec const*>{};
	for (auto const& bone : bones) { pending.push_back(&bone); }

	auto const try_resolve = [&](BoneSpec const& bone) {
		auto base = origin;
		if (!bone.parent.empty()) {
			auto const it = tails.find(bone.parent);
			if (it == tails.end()) { return false; }
			base = it->second;
		}
		auto const head = base + bone.head;
		auto const tail = head + bone.tail;
		auto const connected = !bone.parent.empty() && bone.head == glm::vec3{};
		ret.push_back(ResolvedBone{bone.name, bone.parent, head, tail, bone.roll, connected});
		tails.insert_or_assign(bone.name, tail);
		return true;
	};

	while (!pending.empty()) {
		auto deferred = std::vector<BoneSpec const*>{};
		for (auto const* bone : pending) {
			if (!try_resolve(*bone)) { deferred.push_back(bone); }
		}
		if (deferred.size() < pending.size()) {
			pending = std::move(deferred);
			continue;
		}
		auto const& first = *pending.front();
		auto const has_parent = std::any_of(bones.begin(), bones.end(), [&first](BoneSpec const& b) { return b.name == first.parent; });
		if (!has_parent) { throw SceneError{fmt::format("Bone {}: parent {} does not exist", first.name, first.parent)}; }
		throw SceneError{fmt::format("Bone {}: parent chain forms a cycle", first.name)};
	}
	return ret;
}

Rig build_rig_and_animations(Scene& scene, RigInfo const& info) noexcept(false) {
	scene.clear();
	auto ret = Rig{};
	ret.armature = build_armature(scene, info);

	auto& data = *scene.armature(ret.armature);
	{
		auto scope = ModeScope{scene, InteractionMode::ePose, ret.armature};
		auto& armature = scene.pose_bones(ret.armature);
		for (auto const& spec : info.clips) {
			auto const id = scene.add(make_clip(armature, spec, info));
			armature.animation.active = id;
			ret.clips.push_back(id);
		}
	}

	data.animation.active.reset();
	data.animation.tracks.clear();
	for (auto it = ret.clips.rbegin(); it != ret.clips.rend(); ++it) {
		auto const& clip = scene.resources().clips[*it];
		data.animation.push_track(NlaTrack{.name = clip.name, .clip = *it, .start_frame = 1, .mute = true});
	}

	logger::info("Created {} animations:", ret.clips.size());
	for (auto const [spec, index] : enumerate(info.clips)) {
		logger::info("  [{}] {} ({}s)", index, spec.name, spec.seconds);
	}
	return ret;
}
} // namespace rigkit
