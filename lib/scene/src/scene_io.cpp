#include <djson/json.hpp>
#include <fmt/format.h>
#include <rigkit/scene/scene_io.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>
#include <filesystem>
#include <unordered_map>

namespace rigkit {
namespace {
template <typename E, std::size_t N>
E to_enum(EnumArray<E, std::string_view, N> const& strings, std::string_view const str, E const fallback) {
	for (std::size_t i = 0; i < N; ++i) {
		if (strings.t[i] == str) { return static_cast<E>(i); }
	}
	return fallback;
}

constexpr auto rotation_mode_str = EnumArray<RotationMode, std::string_view>{"XYZ", "QUATERNION"};
constexpr auto modifier_type_str = std::string_view{"ARMATURE"};

template <glm::length_t Dim>
glm::vec<Dim, float> get_vec(dj::Json const& value, glm::vec<Dim, float> const& fallback = {}) {
	auto ret = fallback;
	if (!value) { return ret; }
	if (value.array_view().size() < Dim) { throw SceneError{fmt::format("Expected {} components, got {}", Dim, value.array_view().size())}; }
	ret.x = value[0].as<float>();
	if constexpr (Dim > 1) { ret.y = value[1].as<float>(); }
	if constexpr (Dim > 2) { ret.z = value[2].as<float>(); }
	if constexpr (Dim > 3) { ret.w = value[3].as<float>(); }
	return ret;
}

// [x, y, z, w]
glm::quat get_quat(dj::Json const& value) {
	if (!value) { return quat_identity_v; }
	auto const v = get_vec<4>(value);
	return glm::quat{v.w, v.x, v.y, v.z};
}

template <glm::length_t Dim>
dj::Json make_array(glm::vec<Dim, float> const& vec) {
	auto ret = dj::Json{};
	for (glm::length_t i = 0; i < Dim; ++i) { ret.push_back(vec[i]); }
	return ret;
}

dj::Json make_array(glm::quat const& quat) { return make_array(glm::vec4{quat.x, quat.y, quat.z, quat.w}); }

std::optional<std::size_t> get_index(dj::Json const& value, std::size_t const count, std::string_view const what) {
	if (!value) { return {}; }
	auto const ret = value.as<std::size_t>();
	if (ret >= count) { throw SceneError{fmt::format("Invalid {} index: {} (count: {})", what, ret, count)}; }
	return ret;
}

Bone to_bone(dj::Json const& json, std::size_t const bone_count) {
	auto ret = Bone{};
	ret.name = json["name"].as<std::string>();
	if (auto const parent = get_index(json["parent"], bone_count, "bone parent")) { ret.parent = *parent; }
	ret.head = get_vec<3>(json["head"]);
	ret.tail = get_vec<3>(json["tail"], ret.tail);
	ret.roll = json["roll"].as<float>(0.0f);
	ret.connected = json["connected"].as_bool(dj::Boolean{false}).value;
	ret.pose.rotation_mode = to_enum(rotation_mode_str, json["rotation_mode"].as_string(), RotationMode::eEulerXYZ);
	ret.pose.rotation = get_quat(json["rotation"]);
	return ret;
}

Armature to_armature(dj::Json const& json, std::size_t const clip_count) {
	auto ret = Armature{json["name"].as<std::string>()};
	auto const& bones = json["bones"].array_view();
	for (auto const& bone : bones) { ret.add(to_bone(bone, bones.size())); }
	if (auto const active = get_index(json["active_clip"], clip_count, "clip")) { ret.animation.active = *active; }
	for (auto const& track : json["tracks"].array_view()) {
		auto nla = NlaTrack{};
		nla.name = track["name"].as<std::string>();
		auto const clip = get_index(track["clip"], clip_count, "clip");
		if (!clip) { throw SceneError{fmt::format("NLA track {} of armature {} has no clip", nla.name, ret.name)}; }
		nla.clip = *clip;
		nla.start_frame = track["start_frame"].as<std::uint32_t>(1U);
		nla.mute = track["mute"].as_bool(dj::Boolean{false}).value;
		ret.animation.push_track(std::move(nla));
	}
	return ret;
}

Clip to_clip(dj::Json const& json) {
	auto ret = Clip{};
	ret.name = json["name"].as<std::string>();
	ret.frame_count = json["frame_count"].as<std::uint32_t>();
	ret.frame_rate = json["frame_rate"].as<float>(ret.frame_rate);
	ret.looping = json["looping"].as_bool(dj::Boolean{false}).value;
	for (auto const& channel : json["channels"].array_view()) {
		auto& out = ret.channel(channel["bone"].as_string());
		for (auto const& keyframe : channel["keyframes"].array_view()) {
			out.rotation.insert(keyframe["frame"].as<std::uint32_t>(), get_quat(keyframe["rotation"]));
		}
	}
	return ret;
}

struct NodeBuilder {
	Scene& out_scene;
	dj::Json const& nodes;
	std::vector<std::optional<Id<Node>>> ids{};
	std::vector<bool> visiting{};

	Id<Node> build(std::size_t const index) {
		if (ids[index]) { return *ids[index]; }
		if (visiting[index]) { throw SceneError{fmt::format("Node [{}] is part of a parent cycle", index)}; }
		visiting[index] = true;
		auto const& json = nodes[index];
		auto parent = std::optional<Id<Node>>{};
		if (auto const p = get_index(json["parent"], ids.size(), "node parent")) { parent = build(*p); }
		auto node = Node{};
		node.name = json["name"].as<std::string>();
		node.type = to_enum(node_type_str, json["type"].as_string(), NodeType::eOther);
		if (auto const armature = get_index(json["armature"], out_scene.resources().armatures.size(), "armature")) {
			node.armature = *armature;
		}
		node.transform.set_position(get_vec<3>(json["translation"]));
		node.transform.set_orientation(get_quat(json["rotation"]));
		node.transform.set_scale(get_vec<3>(json["scale"], glm::vec3{1.0f}));
		ids[index] = out_scene.add(std::move(node), parent);
		return *ids[index];
	}

	void operator()() {
		auto const count = nodes.array_view().size();
		ids.resize(count);
		visiting.resize(count);
		for (std::size_t i = 0; i < count; ++i) { build(i); }
		// modifiers may target any node, so they are bound once all nodes exist
		for (std::size_t i = 0; i < count; ++i) {
			auto& node = out_scene.get(*ids[i]);
			for (auto const& modifier : nodes[i]["modifiers"].array_view()) {
				auto out = Modifier{};
				out.name = modifier["name"].as<std::string>();
				out.type = modifier["type"].as_string() == modifier_type_str ? Modifier::Type::eArmature : Modifier::Type::eOther;
				if (auto const object = get_index(modifier["object"], count, "modifier object")) { out.object = *ids[*object]; }
				node.modifiers.push_back(std::move(out));
			}
		}
	}
};

dj::Json make_json(Bone const& bone) {
	auto ret = dj::Json{};
	ret["name"] = bone.name;
	if (bone.parent) { ret["parent"] = bone.parent->value(); }
	ret["head"] = make_array(bone.head);
	ret["tail"] = make_array(bone.tail);
	ret["roll"] = bone.roll;
	ret["connected"] = dj::Boolean{bone.connected};
	ret["rotation_mode"] = std::string{rotation_mode_str[bone.pose.rotation_mode]};
	ret["rotation"] = make_array(bone.pose.rotation);
	return ret;
}

dj::Json make_json(Armature const& armature) {
	auto ret = dj::Json{};
	ret["name"] = armature.name;
	auto bones = dj::Json{};
	for (auto const& bone : armature.bones()) { bones.push_back(make_json(bone)); }
	ret["bones"] = std::move(bones);
	if (armature.animation.active) { ret["active_clip"] = armature.animation.active->value(); }
	auto tracks = dj::Json{};
	for (auto const& track : armature.animation.tracks) {
		auto nla = dj::Json{};
		nla["name"] = track.name;
		nla["clip"] = track.clip.value();
		nla["start_frame"] = track.start_frame;
		nla["mute"] = dj::Boolean{track.mute};
		tracks.push_back(std::move(nla));
	}
	ret["tracks"] = std::move(tracks);
	return ret;
}

dj::Json make_json(Clip const& clip) {
	auto ret = dj::Json{};
	ret["name"] = clip.name;
	ret["frame_count"] = clip.frame_count;
	ret["frame_rate"] = clip.frame_rate;
	ret["looping"] = dj::Boolean{clip.looping};
	auto channels = dj::Json{};
	for (auto const& channel : clip.channels) {
		auto ch = dj::Json{};
		ch["bone"] = channel.bone;
		auto keyframes = dj::Json{};
		for (auto const& keyframe : channel.rotation.keyframes) {
			auto kf = dj::Json{};
			kf["frame"] = keyframe.frame;
			kf["rotation"] = make_array(keyframe.value);
			keyframes.push_back(std::move(kf));
		}
		ch["keyframes"] = std::move(keyframes);
		channels.push_back(std::move(ch));
	}
	ret["channels"] = std::move(channels);
	return ret;
}
} // namespace

Scene io::load_scene(dj::Json const& json) noexcept(false) {
	auto ret = Scene{};
	if (auto const& name = json["name"]) { ret.name = name.as<std::string>(); }
	for (auto const& clip : json["clips"].array_view()) { ret.add(to_clip(clip)); }
	for (auto const& armature : json["armatures"].array_view()) { ret.add(to_armature(armature, ret.resources().clips.size())); }
	NodeBuilder{ret, json["nodes"]}();
	logger::debug("[io] Loaded scene {}: {} nodes, {} armatures, {} clips", ret.name, ret.node_count(), ret.resources().armatures.size(),
				  ret.resources().clips.size());
	return ret;
}

void io::to_json(dj::Json& out, Scene const& scene) {
	out["name"] = scene.name;
	auto clips = dj::Json{};
	for (auto const& clip : scene.resources().clips.view()) { clips.push_back(make_json(clip)); }
	out["clips"] = std::move(clips);
	auto armatures = dj::Json{};
	for (auto const& armature : scene.resources().armatures.view()) { armatures.push_back(make_json(armature)); }
	out["armatures"] = std::move(armatures);

	auto indices = std::unordered_map<Id<Node>, std::size_t, Id<Node>::Hasher>{};
	for (std::size_t i = 0; i < scene.nodes().size(); ++i) { indices.insert_or_assign(scene.nodes()[i].id(), i); }
	auto nodes = dj::Json{};
	for (auto const& node : scene.nodes()) {
		auto json = dj::Json{};
		json["name"] = node.name;
		json["type"] = std::string{node_type_str[node.type]};
		if (node.parent()) { json["parent"] = indices.at(*node.parent()); }
		if (node.armature) { json["armature"] = node.armature->value(); }
		json["translation"] = make_array(node.transform.position());
		json["rotation"] = make_array(node.transform.orientation());
		json["scale"] = make_array(node.transform.scale());
		if (!node.modifiers.empty()) {
			auto modifiers = dj::Json{};
			for (auto const& modifier : node.modifiers) {
				auto mod = dj::Json{};
				mod["name"] = modifier.name;
				mod["type"] = std::string{modifier.type == Modifier::Type::eArmature ? modifier_type_str : std::string_view{"OTHER"}};
				if (modifier.object) { mod["object"] = indices.at(*modifier.object); }
				modifiers.push_back(std::move(mod));
			}
			json["modifiers"] = std::move(modifiers);
		}
		nodes.push_back(std::move(json));
	}
	out["nodes"] = std::move(nodes);
}

Scene io::load_scene_file(char const* path) noexcept(false) {
	if (!std::filesystem::is_regular_file(path)) { throw SceneError{fmt::format("Scene document not found: [{}]", path)}; }
	auto json = dj::Json::from_file(path);
	if (!json) { throw SceneError{fmt::format("Failed to parse scene document: [{}]", path)}; }
	auto ret = load_scene(json);
	logger::info("Loaded scene from [{}]", path);
	return ret;
}

bool io::save_scene_file(Scene const& scene, char const* path) {
	auto json = dj::Json{};
	to_json(json, scene);
	if (!json.to_file(path)) {
		logger::warn("Failed to save scene to [{}]", path);
		return false;
	}
	logger::info("Saved scene to [{}]", path);
	return true;
}
} // namespace rigkit
