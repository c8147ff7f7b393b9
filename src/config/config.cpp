#include <config/config.hpp>
#include <fmt/format.h>
#include <djson/json.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>
#include <filesystem>

namespace rigkit {
namespace {
bool to_json(dj::Json& out, Config const& config) {
	auto flatten = dj::Json{};
	flatten["armature_name"] = config.flatten.armature_name;
	auto tokens = dj::Json{};
	for (auto const& token : config.flatten.wrapper_tokens) { tokens.push_back(token); }
	flatten["wrapper_tokens"] = std::move(tokens);
	flatten["root_joint"] = config.flatten.root_joint;
	flatten["strip_root_joint"] = dj::Boolean{config.flatten.strip_root_joint};
	auto canonicalize = dj::Json{};
	canonicalize["prefix"] = config.canonicalize.prefix;
	canonicalize["display_cap"] = config.canonicalize.display_cap;
	auto generate = dj::Json{};
	generate["frame_rate"] = config.generate.frame_rate;
	out["flatten"] = std::move(flatten);
	out["canonicalize"] = std::move(canonicalize);
	out["generate"] = std::move(generate);
	return true;
}

bool from_json(dj::Json const& json, Config& out) {
	auto const& flatten = json["flatten"];
	if (auto const& name = flatten["armature_name"]) { out.flatten.armature_name = name.as<std::string>(); }
	if (auto const& tokens = flatten["wrapper_tokens"]) {
		out.flatten.wrapper_tokens.clear();
		for (auto const& token : tokens.array_view()) { out.flatten.wrapper_tokens.emplace_back(token.as_string()); }
	}
	if (auto const& root_joint = flatten["root_joint"]) { out.flatten.root_joint = root_joint.as<std::string>(); }
	out.flatten.strip_root_joint = flatten["strip_root_joint"].as_bool(dj::Boolean{out.flatten.strip_root_joint}).value;
	auto const& canonicalize = json["canonicalize"];
	if (auto const& prefix = canonicalize["prefix"]) { out.canonicalize.prefix = prefix.as<std::string>(); }
	out.canonicalize.display_cap = canonicalize["display_cap"].as<std::size_t>(out.canonicalize.display_cap);
	auto const frame_rate = json["generate"]["frame_rate"].as<float>(out.generate.frame_rate);
	if (frame_rate > 0.0f) { out.generate.frame_rate = frame_rate; }
	return true;
}
} // namespace

FlattenInfo Config::flatten_info() const {
	return FlattenInfo{
		.armature_name = flatten.armature_name,
		.wrapper_tokens = flatten.wrapper_tokens,
		.root_joint = flatten.root_joint,
		.strip_root_joint = flatten.strip_root_joint,
	};
}

CanonicalizeInfo Config::canonicalize_info() const {
	auto ret = CanonicalizeInfo{};
	ret.prefix = canonicalize.prefix;
	ret.display_cap = canonicalize.display_cap;
	return ret;
}

RigInfo Config::rig_info() const {
	auto ret = RigInfo{};
	ret.armature_name = flatten.armature_name;
	ret.frame_rate = generate.frame_rate;
	return ret;
}

Config Config::load(char const* path) {
	auto ret = Config{};
	if (!std::filesystem::is_regular_file(path)) { return ret; }
	auto json = dj::Json::from_file(path);
	if (!json) { throw ConfigError{fmt::format("Failed to parse config: [{}]", path)}; }
	from_json(json, ret);
	logger::info("Loaded config from [{}]", path);
	return ret;
}

bool Config::save(char const* path) const {
	auto json = dj::Json{};
	if (!to_json(json, *this)) { return false; }
	if (!json.to_file(path)) {
		logger::warn("Failed to save config to [{}]", path);
		return false;
	}
	logger::info("Saved config to [{}]", path);
	return true;
}
} // namespace rigkit
