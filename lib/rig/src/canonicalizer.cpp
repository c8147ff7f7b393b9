#include <rigkit/rig/canonicalizer.hpp>
#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>

namespace rigkit {
namespace {
constexpr bool is_digit(char const c) { return c >= '0' && c <= '9'; }

bool contains(std::span<std::string_view const> vocabulary, std::string_view const name) {
	return std::find(vocabulary.begin(), vocabulary.end(), name) != vocabulary.end();
}

struct RenameIntent {
	Id<Bone> bone{};
	std::string from{};
	std::string to{};
};

struct Planner {
	CanonicalizeInfo const& info;
	CanonicalizeResult& out_result;

	std::vector<RenameIntent> operator()(Armature const& armature) const {
		auto ret = std::vector<RenameIntent>{};
		for (std::size_t i = 0; i < armature.bone_count(); ++i) {
			auto const& name = armature.bones()[i].name;
			if (!std::string_view{name}.starts_with(info.prefix)) { continue; }
			auto const target = canonical_name(name, info.vocabulary);
			if (!target) {
				out_result.unknown_names.push_back(name);
				continue;
			}
			if (*target == name) {
				++out_result.already_correct;
				continue;
			}
			ret.push_back(RenameIntent{i, name, std::string{*target}});
		}
		return ret;
	}
};

void commit(Armature& armature, std::span<RenameIntent const> intents, CanonicalizeResult& out_result) {
	for (auto const& intent : intents) {
		if (!armature.rename(intent.bone, intent.to)) {
			logger::warn("  SKIP: {} -> {} (target already exists)", intent.from, intent.to);
			++out_result.skipped;
			continue;
		}
		logger::info("  RENAME: {} -> {}", intent.from, intent.to);
		++out_result.renamed;
	}
}
} // namespace

std::optional<std::string_view> strip_numeric_suffix(std::string_view const name) {
	auto const underscore = name.rfind('_');
	if (underscore == std::string_view::npos || underscore == 0) { return {}; }
	auto const digits = name.substr(underscore + 1);
	if (digits.size() < 2 || digits.size() > 3) { return {}; }
	if (!std::all_of(digits.begin(), digits.end(), is_digit)) { return {}; }
	return name.substr(0, underscore);
}

std::optional<std::string_view> canonical_name(std::string_view const name, std::span<std::string_view const> vocabulary) {
	if (contains(vocabulary, name)) { return name; }
	if (auto const stripped = strip_numeric_suffix(name); stripped && contains(vocabulary, *stripped)) { return stripped; }
	return {};
}

CanonicalizeResult canonicalize(Scene& scene, CanonicalizeInfo const& info) {
	auto ret = CanonicalizeResult{};
	for (auto const id : scene.find_all(NodeType::eArmature)) {
		if (!scene.armature(id)) { continue; }
		logger::info("Processing armature: {}", scene.get(id).name);
		auto scope = ModeScope{scene, InteractionMode::eEdit, id};
		auto& armature = scene.edit_bones(id);
		auto const intents = Planner{info, ret}(armature);
		commit(armature, intents, ret);
	}

	logger::info("Renamed: {} bones", ret.renamed);
	logger::info("Already correct: {} bones", ret.already_correct);
	logger::info("Skipped: {} bones (target name already exists)", ret.skipped);
	if (!ret.unknown_names.empty()) {
		logger::warn("Unknown bones (not renamed): {}", ret.unknown_names.size());
		auto const shown = std::min(ret.unknown_names.size(), info.display_cap);
		for (std::size_t i = 0; i < shown; ++i) { logger::warn("  - {}", ret.unknown_names[i]); }
		if (ret.unknown_names.size() > shown) { logger::warn("  ... and {} more", ret.unknown_names.size() - shown); }
	}
	return ret;
}
} // namespace rigkit
