#include <fmt/format.h>
#include <rigkit/scene/print.hpp>
#include <iterator>

namespace rigkit {
namespace {
constexpr std::string_view indent_v{"  "};

void append_indent(std::string& out, std::size_t depth) {
	for (std::size_t i = 0; i < depth; ++i) { out += indent_v; }
}

void print_node(std::string& out, Scene const& scene, Id<Node> id, std::size_t depth) {
	auto const& node = scene.get(id);
	append_indent(out, depth);
	fmt::format_to(std::back_inserter(out), "- {} ({})\n", node.name, node_type_str[node.type]);
	for (auto const child : node.children()) { print_node(out, scene, child, depth + 1); }
}

void print_bone(std::string& out, Armature const& armature, Id<Bone> id, std::size_t depth) {
	append_indent(out, depth);
	fmt::format_to(std::back_inserter(out), "- {}\n", armature.bones()[id].name);
	for (auto const child : armature.children(id)) { print_bone(out, armature, child, depth + 1); }
}
} // namespace

std::string print_hierarchy(Scene const& scene) {
	auto ret = std::string{};
	for (auto const root : scene.roots()) { print_node(ret, scene, root, 0); }
	return ret;
}

std::string print_bones(Armature const& armature) {
	auto ret = std::string{};
	for (auto const root : armature.roots()) { print_bone(ret, armature, root, 0); }
	return ret;
}
} // namespace rigkit
