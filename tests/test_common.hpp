#pragma once
#include <glm/mat4x4.hpp>
#include <gtest/gtest.h>
#include <rigkit/scene/scene.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit::test {
inline constexpr float epsilon_v{1e-5f};

///
/// \brief Copies the logger's entry buffer.
///
struct LogCapture : logger::Accessor {
	std::vector<logger::Entry> entries{};

	void operator()(std::span<logger::Entry const> in) final { entries.assign(in.begin(), in.end()); }

	static LogCapture take() {
		auto ret = LogCapture{};
		logger::access_buffer(ret);
		return ret;
	}

	bool contains(std::string_view text, logger::Level level) const {
		return std::any_of(entries.begin(), entries.end(), [&](logger::Entry const& e) { return e.level == level && e.message.find(text) != std::string::npos; });
	}
};

///
/// \brief Base fixture owning a logger instance, so every test sees a fresh buffer.
///
class LoggedTest : public ::testing::Test {
  protected:
	logger::Instance m_logger{};
};

inline ::testing::AssertionResult matrices_near(glm::mat4 const& a, glm::mat4 const& b, float eps = epsilon_v) {
	for (glm::length_t c = 0; c < 4; ++c) {
		for (glm::length_t r = 0; r < 4; ++r) {
			if (std::abs(a[c][r] - b[c][r]) > eps) {
				return ::testing::AssertionFailure() << "mismatch at [" << c << "][" << r << "]: " << a[c][r] << " vs " << b[c][r];
			}
		}
	}
	return ::testing::AssertionSuccess();
}

inline Id<Node> add_node(Scene& scene, std::string name, NodeType type, std::optional<Id<Node>> parent = {}) {
	auto node = Node{};
	node.name = std::move(name);
	node.type = type;
	return scene.add(std::move(node), parent);
}

inline Id<Node> add_armature(Scene& scene, std::string name, std::optional<Id<Node>> parent = {}) {
	auto node = Node{};
	node.name = name;
	node.type = NodeType::eArmature;
	node.armature = scene.add(Armature{std::move(name)});
	return scene.add(std::move(node), parent);
}
} // namespace rigkit::test
