#include <rigkit/scene/mode_scope.hpp>
#include <rigkit/scene/print.hpp>
#include <rigkit/scene/scene.hpp>
#include <rigkit/util/error.hpp>
#include <test_common.hpp>

namespace rigkit::test {
namespace {
class SceneTest : public LoggedTest {
  protected:
	void SetUp() override {
		root = add_node(scene, "Root", NodeType::eEmpty);
		scene.get(root).transform.set_position({0.0f, 5.0f, 0.0f}).set_scale(glm::vec3{0.5f});
		scene.get(root).transform.rotate(glm::radians(-90.0f), {1.0f, 0.0f, 0.0f});
		middle = add_node(scene, "Middle", NodeType::eEmpty, root);
		scene.get(middle).transform.set_position({1.0f, 0.0f, 2.0f});
		leaf = add_node(scene, "Leaf", NodeType::eMesh, middle);
		scene.get(leaf).transform.set_position({0.0f, 3.0f, 0.0f});
	}

	Scene scene{};
	Id<Node> root{};
	Id<Node> middle{};
	Id<Node> leaf{};
};

TEST_F(SceneTest, AddRejectsInvalidReferences) {
	EXPECT_THROW(add_node(scene, "Orphan", NodeType::eEmpty, Id<Node>{100}), SceneError);
	auto node = Node{};
	node.type = NodeType::eArmature;
	node.armature = Id<Armature>{3};
	EXPECT_THROW(scene.add(std::move(node)), SceneError);
	EXPECT_EQ(scene.node_count(), 3U);
}

TEST_F(SceneTest, DescendantsArePreOrder) {
	auto const sibling = add_node(scene, "Sibling", NodeType::eOther, root);
	auto const descendants = scene.descendants(root);
	ASSERT_EQ(descendants.size(), 3U);
	EXPECT_EQ(descendants[0], middle);
	EXPECT_EQ(descendants[1], leaf);
	EXPECT_EQ(descendants[2], sibling);
	EXPECT_TRUE(scene.descendants(leaf).empty());
}

TEST_F(SceneTest, ClearParentPreservesWorldTransform) {
	auto const world = scene.world_matrix(leaf);
	EXPECT_TRUE(scene.clear_parent(leaf));
	EXPECT_FALSE(scene.get(leaf).parent());
	EXPECT_TRUE(matrices_near(scene.world_matrix(leaf), world));
	EXPECT_FALSE(scene.clear_parent(leaf));
	EXPECT_EQ(scene.roots().size(), 2U);
}

TEST_F(SceneTest, SetParentPreservesWorldTransform) {
	auto const other = add_node(scene, "Other", NodeType::eEmpty);
	scene.get(other).transform.set_position({-3.0f, 0.0f, 1.0f}).set_scale({2.0f, 2.0f, 2.0f});
	auto const world = scene.world_matrix(middle);
	scene.set_parent(middle, other);
	EXPECT_EQ(scene.get(middle).parent(), other);
	EXPECT_TRUE(scene.get(root).children().empty());
	EXPECT_TRUE(matrices_near(scene.world_matrix(middle), world));
}

TEST_F(SceneTest, SetParentRejectsCycles) {
	EXPECT_THROW(scene.set_parent(root, leaf), SceneError);
	EXPECT_THROW(scene.set_parent(middle, middle), SceneError);
	EXPECT_EQ(scene.get(middle).parent(), root);
}

TEST_F(SceneTest, RemoveReparentsChildren) {
	auto const leaf_world = scene.world_matrix(leaf);
	EXPECT_TRUE(scene.remove(middle));
	EXPECT_FALSE(scene.find(middle));
	ASSERT_TRUE(scene.find(leaf));
	EXPECT_EQ(scene.get(leaf).parent(), root);
	EXPECT_TRUE(matrices_near(scene.world_matrix(leaf), leaf_world));
	EXPECT_FALSE(scene.remove(middle));
	EXPECT_EQ(scene.node_count(), 2U);
}

TEST_F(SceneTest, IdsStayStableAfterRemove) {
	scene.remove(root);
	auto const added = add_node(scene, "Added", NodeType::eEmpty);
	EXPECT_NE(added, root);
	EXPECT_EQ(scene.get(leaf).name, "Leaf");
	EXPECT_EQ(scene.get(added).name, "Added");
}

TEST_F(SceneTest, RemoveUnbindsModifiers) {
	auto const armature = add_armature(scene, "Rig");
	scene.get(leaf).modifiers.push_back(Modifier{.name = "Armature", .object = armature});
	scene.remove(armature);
	ASSERT_EQ(scene.get(leaf).modifiers.size(), 1U);
	EXPECT_FALSE(scene.get(leaf).modifiers.front().object);
}

TEST_F(SceneTest, ClearResetsEverything) {
	add_armature(scene, "Rig");
	scene.add(Clip{.name = "idle", .frame_count = 2});
	scene.clear();
	EXPECT_EQ(scene.node_count(), 0U);
	EXPECT_TRUE(scene.resources().armatures.empty());
	EXPECT_TRUE(scene.resources().clips.empty());
}

TEST_F(SceneTest, PrintHierarchyIndentsChildren) {
	EXPECT_EQ(print_hierarchy(scene), "- Root (EMPTY)\n  - Middle (EMPTY)\n    - Leaf (MESH)\n");
}

class ModeScopeTest : public LoggedTest {
  protected:
	void SetUp() override {
		rig = add_armature(scene, "Rig");
		empty = add_node(scene, "Empty", NodeType::eEmpty);
	}

	Scene scene{};
	Id<Node> rig{};
	Id<Node> empty{};
};

TEST_F(ModeScopeTest, RestoresModeOnExit) {
	{
		auto edit = ModeScope{scene, InteractionMode::eEdit, rig};
		EXPECT_EQ(scene.mode(), InteractionMode::eEdit);
		EXPECT_EQ(scene.active(), rig);
		{
			auto pose = ModeScope{scene, InteractionMode::ePose};
			EXPECT_EQ(pose.previous(), InteractionMode::eEdit);
			EXPECT_EQ(scene.mode(), InteractionMode::ePose);
		}
		EXPECT_EQ(scene.mode(), InteractionMode::eEdit);
	}
	EXPECT_EQ(scene.mode(), InteractionMode::eObject);
	EXPECT_FALSE(scene.active());
}

TEST_F(ModeScopeTest, RestoresModeOnException) {
	auto const throw_inside = [this] {
		auto edit = ModeScope{scene, InteractionMode::eEdit, rig};
		scene.edit_bones(rig).add(Bone{.name = "Hips"});
		scene.edit_bones(rig).add(Bone{.name = "Hips"});
	};
	EXPECT_THROW(throw_inside(), SceneError);
	EXPECT_EQ(scene.mode(), InteractionMode::eObject);
	EXPECT_EQ(scene.armature(rig)->bone_count(), 1U);
}

TEST_F(ModeScopeTest, BoneAccessRequiresMatchingMode) {
	EXPECT_THROW(scene.edit_bones(rig), SceneError);
	{
		auto pose = ModeScope{scene, InteractionMode::ePose, rig};
		EXPECT_THROW(scene.edit_bones(rig), SceneError);
		EXPECT_NO_THROW(scene.pose_bones(rig));
	}
	EXPECT_THROW(scene.pose_bones(rig), SceneError);
}

TEST_F(ModeScopeTest, EditModeRequiresArmature) {
	auto const enter = [this](InteractionMode mode, std::optional<Id<Node>> active) { auto scope = ModeScope{scene, mode, active}; };
	EXPECT_THROW(enter(InteractionMode::eEdit, empty), SceneError);
	EXPECT_THROW(enter(InteractionMode::eEdit, {}), SceneError);
	EXPECT_EQ(scene.mode(), InteractionMode::eObject);
	EXPECT_NO_THROW(enter(InteractionMode::eObject, empty));
}

TEST(Armature, RemoveBoneReparentsChildren) {
	auto armature = Armature{};
	auto const root = armature.add(Bone{.name = "root"});
	auto const mid = armature.add(Bone{.name = "mid", .parent = root, .connected = true});
	armature.add(Bone{.name = "tip", .parent = mid, .connected = true});
	EXPECT_TRUE(armature.remove(mid));
	ASSERT_EQ(armature.bone_count(), 2U);
	auto const* tip = armature.find("tip");
	ASSERT_TRUE(tip);
	EXPECT_EQ(tip->parent, root);
	EXPECT_EQ(print_bones(armature), "- root\n  - tip\n");
}

TEST(Armature, RenameRejectsCollisions) {
	auto armature = Armature{};
	auto const a = armature.add(Bone{.name = "a"});
	armature.add(Bone{.name = "b"});
	EXPECT_FALSE(armature.rename(a, "b"));
	EXPECT_TRUE(armature.rename(a, "a"));
	EXPECT_TRUE(armature.rename(a, "c"));
	EXPECT_TRUE(armature.find("c"));
	EXPECT_THROW(armature.add(Bone{.name = "b"}), SceneError);
}
} // namespace
} // namespace rigkit::test
