#include <rigkit/rig/rig_builder.hpp>
#include <rigkit/scene/scene_io.hpp>
#include <rigkit/util/error.hpp>
#include <test_common.hpp>
#include <filesystem>
#include <fstream>

namespace rigkit::test {
namespace {
namespace fs = std::filesystem;

constexpr std::string_view imported_v = R"({
  "name": "imported",
  "armatures": [
    {
      "name": "Armature.001",
      "bones": [
        { "name": "_rootJoint" },
        { "name": "mixamorig:Hips_02", "parent": 0, "head": [0, 0, 1], "tail": [0, 0, 1.1], "rotation_mode": "QUATERNION" }
      ]
    }
  ],
  "nodes": [
    { "name": "Body", "type": "MESH", "parent": 1, "modifiers": [ { "name": "Skin", "type": "ARMATURE", "object": 2 } ] },
    { "name": "Sketchfab_model", "type": "EMPTY", "rotation": [-0.7071068, 0, 0, 0.7071068], "scale": [0.01, 0.01, 0.01] },
    { "name": "Armature.001", "type": "ARMATURE", "parent": 1, "armature": 0, "translation": [1, 2, 3] }
  ]
})";

class SceneIoTest : public LoggedTest {
  protected:
	void TearDown() override {
		auto ec = std::error_code{};
		fs::remove(path, ec);
	}

	fs::path write(std::string_view text) {
		auto file = std::ofstream{path};
		file << text;
		return path;
	}

	fs::path path{fs::temp_directory_path() / "rigkit_scene_io_test.json"};
};

TEST_F(SceneIoTest, LoadsDocument) {
	auto const scene = io::load_scene_file(write(imported_v).string().c_str());
	EXPECT_EQ(scene.name, "imported");
	ASSERT_EQ(scene.node_count(), 3U);

	// parents are created before children, whatever their document order
	auto const* wrapper = scene.find("Sketchfab_model");
	auto const* body = scene.find("Body");
	auto const* armature = scene.find("Armature.001");
	ASSERT_TRUE(wrapper && body && armature);
	EXPECT_EQ(body->parent(), wrapper->id());
	EXPECT_EQ(armature->parent(), wrapper->id());
	EXPECT_EQ(armature->transform.position(), (glm::vec3{1.0f, 2.0f, 3.0f}));
	EXPECT_NEAR(wrapper->transform.orientation().x, -0.7071068f, epsilon_v);
	ASSERT_EQ(body->modifiers.size(), 1U);
	EXPECT_EQ(body->modifiers[0].object, armature->id());

	auto const* data = scene.armature(armature->id());
	ASSERT_TRUE(data);
	ASSERT_EQ(data->bone_count(), 2U);
	auto const& hips = data->bones()[1];
	EXPECT_EQ(hips.parent, Id<Bone>{0});
	EXPECT_EQ(hips.pose.rotation_mode, RotationMode::eQuaternion);
	EXPECT_NEAR(hips.tail.z, 1.1f, epsilon_v);
}

TEST_F(SceneIoTest, SavedDocumentReloads) {
	auto scene = Scene{};
	auto const rig = build_rig_and_animations(scene);
	ASSERT_TRUE(io::save_scene_file(scene, path.string().c_str()));

	auto const loaded = io::load_scene_file(path.string().c_str());
	ASSERT_EQ(loaded.node_count(), 1U);
	auto const* armature = loaded.armature(loaded.nodes()[0].id());
	ASSERT_TRUE(armature);
	EXPECT_EQ(armature->bone_count(), 65U);
	EXPECT_EQ(armature->animation.tracks.size(), 16U);
	EXPECT_TRUE(armature->animation.tracks.front().mute);
	EXPECT_EQ(armature->find("mixamorig:LeftForeArm")->connected, scene.armature(rig.armature)->find("mixamorig:LeftForeArm")->connected);
	ASSERT_EQ(loaded.resources().clips.size(), 16U);
	auto const& clip = loaded.resources().clips[rig.clips[12]];
	EXPECT_EQ(clip.name, "sniper_reload");
	EXPECT_EQ(clip.frame_count, 84U);
	ASSERT_TRUE(clip.find("mixamorig:Head"));
	EXPECT_EQ(clip.find("mixamorig:Head")->rotation.keyframes.size(), 3U);
}

TEST_F(SceneIoTest, RejectsDanglingReferences) {
	write(R"({ "nodes": [ { "name": "a", "type": "EMPTY", "parent": 4 } ] })");
	EXPECT_THROW(io::load_scene_file(path.string().c_str()), SceneError);
	write(R"({ "nodes": [ { "name": "a", "type": "EMPTY", "parent": 1 }, { "name": "b", "type": "EMPTY", "parent": 0 } ] })");
	EXPECT_THROW(io::load_scene_file(path.string().c_str()), SceneError);
	write(R"({ "nodes": [ { "name": "a", "type": "ARMATURE", "armature": 0 } ] })");
	EXPECT_THROW(io::load_scene_file(path.string().c_str()), SceneError);
	write(R"({ "armatures": [ { "name": "A", "tracks": [ { "name": "t" } ] } ] })");
	EXPECT_THROW(io::load_scene_file(path.string().c_str()), SceneError);
}

TEST_F(SceneIoTest, MissingFileThrows) { EXPECT_THROW(io::load_scene_file("/nonexistent/rigkit/scene.json"), SceneError); }
} // namespace
} // namespace rigkit::test
