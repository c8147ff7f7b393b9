#include <rigkit/rig/canonicalizer.hpp>
#include <test_common.hpp>

namespace rigkit::test {
namespace {
class CanonicalizerTest : public LoggedTest {
  protected:
	Id<Node> make_armature(std::string name, std::initializer_list<std::string_view> bones) {
		auto const ret = add_armature(scene, std::move(name));
		auto& armature = *scene.armature(ret);
		auto parent = std::optional<Id<Bone>>{};
		for (auto const bone : bones) { parent = armature.add(Bone{.name = std::string{bone}, .parent = parent}); }
		return ret;
	}

	std::vector<std::string> names(Id<Node> node) const {
		auto ret = std::vector<std::string>{};
		for (auto const& bone : scene.armature(node)->bones()) { ret.push_back(bone.name); }
		return ret;
	}

	Scene scene{};
};

TEST(Canonicalizer, StripNumericSuffix) {
	EXPECT_EQ(strip_numeric_suffix("mixamorig:Hips_02"), "mixamorig:Hips");
	EXPECT_EQ(strip_numeric_suffix("mixamorig:Hips_123"), "mixamorig:Hips");
	EXPECT_FALSE(strip_numeric_suffix("mixamorig:Hips_2"));
	EXPECT_FALSE(strip_numeric_suffix("mixamorig:Hips_1234"));
	EXPECT_FALSE(strip_numeric_suffix("mixamorig:Hips_0a"));
	EXPECT_FALSE(strip_numeric_suffix("_02"));
	EXPECT_FALSE(strip_numeric_suffix("mixamorig:LeftHandIndex4"));
}

TEST(Canonicalizer, CanonicalName) {
	EXPECT_EQ(canonical_name("mixamorig:Hips_02"), "mixamorig:Hips");
	EXPECT_EQ(canonical_name("mixamorig:LeftHandIndex4"), "mixamorig:LeftHandIndex4");
	EXPECT_EQ(canonical_name("mixamorig:HeadTop_End"), "mixamorig:HeadTop_End");
	EXPECT_EQ(canonical_name("mixamorig:LeftToe_End_07"), "mixamorig:LeftToe_End");
	EXPECT_FALSE(canonical_name("mixamorig:Tail_01"));
	EXPECT_FALSE(canonical_name("mixamorig:Hips_2"));
}

TEST_F(CanonicalizerTest, RenamesSuffixedBones) {
	auto const node = make_armature("Armature", {"mixamorig:Hips_02", "mixamorig:Spine", "mixamorig:LeftHandIndex4_115"});
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.renamed, 2U);
	EXPECT_EQ(result.already_correct, 1U);
	EXPECT_EQ(result.skipped, 0U);
	EXPECT_TRUE(result.unknown_names.empty());
	EXPECT_EQ(names(node), (std::vector<std::string>{"mixamorig:Hips", "mixamorig:Spine", "mixamorig:LeftHandIndex4"}));
	EXPECT_EQ(scene.mode(), InteractionMode::eObject);
	EXPECT_TRUE(LogCapture::take().contains("RENAME: mixamorig:Hips_02 -> mixamorig:Hips", logger::Level::eInfo));
}

TEST_F(CanonicalizerTest, SkipsCollisions) {
	auto const node = make_armature("Armature", {"mixamorig:Head_02", "mixamorig:Head"});
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.renamed, 0U);
	EXPECT_EQ(result.skipped, 1U);
	EXPECT_EQ(result.already_correct, 1U);
	EXPECT_EQ(names(node), (std::vector<std::string>{"mixamorig:Head_02", "mixamorig:Head"}));
}

TEST_F(CanonicalizerTest, CollisionsAreCheckedAgainstCommittedRenames) {
	make_armature("Armature", {"mixamorig:Neck_01", "mixamorig:Neck_02"});
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.renamed, 1U);
	EXPECT_EQ(result.skipped, 1U);
}

TEST_F(CanonicalizerTest, IsIdempotent) {
	make_armature("Armature", {"mixamorig:Hips_02", "mixamorig:Spine_010", "mixamorig:Spine1"});
	auto const first = canonicalize(scene);
	EXPECT_EQ(first.renamed, 2U);
	auto const second = canonicalize(scene);
	EXPECT_EQ(second.renamed, 0U);
	EXPECT_EQ(second.skipped, 0U);
	EXPECT_EQ(second.already_correct, 3U);
}

TEST_F(CanonicalizerTest, IgnoresUnprefixedBones) {
	auto const node = make_armature("Armature", {"_rootJoint", "Hips_02", "mixamorig:Hips_02"});
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.renamed, 1U);
	EXPECT_EQ(result.already_correct, 0U);
	EXPECT_TRUE(result.unknown_names.empty());
	EXPECT_EQ(names(node)[1], "Hips_02");
}

TEST_F(CanonicalizerTest, ReportsUnknownNames) {
	auto bones = std::vector<std::string>{};
	for (int i = 0; i < 12; ++i) { bones.push_back(fmt::format("mixamorig:Cape{}", i)); }
	auto const node = add_armature(scene, "Armature");
	for (auto& bone : bones) { scene.armature(node)->add(Bone{.name = bone}); }
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.unknown_names.size(), 12U);
	EXPECT_EQ(result.renamed, 0U);
	auto const log = LogCapture::take();
	EXPECT_TRUE(log.contains("- mixamorig:Cape9", logger::Level::eWarn));
	EXPECT_FALSE(log.contains("- mixamorig:Cape10", logger::Level::eWarn));
	EXPECT_TRUE(log.contains("... and 2 more", logger::Level::eWarn));
}

TEST_F(CanonicalizerTest, AggregatesAcrossArmatures) {
	auto const a = make_armature("A", {"mixamorig:Hips_01"});
	auto const b = make_armature("B", {"mixamorig:Hips_02", "mixamorig:Spine"});
	auto const result = canonicalize(scene);
	EXPECT_EQ(result.renamed, 2U);
	EXPECT_EQ(result.already_correct, 1U);
	EXPECT_EQ(names(a)[0], "mixamorig:Hips");
	EXPECT_EQ(names(b)[0], "mixamorig:Hips");
}

TEST_F(CanonicalizerTest, CustomVocabulary) {
	auto const node = make_armature("Armature", {"rig:Root_01"});
	std::string_view const vocabulary[] = {"rig:Root"};
	auto info = CanonicalizeInfo{};
	info.prefix = "rig:";
	info.vocabulary = vocabulary;
	auto const result = canonicalize(scene, info);
	EXPECT_EQ(result.renamed, 1U);
	EXPECT_EQ(names(node)[0], "rig:Root");
}
} // namespace
} // namespace rigkit::test
