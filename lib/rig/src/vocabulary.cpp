#include <rigkit/rig/vocabulary.hpp>
#include <algorithm>

namespace rigkit {
namespace {
constexpr std::string_view canonical_names_v[] = {
	"mixamorig:Hips",
	"mixamorig:Spine",
	"mixamorig:Spine1",
	"mixamorig:Spine2",
	"mixamorig:Neck",
	"mixamorig:Head",
	"mixamorig:HeadTop_End",

	"mixamorig:LeftShoulder",
	"mixamorig:LeftArm",
	"mixamorig:LeftForeArm",
	"mixamorig:LeftHand",
	"mixamorig:LeftHandThumb1",
	"mixamorig:LeftHandThumb2",
	"mixamorig:LeftHandThumb3",
	"mixamorig:LeftHandThumb4",
	"mixamorig:LeftHandIndex1",
	"mixamorig:LeftHandIndex2",
	"mixamorig:LeftHandIndex3",
	"mixamorig:LeftHandIndex4",
	"mixamorig:LeftHandMiddle1",
	"mixamorig:LeftHandMiddle2",
	"mixamorig:LeftHandMiddle3",
	"mixamorig:LeftHandMiddle4",
	"mixamorig:LeftHandRing1",
	"mixamorig:LeftHandRing2",
	"mixamorig:LeftHandRing3",
	"mixamorig:LeftHandRing4",
	"mixamorig:LeftHandPinky1",
	"mixamorig:LeftHandPinky2",
	"mixamorig:LeftHandPinky3",
	"mixamorig:LeftHandPinky4",

	"mixamorig:RightShoulder",
	"mixamorig:RightArm",
	"mixamorig:RightForeArm",
	"mixamorig:RightHand",
	"mixamorig:RightHandThumb1",
	"mixamorig:RightHandThumb2",
	"mixamorig:RightHandThumb3",
	"mixamorig:RightHandThumb4",
	"mixamorig:RightHandIndex1",
	"mixamorig:RightHandIndex2",
	"mixamorig:RightHandIndex3",
	"mixamorig:RightHandIndex4",
	"mixamorig:RightHandMiddle1",
	"mixamorig:RightHandMiddle2",
	"mixamorig:RightHandMiddle3",
	"mixamorig:RightHandMiddle4",
	"mixamorig:RightHandRing1",
	"mixamorig:RightHandRing2",
	"mixamorig:RightHandRing3",
	"mixamorig:RightHandRing4",
	"mixamorig:RightHandPinky1",
	"mixamorig:RightHandPinky2",
	"mixamorig:RightHandPinky3",
	"mixamorig:RightHandPinky4",

	"mixamorig:LeftUpLeg",
	"mixamorig:LeftLeg",
	"mixamorig:LeftFoot",
	"mixamorig:LeftToeBase",
	"mixamorig:LeftToe_End",
	"mixamorig:RightUpLeg",
	"mixamorig:RightLeg",
	"mixamorig:RightFoot",
	"mixamorig:RightToeBase",
	"mixamorig:RightToe_End",
};
} // namespace

std::span<std::string_view const> mixamo::canonical_names() { return canonical_names_v; }

bool mixamo::is_canonical(std::string_view const name) {
	return std::find(std::begin(canonical_names_v), std::end(canonical_names_v), name) != std::end(canonical_names_v);
}
} // namespace rigkit
