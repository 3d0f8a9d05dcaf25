#include <gtest/gtest.h>

#include "Unit/ComponentType.hpp"

namespace {

using CAB::Unit::ComponentType;
using CAB::Unit::EffectType;
using CAB::Unit::IOType;
using CAB::Unit::MainType;
using CAB::Unit::MixerType;

TEST(ComponentTypeTests, SubtypeFamiliesImplyMainType) {
    const ComponentType io = IOType::kHalOutput;
    EXPECT_EQ(io.type, MainType::kOutput);
    EXPECT_EQ(io.subtype, static_cast<uint32_t>('ahal'));

    const ComponentType mixer = MixerType::kMultiChannelMixer;
    EXPECT_EQ(mixer.type, MainType::kMixer);

    const ComponentType effect = EffectType::kLowPassFilter;
    EXPECT_EQ(effect.TypeCode(), static_cast<uint32_t>('aufx'));
}

TEST(ComponentTypeTests, MainTypeAloneSearchesAllSubtypes) {
    const ComponentType generator = MainType::kGenerator;
    EXPECT_FALSE(generator.subtype.has_value());

    const auto search = generator.ToSearchDescription();
    EXPECT_EQ(search.componentType, static_cast<uint32_t>('augn'));
    EXPECT_EQ(search.componentSubType, 0u);
    EXPECT_EQ(search.componentManufacturer, 0u);
}

TEST(ComponentTypeTests, SearchDescriptionCarriesSubtype) {
    const auto search = ComponentType(IOType::kDefaultOutput).ToSearchDescription();
    EXPECT_EQ(search.componentType, static_cast<uint32_t>('auou'));
    EXPECT_EQ(search.componentSubType, static_cast<uint32_t>('def '));
}

TEST(ComponentTypeTests, Equality) {
    EXPECT_EQ(ComponentType(IOType::kGenericOutput), ComponentType(MainType::kOutput, 'genr'));
    EXPECT_NE(ComponentType(IOType::kGenericOutput), ComponentType(MainType::kOutput));
}

TEST(ComponentTypeTests, MainTypeNames) {
    EXPECT_EQ(CAB::Unit::ToString(MainType::kFormatConverter), "FormatConverter");
    EXPECT_EQ(CAB::Unit::ToString(MainType::kMidiProcessor), "MidiProcessor");
}

} // namespace
