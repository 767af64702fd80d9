#include <gtest/gtest.h>
#include "core/conversion_error.hpp"
#include "core/conversion_strategy.hpp"
#include <optional>

namespace
{
    FormatDescriptor representative(MediaCategory category)
    {
        switch (category)
        {
        case MediaCategory::Image:
            return *FormatDescriptor::fromExtension("png");
        case MediaCategory::Audio:
            return *FormatDescriptor::fromExtension("mp3");
        case MediaCategory::Video:
            return *FormatDescriptor::fromExtension("mp4");
        default:
            return *FormatDescriptor::fromExtension("pdf");
        }
    }

    struct StrategyCase
    {
        MediaCategory from;
        MediaCategory to;
        std::optional<ConversionStrategy> expected;
    };
}

class ConversionStrategyTest : public ::testing::TestWithParam<StrategyCase>
{
};

TEST_P(ConversionStrategyTest, ResolvesCategoryPair)
{
    const auto &param = GetParam();
    auto from = representative(param.from);
    auto to = representative(param.to);

    if (param.expected)
    {
        EXPECT_EQ(resolveStrategy(from, to), *param.expected) << from.toString() << " -> " << to.toString();
        return;
    }

    try
    {
        resolveStrategy(from, to);
        FAIL() << "expected IncompatibleFormats for " << from.toString() << " -> " << to.toString();
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::IncompatibleFormats);
        EXPECT_FALSE(e.isRetryable());
    }
}

INSTANTIATE_TEST_SUITE_P(
    AllCategoryPairs, ConversionStrategyTest,
    ::testing::Values(
        StrategyCase{MediaCategory::Image, MediaCategory::Image, ConversionStrategy::Direct},
        StrategyCase{MediaCategory::Image, MediaCategory::Audio, std::nullopt},
        StrategyCase{MediaCategory::Image, MediaCategory::Video, ConversionStrategy::CreateVideo},
        StrategyCase{MediaCategory::Image, MediaCategory::Document, ConversionStrategy::Combine},
        StrategyCase{MediaCategory::Audio, MediaCategory::Image, ConversionStrategy::Visualize},
        StrategyCase{MediaCategory::Audio, MediaCategory::Audio, ConversionStrategy::Direct},
        StrategyCase{MediaCategory::Audio, MediaCategory::Video, ConversionStrategy::Visualize},
        StrategyCase{MediaCategory::Audio, MediaCategory::Document, std::nullopt},
        StrategyCase{MediaCategory::Video, MediaCategory::Image, ConversionStrategy::ExtractFrame},
        StrategyCase{MediaCategory::Video, MediaCategory::Audio, ConversionStrategy::ExtractAudio},
        StrategyCase{MediaCategory::Video, MediaCategory::Video, ConversionStrategy::Direct},
        StrategyCase{MediaCategory::Video, MediaCategory::Document, std::nullopt},
        StrategyCase{MediaCategory::Document, MediaCategory::Image, ConversionStrategy::ExtractFrame},
        StrategyCase{MediaCategory::Document, MediaCategory::Audio, std::nullopt},
        StrategyCase{MediaCategory::Document, MediaCategory::Video, std::nullopt},
        StrategyCase{MediaCategory::Document, MediaCategory::Document, std::nullopt}));

TEST(ConversionStrategyNameTest, NamesAreStable)
{
    EXPECT_EQ(strategyName(ConversionStrategy::Direct), "direct");
    EXPECT_EQ(strategyName(ConversionStrategy::CreateVideo), "createVideo");
    EXPECT_EQ(strategyName(ConversionStrategy::Visualize), "visualize");
    EXPECT_EQ(strategyName(ConversionStrategy::ExtractFrame), "extractFrame");
    EXPECT_EQ(strategyName(ConversionStrategy::ExtractAudio), "extractAudio");
    EXPECT_EQ(strategyName(ConversionStrategy::Combine), "combine");
}
