#include <gtest/gtest.h>
#include "core/format_descriptor.hpp"

TEST(FormatDescriptorTest, ExtensionLookupIsCaseAndDotInsensitive)
{
    auto png = FormatDescriptor::fromExtension("png");
    auto dotted = FormatDescriptor::fromExtension(".PNG");
    auto mixed = FormatDescriptor::fromExtension("Png");

    ASSERT_TRUE(png.has_value());
    ASSERT_TRUE(dotted.has_value());
    ASSERT_TRUE(mixed.has_value());
    EXPECT_EQ(*png, *dotted);
    EXPECT_EQ(*png, *mixed);
    EXPECT_EQ(png->identifier(), "png");
    EXPECT_EQ(png->category(), MediaCategory::Image);
}

TEST(FormatDescriptorTest, UnknownExtensionHasNoDescriptor)
{
    EXPECT_FALSE(FormatDescriptor::fromExtension("xyz").has_value());
    EXPECT_FALSE(FormatDescriptor::fromExtension("").has_value());
    EXPECT_FALSE(FormatDescriptor::forPath("/tmp/no_extension").has_value());
}

TEST(FormatDescriptorTest, ForPathUsesTheLastExtension)
{
    auto format = FormatDescriptor::forPath("/data/archive.tar.MP4");
    ASSERT_TRUE(format.has_value());
    EXPECT_EQ(format->identifier(), "mp4");
    EXPECT_EQ(format->category(), MediaCategory::Video);
}

TEST(FormatDescriptorTest, EveryFormatBelongsToExactlyOneTopLevelCategory)
{
    const MediaCategory categories[] = {MediaCategory::Image, MediaCategory::Audio, MediaCategory::Video,
                                        MediaCategory::Document};
    for (auto category : categories)
    {
        auto formats = FormatDescriptor::formatsFor(category);
        ASSERT_FALSE(formats.empty()) << categoryName(category);
        for (const auto &format : formats)
        {
            int matches = 0;
            for (auto other : categories)
            {
                if (format.conformsTo(other))
                {
                    ++matches;
                }
            }
            EXPECT_EQ(matches, 1) << format.toString();
            EXPECT_TRUE(format.conformsTo(category)) << format.toString();
        }
    }
}

TEST(FormatDescriptorTest, OnlyVideoConformsToAudiovisual)
{
    EXPECT_TRUE(FormatDescriptor::fromExtension("mov")->conformsTo(MediaCategory::Audiovisual));
    EXPECT_TRUE(FormatDescriptor::fromExtension("mp4")->conformsTo(MediaCategory::Audiovisual));
    EXPECT_FALSE(FormatDescriptor::fromExtension("mp3")->conformsTo(MediaCategory::Audiovisual));
    EXPECT_FALSE(FormatDescriptor::fromExtension("jpg")->conformsTo(MediaCategory::Audiovisual));
    EXPECT_FALSE(FormatDescriptor::fromExtension("pdf")->conformsTo(MediaCategory::Audiovisual));
}

TEST(FormatDescriptorTest, KnownFormatsMapToExpectedCategories)
{
    EXPECT_EQ(FormatDescriptor::fromExtension("heic")->category(), MediaCategory::Image);
    EXPECT_EQ(FormatDescriptor::fromExtension("jpeg")->category(), MediaCategory::Image);
    EXPECT_EQ(FormatDescriptor::fromExtension("flac")->category(), MediaCategory::Audio);
    EXPECT_EQ(FormatDescriptor::fromExtension("m4a")->category(), MediaCategory::Audio);
    EXPECT_EQ(FormatDescriptor::fromExtension("webm")->category(), MediaCategory::Video);
    EXPECT_EQ(FormatDescriptor::fromExtension("pdf")->category(), MediaCategory::Document);
}

TEST(FormatDescriptorTest, ToStringNamesIdentifierAndCategory)
{
    EXPECT_EQ(FormatDescriptor::fromExtension("wav")->toString(), "wav (audio)");
}
