#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Top-level media categories plus the Audiovisual supercategory.
 *
 * Audiovisual is only meaningful as a conformance query; no descriptor
 * carries it as its own category.
 */
enum class MediaCategory
{
    Image,
    Audio,
    Video,
    Document,
    Audiovisual
};

std::string categoryName(MediaCategory category);

/**
 * @brief Identifies a concrete file format (by lower-case extension) and its category.
 */
class FormatDescriptor
{
public:
    FormatDescriptor(std::string identifier, MediaCategory category);

    /**
     * @brief Look up a format by extension ("png", ".PNG" and "Png" are equivalent)
     * @return Descriptor, or std::nullopt for unknown extensions
     */
    static std::optional<FormatDescriptor> fromExtension(const std::string &extension);

    /**
     * @brief Look up a format from the extension of a path
     */
    static std::optional<FormatDescriptor> forPath(const std::string &path);

    /**
     * @brief All known formats of one category, in table order
     */
    static std::vector<FormatDescriptor> formatsFor(MediaCategory category);

    const std::string &identifier() const { return identifier_; }
    const std::string &extension() const { return identifier_; }
    MediaCategory category() const { return category_; }

    /**
     * @brief Reflexive and exclusive across the four top-level categories;
     * video formats additionally conform to Audiovisual.
     */
    bool conformsTo(MediaCategory category) const;

    bool sameCategory(const FormatDescriptor &other) const { return category_ == other.category_; }

    std::string toString() const;

    bool operator==(const FormatDescriptor &other) const { return identifier_ == other.identifier_; }
    bool operator!=(const FormatDescriptor &other) const { return !(*this == other); }

private:
    std::string identifier_;
    MediaCategory category_;
};
