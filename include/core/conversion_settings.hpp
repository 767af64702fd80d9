#pragma once

#include <cstdint>
#include <string>

class PocoConfigAdapter;

/**
 * @brief Immutable snapshot of the caller-tunable conversion options
 */
struct ConversionSettings
{
    // Image
    double image_quality = 0.95;
    bool preserve_metadata = true;
    bool resize_image = false;
    int target_width = 1920;
    int target_height = 1080;
    bool maintain_aspect_ratio = true;
    bool enhance_image = false;
    bool adjust_colors = false;
    double saturation = 1.0;
    double brightness = 0.0;
    double contrast = 1.0;

    // Video
    int video_bitrate_kbps = 0;
    int audio_bitrate_kbps = 0;
    int frame_rate = 30;
    double video_duration_seconds = 3.0;
    int video_width = 1280;
    int video_height = 720;

    // Audio mix
    double audio_volume = 1.0;
    double audio_tempo = 1.0;

    // Animated outputs
    int animation_frame_count = 10;
    double animation_frame_duration = 0.1;

    // Input size limits in bytes
    uint64_t image_size_limit = 100ULL * 1024 * 1024;
    uint64_t audio_size_limit = 500ULL * 1024 * 1024;
    uint64_t video_size_limit = 1000ULL * 1024 * 1024;
    uint64_t document_size_limit = 200ULL * 1024 * 1024;

    static ConversionSettings fromConfig(const PocoConfigAdapter &config);
};
