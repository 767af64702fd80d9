#include "core/conversion_settings.hpp"
#include "core/poco_config_adapter.hpp"

ConversionSettings ConversionSettings::fromConfig(const PocoConfigAdapter &config)
{
    ConversionSettings settings;

    settings.image_quality = config.getImageQuality();
    settings.preserve_metadata = config.getPreserveMetadata();
    settings.resize_image = config.getResizeImage();
    settings.target_width = config.getImageTargetWidth();
    settings.target_height = config.getImageTargetHeight();
    settings.maintain_aspect_ratio = config.getMaintainAspectRatio();
    settings.enhance_image = config.getEnhanceImage();
    settings.adjust_colors = config.getAdjustColors();
    settings.saturation = config.getSaturation();
    settings.brightness = config.getBrightness();
    settings.contrast = config.getContrast();

    settings.video_bitrate_kbps = config.getVideoBitrateKbps();
    settings.audio_bitrate_kbps = config.getAudioBitrateKbps();
    settings.frame_rate = config.getFrameRate() > 0 ? config.getFrameRate() : 30;
    settings.video_duration_seconds = config.getVideoDurationSeconds();
    settings.video_width = config.getVideoWidth();
    settings.video_height = config.getVideoHeight();

    settings.audio_volume = config.getAudioVolume();
    settings.audio_tempo = config.getAudioTempo();

    settings.animation_frame_count = config.getAnimationFrameCount();
    settings.animation_frame_duration = config.getAnimationFrameDuration();

    settings.image_size_limit = config.getImageSizeLimit();
    settings.audio_size_limit = config.getAudioSizeLimit();
    settings.video_size_limit = config.getVideoSizeLimit();
    settings.document_size_limit = config.getDocumentSizeLimit();

    return settings;
}
