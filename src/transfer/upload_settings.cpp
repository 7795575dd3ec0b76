#include "chunkvault/transfer/upload_settings.hpp"
#include "chunkvault/core/config.hpp"

namespace chunkvault::transfer {

UploadSettings UploadSettings::from_config(const core::Config& config) {
    UploadSettings settings;

    settings.min_chunk_size = config.get_uint64("upload.min_chunk_size", settings.min_chunk_size);
    settings.default_chunk_size = config.get_uint64("upload.default_chunk_size", settings.default_chunk_size);
    settings.max_chunk_size = config.get_uint64("upload.max_chunk_size", settings.max_chunk_size);

    settings.max_attempts = static_cast<uint32_t>(
        config.get_uint64("upload.max_retries", settings.max_attempts));
    settings.retry_base_delay = std::chrono::milliseconds(
        config.get_uint64("upload.retry_base_delay_ms", settings.retry_base_delay.count()));
    settings.retry_max_delay = std::chrono::milliseconds(
        config.get_uint64("upload.retry_max_delay_ms", settings.retry_max_delay.count()));
    settings.chunk_timeout = std::chrono::seconds(
        config.get_uint64("upload.chunk_timeout_seconds", settings.chunk_timeout.count()));

    settings.concurrent_uploads = static_cast<uint32_t>(
        config.get_uint64("upload.concurrent_uploads", settings.concurrent_uploads));
    settings.session_ttl = std::chrono::hours(
        config.get_uint64("upload.session_ttl_hours", settings.session_ttl.count()));
    settings.reaper_interval = std::chrono::minutes(
        config.get_uint64("upload.reaper_interval_minutes", settings.reaper_interval.count()));
    settings.status_preview_limit = config.get_uint64("upload.status_preview_limit", settings.status_preview_limit);

    settings.sample_window = config.get_uint64("upload.sample_window", settings.sample_window);
    settings.success_threshold = config.get_double("upload.success_threshold", settings.success_threshold);
    settings.fast_throughput_bps = config.get_uint64("upload.fast_throughput_bps", settings.fast_throughput_bps);

    return settings;
}

bool UploadSettings::validate(std::string& error) const {
    if (min_chunk_size == 0) {
        error = "upload.min_chunk_size must be positive";
        return false;
    }
    if (min_chunk_size > default_chunk_size || default_chunk_size > max_chunk_size) {
        error = "chunk sizes must satisfy min <= default <= max";
        return false;
    }
    if (max_attempts == 0) {
        error = "upload.max_retries must be at least 1";
        return false;
    }
    if (retry_base_delay.count() <= 0 || retry_max_delay < retry_base_delay) {
        error = "retry delays must satisfy 0 < base <= max";
        return false;
    }
    if (concurrent_uploads == 0) {
        error = "upload.concurrent_uploads must be at least 1";
        return false;
    }
    if (session_ttl.count() <= 0 || reaper_interval.count() <= 0) {
        error = "session TTL and reaper interval must be positive";
        return false;
    }
    if (status_preview_limit == 0 || sample_window < 3) {
        error = "status preview limit must be positive and the sample window at least 3";
        return false;
    }
    if (success_threshold <= 0.0 || success_threshold > 1.0) {
        error = "upload.success_threshold must be in (0, 1]";
        return false;
    }
    return true;
}

}
