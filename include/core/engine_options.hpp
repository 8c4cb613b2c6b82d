#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Candidate enumeration settings (config section "scan")
 */
struct ScanOptions
{
    size_t page_size = 100;                    // Handles taken from each album
    double max_video_duration_seconds = 900.0; // Longer videos are skipped
    int max_scan_threads = 4;                  // Albums enumerated in parallel
};

/**
 * @brief Batch metadata resolution settings (config section "resolver")
 */
struct ResolverOptions
{
    size_t batch_size = 5;
    int item_timeout_ms = 3000;
    bool allow_placeholder_uris = true;
    bool validate_results = true;
};

/**
 * @brief URI validation and recovery settings (config section "validation")
 */
struct ValidatorOptions
{
    bool check_image_headers = true;
    size_t recovery_page_size = 500;
    int recovery_timeout_ms = 5000;
    int creation_time_tolerance_ms = 1000;
};

struct EngineOptions
{
    ScanOptions scan;
    ResolverOptions resolver;
    ValidatorOptions validation;
};
