#pragma once

#if defined(_WIN32)
    #if defined(RUSSELL_EXPORT)
        #define RUSSELL_C_API __declspec(dllexport)
    #else
        #define RUSSELL_C_API __declspec(dllimport)
    #endif
#else
    #define RUSSELL_C_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
RUSSELL_C_API const char* russell_get_last_error();
RUSSELL_C_API const char* russell_get_version();

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* h_engine_t;

// =============================================================================
//  Engine Lifecycle
// =============================================================================

// config_json may be NULL (defaults + environment) or a JSON object
// overlaid on the defaults, e.g. {"reasoning": {"max_depth": 8}}
RUSSELL_C_API h_engine_t russell_engine_create(const char* config_json);
RUSSELL_C_API void russell_engine_destroy(h_engine_t handle);

// =============================================================================
//  Core Operations (JSON out; free with russell_free_string)
// =============================================================================

// context_json may be NULL (empty object); depth <= 0 selects the default depth
RUSSELL_C_API char* russell_ground(h_engine_t handle, const char* statement, const char* context_json);
RUSSELL_C_API char* russell_reason(h_engine_t handle, const char* query, const char* context_json, int depth);
RUSSELL_C_API char* russell_reflect(h_engine_t handle, const char* query, const char* context_json);
RUSSELL_C_API char* russell_process(h_engine_t handle, const char* query);
RUSSELL_C_API char* russell_get_metrics_json(h_engine_t handle);

// =============================================================================
//  Metrics
// =============================================================================

typedef struct HEngineMetrics {
    double lambda_total;
    double avg_certainty;
    double avg_emergence;
    double cache_hit_rate;
    bool converged;
    double convergence_confidence;
    size_t cycles_completed;
    size_t queries_processed;
} HEngineMetrics;

RUSSELL_C_API bool russell_get_metrics(h_engine_t handle, HEngineMetrics* out_metrics);
RUSSELL_C_API double russell_lambda_total(h_engine_t handle);

// =============================================================================
//  Concept Graph
// =============================================================================

RUSSELL_C_API bool russell_add_concept(h_engine_t handle, const char* name);
RUSSELL_C_API bool russell_relate(h_engine_t handle, const char* from, const char* to);

// =============================================================================
//  Primitives
// =============================================================================

RUSSELL_C_API void russell_blake3_hash(const char* data, size_t len, uint8_t* out_16b);

RUSSELL_C_API void russell_free_string(char* str);

#ifdef __cplusplus
}
#endif
