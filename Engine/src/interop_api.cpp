#include <interop_api.h>
#include <cognitive/cognitive_core.hpp>
#include <config/engine_config.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <serialization/record_json.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <memory>

// Thread-local error storage
thread_local std::string g_last_error;

const char* russell_get_last_error() {
    return g_last_error.c_str();
}

const char* russell_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

static void set_error(const std::string& message) {
    g_last_error = message;
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Helper for string duplication
static char* strdup_safe(const std::string& str) {
#ifdef _WIN32
    return _strdup(str.c_str());
#else
    return strdup(str.c_str());
#endif
}

static Russell::Context parse_context(const char* context_json) {
    if (!context_json || !*context_json) return Russell::Context::object();
    auto context = nlohmann::json::parse(context_json);
    if (!context.is_object()) {
        throw std::invalid_argument("Context must be a JSON object");
    }
    return context;
}

static Russell::CognitiveCore* as_core(h_engine_t handle) {
    if (!handle) throw std::invalid_argument("Null engine handle");
    return static_cast<Russell::CognitiveCore*>(handle);
}

// =============================================================================
//  Engine Lifecycle
// =============================================================================

h_engine_t russell_engine_create(const char* config_json) {
    INTEROP_TRY_CATCH_PTR({
        Russell::EngineConfig config;
        if (config_json && *config_json) {
            config.apply_json(nlohmann::json::parse(config_json));
        }
        config.apply_env();
        Russell::Logger::set_level(config.log_level);
        auto* core = new Russell::CognitiveCore(config);
        return static_cast<h_engine_t>(core);
    })
}

void russell_engine_destroy(h_engine_t handle) {
    if (handle) {
        delete static_cast<Russell::CognitiveCore*>(handle);
    }
}

// =============================================================================
//  Core Operations
// =============================================================================

char* russell_ground(h_engine_t handle, const char* statement, const char* context_json) {
    INTEROP_TRY_CATCH_PTR({
        if (!statement) throw std::invalid_argument("Null statement");
        auto grounded = as_core(handle)->ground(statement, parse_context(context_json));
        return strdup_safe(Russell::dump_record(grounded));
    })
}

char* russell_reason(h_engine_t handle, const char* query, const char* context_json, int depth) {
    INTEROP_TRY_CATCH_PTR({
        if (!query) throw std::invalid_argument("Null query");
        auto* core = as_core(handle);
        auto context = parse_context(context_json);
        auto result = depth > 0 ? core->reason_about(query, context, depth)
                                : core->reason_about(query, context);
        return strdup_safe(Russell::dump_record(result));
    })
}

char* russell_reflect(h_engine_t handle, const char* query, const char* context_json) {
    INTEROP_TRY_CATCH_PTR({
        if (!query) throw std::invalid_argument("Null query");
        auto outcome = as_core(handle)->reflect(query, parse_context(context_json));
        return strdup_safe(Russell::dump_record(outcome));
    })
}

char* russell_process(h_engine_t handle, const char* query) {
    INTEROP_TRY_CATCH_PTR({
        if (!query) throw std::invalid_argument("Null query");
        auto path = as_core(handle)->process(query);
        return strdup_safe(Russell::dump_record(path));
    })
}

char* russell_get_metrics_json(h_engine_t handle) {
    INTEROP_TRY_CATCH_PTR({
        return strdup_safe(Russell::dump_record(as_core(handle)->get_metrics()));
    })
}

// =============================================================================
//  Metrics
// =============================================================================

bool russell_get_metrics(h_engine_t handle, HEngineMetrics* out_metrics) {
    if (!out_metrics) {
        set_error("Null metrics output");
        return false;
    }
    INTEROP_TRY_CATCH({
        auto m = as_core(handle)->get_metrics();
        out_metrics->lambda_total = m.lambda_total;
        out_metrics->avg_certainty = m.avg_certainty;
        out_metrics->avg_emergence = m.avg_emergence;
        out_metrics->cache_hit_rate = m.cache_hit_rate;
        out_metrics->converged = m.convergence.converged;
        out_metrics->convergence_confidence = m.convergence.confidence;
        out_metrics->cycles_completed = m.cycles_completed;
        out_metrics->queries_processed = m.queries_processed;
        return true;
    })
}

double russell_lambda_total(h_engine_t handle) {
    if (!handle) return 0.0;
    return static_cast<Russell::CognitiveCore*>(handle)->lambda_total();
}

// =============================================================================
//  Concept Graph
// =============================================================================

bool russell_add_concept(h_engine_t handle, const char* name) {
    INTEROP_TRY_CATCH({
        if (!name) throw std::invalid_argument("Null concept name");
        as_core(handle)->add_concept(name);
        return true;
    })
}

bool russell_relate(h_engine_t handle, const char* from, const char* to) {
    INTEROP_TRY_CATCH({
        if (!from || !to) throw std::invalid_argument("Null concept name");
        as_core(handle)->relate(from, to);
        return true;
    })
}

// =============================================================================
//  Primitives
// =============================================================================

void russell_blake3_hash(const char* data, size_t len, uint8_t* out_16b) {
    auto hash = Russell::BLAKE3Pipeline::hash(data, len);
    std::memcpy(out_16b, hash.data(), Russell::BLAKE3Pipeline::HASH_SIZE);
}

void russell_free_string(char* str) {
    free(str);
}
