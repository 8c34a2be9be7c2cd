#include <cognitive/reasoning_path.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace Russell {

std::string ReasoningPath::compute_hash() const {
    BLAKE3Pipeline::Incremental h;
    h.field(id)
     .field(query)
     .field(grounding_hash)
     .field(grounding_certainty)
     .field(reasoning.hash)
     .field(cycle.hash)
     .field(static_cast<int64_t>(reasoning_depth))
     .field(emergence)
     .field(lambda_impact)
     .field(static_cast<int64_t>(safety.all_passed() ? 1 : 0));
    return h.finalize_hex();
}

} // namespace Russell
