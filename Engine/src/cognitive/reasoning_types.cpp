#include <cognitive/reasoning_types.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <algorithm>

namespace Russell {

const char* to_string(RefinementKind kind) {
    switch (kind) {
        case RefinementKind::Hypothesis:  return "hypothesis";
        case RefinementKind::Resolution:  return "resolution";
        case RefinementKind::Implication: return "implication";
    }
    return "unknown";
}

size_t RefinementNode::total_refinements() const {
    size_t total = 0;
    for (const RefinementNode* node = this; node; node = node->next.get()) {
        total += node->refinements.size();
    }
    return total;
}

size_t RefinementNode::chain_length() const {
    size_t length = 0;
    for (const RefinementNode* node = this; node; node = node->next.get()) {
        ++length;
    }
    return length;
}

const RefinementNode& RefinementNode::deepest() const {
    const RefinementNode* node = this;
    while (node->next) node = node->next.get();
    return *node;
}

namespace {

void hash_list(BLAKE3Pipeline::Incremental& h, const std::vector<std::string>& items) {
    h.field(static_cast<int64_t>(items.size()));
    for (const auto& item : items) h.field(item);
}

} // namespace

size_t ReasoningResult::direct_inference_count() const {
    return static_cast<size_t>(std::count_if(inferences.begin(), inferences.end(),
        [](const Inference& inf) { return inf.kind == "entity_known"; }));
}

std::string ReasoningResult::compute_hash() const {
    BLAKE3Pipeline::Incremental h;
    h.field(query);

    hash_list(h, components.entities);
    hash_list(h, components.relations);
    hash_list(h, components.quantifiers);
    hash_list(h, components.modalities);
    hash_list(h, components.actions);
    hash_list(h, components.connectives);

    h.field(static_cast<int64_t>(inferences.size()));
    for (const auto& inf : inferences) {
        h.field(inf.kind).field(inf.subject);
        hash_list(h, inf.related);
    }
    hash_list(h, contradictions);
    hash_list(h, unknowns);

    h.field(static_cast<int64_t>(patterns.size()));
    for (const auto& p : patterns) {
        h.field(p.type).field(p.certainty).field(p.description);
    }

    for (const RefinementNode* node = refinement.get(); node; node = node->next.get()) {
        h.field(static_cast<int64_t>(node->level))
         .field(static_cast<int64_t>(node->budget))
         .field(static_cast<int64_t>(node->max_depth_reached ? 1 : 0));
        for (const auto& r : node->refinements) {
            h.field(to_string(r.kind)).field(r.subject).field(r.content).field(r.certainty);
        }
        hash_list(h, node->carried_unknowns);
    }

    h.field(certainty).field(emergence).field(static_cast<int64_t>(depth_used));
    return h.finalize_hex();
}

} // namespace Russell
