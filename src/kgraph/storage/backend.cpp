#include "kgraph/storage/backend.h"

namespace kgraph {
namespace storage {

const char* BucketName(Bucket bucket) {
    switch (bucket) {
        case Bucket::TOKENS: return "tokens";
        case Bucket::EDGE_BLOCKS: return "edge_blocks";
        case Bucket::EMBEDDINGS: return "embeddings";
        case Bucket::META: return "meta";
    }
    return "unknown";
}

const std::vector<Bucket>& AllBuckets() {
    static const std::vector<Bucket> buckets = {
        Bucket::TOKENS, Bucket::EDGE_BLOCKS, Bucket::EMBEDDINGS, Bucket::META};
    return buckets;
}

} // namespace storage
} // namespace kgraph
