#ifndef KGRAPH_VECTOR_EMBEDDING_PROVIDER_H_
#define KGRAPH_VECTOR_EMBEDDING_PROVIDER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "kgraph/core/result.h"
#include "kgraph/core/types.h"

namespace kgraph {
namespace vector {

/**
 * @brief Produces fixed-dimension vectors for text
 *
 * Implementations may be slow or remote and may fail; failures are reported
 * as ORACLE_FAILURE.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::string name() const = 0;
    virtual uint32_t dim() const = 0;

    /**
     * @brief One vector per input text, in input order
     */
    virtual core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) = 0;
};

/**
 * @brief Deterministic offline provider using signed character trigram hashing
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(uint32_t dim, std::string name = "hashing")
        : dim_(dim), name_(std::move(name)) {}

    std::string name() const override { return name_; }
    uint32_t dim() const override { return dim_; }

    core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) override;

    core::Vector embed_one(const std::string& text) const;

private:
    uint32_t dim_;
    std::string name_;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_EMBEDDING_PROVIDER_H_
