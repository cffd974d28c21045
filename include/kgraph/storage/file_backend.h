#ifndef KGRAPH_STORAGE_FILE_BACKEND_H_
#define KGRAPH_STORAGE_FILE_BACKEND_H_

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "kgraph/storage/backend.h"

namespace kgraph {
namespace storage {

/**
 * @brief Durable backend storing one file per record
 *
 * Layout: <root>/<bucket>/<fan-out prefix>/<escaped key>. Records are written
 * to a temporary file and renamed into place, so a crash leaves either the
 * previous or the new record. A batch is applied op by op; each key is
 * atomic, the batch as a whole is not.
 */
class FileBackend : public StorageBackend {
public:
    explicit FileBackend(std::filesystem::path root, int prefix_nibbles = 3);

    core::Result<void> open() override;
    core::Result<std::optional<Bytes>> get(Bucket bucket, const std::string& key) override;
    core::Result<void> put(Bucket bucket, const std::string& key, const Bytes& value) override;
    core::Result<void> remove(Bucket bucket, const std::string& key) override;
    core::Result<void> scan(Bucket bucket, const std::string& prefix,
                            const ScanVisitor& visitor) override;
    core::Result<size_t> count(Bucket bucket) override;
    core::Result<void> apply(const WriteBatch& batch) override;

    std::string name() const override { return "file"; }
    bool durable() const override { return true; }

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Directory a key is fanned out into
     *
     * Keys starting with a decimal token id ("12", "12:0") share the hash
     * prefix of that id; other keys use a hash of the whole key.
     */
    std::string fan_out(const std::string& key) const;

    static std::string EscapeKey(const std::string& key);
    /// nullopt when a '%' is not followed by two hex digits.
    static std::optional<std::string> UnescapeKey(const std::string& name);

private:
    std::filesystem::path record_path(Bucket bucket, const std::string& key) const;
    core::Result<void> write_record(Bucket bucket, const std::string& key, const Bytes& value);
    core::Result<void> remove_record(Bucket bucket, const std::string& key);

    std::filesystem::path root_;
    int prefix_nibbles_;
    bool opened_ = false;
    std::mutex mutex_;
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_FILE_BACKEND_H_
