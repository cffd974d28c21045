#include "kgraph/storage/file_backend.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <vector>

#include "kgraph/common/logger.h"
#include "kgraph/core/types.h"

namespace fs = std::filesystem;

namespace kgraph {
namespace storage {

namespace {

constexpr const char* kTempSuffix = ".tmp";

uint32_t Fnv1a(const std::string& s) {
    uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

bool IsTempFile(const fs::path& p) {
    return p.extension() == kTempSuffix;
}

core::Result<void> Unavailable(const std::string& message) {
    return core::Result<void>::error(message, core::Error::Code::STORAGE_UNAVAILABLE);
}

} // namespace

FileBackend::FileBackend(fs::path root, int prefix_nibbles)
    : root_(std::move(root)), prefix_nibbles_(prefix_nibbles) {}

core::Result<void> FileBackend::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (root_.empty()) {
        return Unavailable("File backend requires a data directory");
    }
    std::error_code ec;
    for (Bucket bucket : AllBuckets()) {
        fs::create_directories(root_ / BucketName(bucket), ec);
        if (ec) {
            return Unavailable("Cannot create " + (root_ / BucketName(bucket)).string() + ": " + ec.message());
        }
    }

    // Probe that the medium accepts writes before claiming durability.
    fs::path probe = root_ / BucketName(Bucket::META) / (std::string(".probe") + kTempSuffix);
    {
        std::ofstream out(probe, std::ios::binary | std::ios::trunc);
        if (!out || !(out << "ok")) {
            return Unavailable("Data directory is not writable: " + root_.string());
        }
    }
    fs::remove(probe, ec);

    opened_ = true;
    KGRAPH_DEBUG("File backend opened at {}", root_.string());
    return core::Result<void>();
}

std::string FileBackend::fan_out(const std::string& key) const {
    size_t digits = 0;
    while (digits < key.size() && digits < 10 && std::isdigit(static_cast<unsigned char>(key[digits]))) {
        ++digits;
    }
    bool numeric_head = digits > 0 && (digits == key.size() || key[digits] == ':');
    if (numeric_head) {
        unsigned long long id = std::stoull(key.substr(0, digits));
        if (id <= 0xffffffffULL) {
            return core::HashPrefix(static_cast<uint32_t>(id), prefix_nibbles_);
        }
    }
    return core::HashPrefix(Fnv1a(key), prefix_nibbles_);
}

std::string FileBackend::EscapeKey(const std::string& key) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (c == '/' || c == '\\' || c == '%' || c == '.' || c < 0x20) {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0f]);
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::optional<std::string> FileBackend::UnescapeKey(const std::string& name) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '%') {
            out.push_back(name[i]);
            continue;
        }
        if (i + 2 >= name.size()) {
            return std::nullopt;
        }
        int hi = nibble(name[i + 1]);
        int lo = nibble(name[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

fs::path FileBackend::record_path(Bucket bucket, const std::string& key) const {
    return root_ / BucketName(bucket) / fan_out(key) / EscapeKey(key);
}

core::Result<void> FileBackend::write_record(Bucket bucket, const std::string& key, const Bytes& value) {
    fs::path target = record_path(bucket, key);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Unavailable("Cannot create " + target.parent_path().string() + ": " + ec.message());
    }
    fs::path temp = target;
    temp += kTempSuffix;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Unavailable("Cannot write " + temp.string());
        }
        out.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        if (!out) {
            return Unavailable("Short write to " + temp.string());
        }
    }
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Unavailable("Cannot rename record into place: " + target.string());
    }
    return core::Result<void>();
}

core::Result<void> FileBackend::remove_record(Bucket bucket, const std::string& key) {
    std::error_code ec;
    fs::remove(record_path(bucket, key), ec);
    if (ec) {
        return Unavailable("Cannot remove record " + key + ": " + ec.message());
    }
    return core::Result<void>();
}

core::Result<std::optional<Bytes>> FileBackend::get(Bucket bucket, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<std::optional<Bytes>>::error("File backend not opened",
                                                         core::Error::Code::NOT_INITIALIZED);
    }
    std::ifstream in(record_path(bucket, key), std::ios::binary);
    if (!in) {
        return core::Result<std::optional<Bytes>>(std::nullopt);
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return core::Result<std::optional<Bytes>>(std::make_optional(std::move(data)));
}

core::Result<void> FileBackend::put(Bucket bucket, const std::string& key, const Bytes& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<void>::error("File backend not opened", core::Error::Code::NOT_INITIALIZED);
    }
    return write_record(bucket, key, value);
}

core::Result<void> FileBackend::remove(Bucket bucket, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<void>::error("File backend not opened", core::Error::Code::NOT_INITIALIZED);
    }
    return remove_record(bucket, key);
}

core::Result<void> FileBackend::scan(Bucket bucket, const std::string& prefix,
                                     const ScanVisitor& visitor) {
    std::vector<std::pair<std::string, fs::path>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_) {
            return core::Result<void>::error("File backend not opened", core::Error::Code::NOT_INITIALIZED);
        }
        std::error_code ec;
        fs::path dir = root_ / BucketName(bucket);
        for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec) || IsTempFile(it->path())) continue;
            auto key = UnescapeKey(it->path().filename().string());
            if (!key) {
                KGRAPH_WARN("Skipping file with a malformed key name: {}", it->path().string());
                continue;
            }
            if (key->compare(0, prefix.size(), prefix) == 0) {
                entries.emplace_back(std::move(*key), it->path());
            }
        }
        if (ec) {
            return Unavailable("Cannot list " + dir.string() + ": " + ec.message());
        }
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        std::ifstream in(entry.second, std::ios::binary);
        if (!in) continue;  // removed since listing
        Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!visitor(entry.first, data)) break;
    }
    return core::Result<void>();
}

core::Result<size_t> FileBackend::count(Bucket bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<size_t>::error("File backend not opened", core::Error::Code::NOT_INITIALIZED);
    }
    size_t n = 0;
    std::error_code ec;
    fs::path dir = root_ / BucketName(bucket);
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && !IsTempFile(it->path())) ++n;
    }
    if (ec) {
        return core::Result<size_t>::error("Cannot list " + dir.string() + ": " + ec.message(),
                                           core::Error::Code::STORAGE_UNAVAILABLE);
    }
    return core::Result<size_t>(n);
}

core::Result<void> FileBackend::apply(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<void>::error("File backend not opened", core::Error::Code::NOT_INITIALIZED);
    }
    // Writes before deletes, so an interrupted batch never loses the new data.
    // The last op on a key decides its fate, as with in-order application.
    std::map<std::pair<Bucket, std::string>, const WriteBatch::Op*> last;
    for (const auto& op : batch.ops()) {
        last[std::make_pair(op.bucket, op.key)] = &op;
    }
    for (const auto& entry : last) {
        const WriteBatch::Op* op = entry.second;
        if (!op->value) continue;
        auto result = write_record(op->bucket, op->key, *op->value);
        if (!result.ok()) return result;
    }
    for (const auto& entry : last) {
        const WriteBatch::Op* op = entry.second;
        if (op->value) continue;
        auto result = remove_record(op->bucket, op->key);
        if (!result.ok()) return result;
    }
    return core::Result<void>();
}

} // namespace storage
} // namespace kgraph
