#include "kgraph/core/config.h"

#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace kgraph {
namespace core {
namespace config_utils {

namespace {

// Reads typed members out of one JSON object, remembering the first problem.
class SectionReader {
public:
    SectionReader(const rapidjson::Value* obj, std::string section, std::string* error)
        : obj_(obj), section_(std::move(section)), error_(error) {}

    void read(const char* key, bool& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsBool()) { fail(key, "boolean"); return; }
        out = v->GetBool();
    }

    void read(const char* key, uint32_t& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsUint()) { fail(key, "non-negative integer"); return; }
        out = v->GetUint();
    }

    void read(const char* key, int& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsInt()) { fail(key, "integer"); return; }
        out = v->GetInt();
    }

    void read(const char* key, double& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsNumber()) { fail(key, "number"); return; }
        out = v->GetDouble();
    }

    void read(const char* key, std::string& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsString()) { fail(key, "string"); return; }
        out.assign(v->GetString(), v->GetStringLength());
    }

    void read(const char* key, std::vector<std::string>& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsArray()) { fail(key, "array of strings"); return; }
        std::vector<std::string> items;
        for (const auto& item : v->GetArray()) {
            if (!item.IsString()) { fail(key, "array of strings"); return; }
            items.emplace_back(item.GetString(), item.GetStringLength());
        }
        out = std::move(items);
    }

    const rapidjson::Value* object(const char* key) {
        const rapidjson::Value* v = find(key);
        if (!v) return nullptr;
        if (!v->IsObject()) { fail(key, "object"); return nullptr; }
        return v;
    }

private:
    const rapidjson::Value* find(const char* key) const {
        if (!obj_ || !error_->empty()) return nullptr;
        auto it = obj_->FindMember(key);
        if (it == obj_->MemberEnd()) return nullptr;
        return &it->value;
    }

    void fail(const char* key, const char* expected) {
        if (error_->empty()) {
            *error_ = section_ + "." + key + ": expected " + expected;
        }
    }

    const rapidjson::Value* obj_;
    std::string section_;
    std::string* error_;
};

const rapidjson::Value* section(const rapidjson::Document& doc, const char* name, std::string* error) {
    auto it = doc.FindMember(name);
    if (it == doc.MemberEnd()) return nullptr;
    if (!it->value.IsObject()) {
        if (error->empty()) *error = std::string(name) + ": expected object";
        return nullptr;
    }
    return &it->value;
}

} // namespace

Result<Config> load_from_json(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return Result<Config>::error(
            std::string("Config parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<Config>::error("Config root must be an object", Error::Code::INVALID_ARGUMENT);
    }

    Config config = Config::Default();
    std::string error;

    {
        SectionReader r(section(doc, "storage", &error), "storage", &error);
        std::string backend;
        r.read("backend", backend);
        if (backend == "memory") {
            config.storage.backend = BackendType::MEMORY;
        } else if (backend == "file") {
            config.storage.backend = BackendType::FILE;
        } else if (!backend.empty() && error.empty()) {
            error = "storage.backend: unknown backend '" + backend + "'";
        }
        r.read("data_dir", config.storage.data_dir);
        r.read("degrade_to_memory", config.storage.degrade_to_memory);
        r.read("hash_prefix_nibbles", config.storage.hash_prefix_nibbles);
    }
    {
        SectionReader r(section(doc, "codec", &error), "codec", &error);
        r.read("prefer_compression", config.codec.prefer_compression);
    }
    {
        SectionReader r(section(doc, "gc", &error), "gc", &error);
        r.read("lambda_per_day", config.gc.lambda_per_day);
        r.read("w_min", config.gc.w_min);
        r.read("age_max_days", config.gc.age_max_days);
        r.read("w_old_min", config.gc.w_old_min);
    }
    {
        SectionReader r(section(doc, "vector", &error), "vector", &error);
        r.read("provider", config.vector.provider);
        r.read("dim", config.vector.dim);
        r.read("quantize8", config.vector.quantize8);
        r.read("normalize", config.vector.normalize);
        r.read("batch_size", config.vector.batch_size);
    }
    {
        SectionReader r(section(doc, "hybrid", &error), "hybrid", &error);
        r.read("alpha", config.hybrid.alpha);
        r.read("beta", config.hybrid.beta);
    }
    {
        SectionReader r(section(doc, "growth", &error), "growth", &error);
        GrowthConfig& g = config.growth;
        r.read("max_iterations", g.max_iterations);
        r.read("concurrency", g.concurrency);
        r.read("ring_size", g.ring_size);
        r.read("child_branches", g.child_branches);
        r.read("hidden_depth", g.hidden_depth);
        r.read("max_nodes", g.max_nodes);
        r.read("max_edges", g.max_edges);
        r.read("collapse_radius", g.collapse_radius);
        r.read("fan_out", g.fan_out);
        r.read("affinity_threshold", g.affinity_threshold);
        r.read("allow_synthetic_fallback", g.allow_synthetic_fallback);
        r.read("use_context_salience", g.use_context_salience);
        r.read("stopwords", g.stopwords);

        SectionReader s(r.object("salience"), "growth.salience", &error);
        s.read("degree", g.salience.degree);
        s.read("weight_sum", g.salience.weight_sum);
        s.read("frequency", g.salience.frequency);

        SectionReader c(r.object("context_salience"), "growth.context_salience", &error);
        c.read("base", g.context_salience.base);
        c.read("intertwining", g.context_salience.intertwining);
        c.read("peakiness", g.context_salience.peakiness);
    }
    {
        SectionReader r(section(doc, "logging", &error), "logging", &error);
        r.read("level", config.logging.level);
    }

    if (!error.empty()) {
        return Result<Config>::error(error, Error::Code::INVALID_ARGUMENT);
    }
    return Result<Config>(std::move(config));
}

Result<Config> load_from_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<Config>::error("Cannot open config file: " + path, Error::Code::NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_json(buffer.str());
}

std::vector<std::string> validate(const Config& config) {
    std::vector<std::string> problems;
    if (config.storage.backend == BackendType::FILE && config.storage.data_dir.empty()) {
        problems.push_back("storage.data_dir is required for the file backend");
    }
    if (config.storage.hash_prefix_nibbles < 0 || config.storage.hash_prefix_nibbles > 8) {
        problems.push_back("storage.hash_prefix_nibbles must be within [0, 8]");
    }
    if (config.vector.dim == 0) {
        problems.push_back("vector.dim must be positive");
    }
    if (config.vector.batch_size == 0) {
        problems.push_back("vector.batch_size must be positive");
    }
    if (config.vector.provider.empty()) {
        problems.push_back("vector.provider must not be empty");
    }
    if (config.hybrid.alpha < 0.0 || config.hybrid.beta < 0.0) {
        problems.push_back("hybrid weights must be non-negative");
    }
    if (config.growth.concurrency == 0) {
        problems.push_back("growth.concurrency must be at least 1");
    }
    if (config.growth.max_nodes == 0 || config.growth.max_edges == 0) {
        problems.push_back("growth.max_nodes and growth.max_edges must be positive");
    }
    if (config.gc.lambda_per_day < 0.0) {
        problems.push_back("gc.lambda_per_day must be non-negative");
    }
    return problems;
}

} // namespace config_utils
} // namespace core
} // namespace kgraph
