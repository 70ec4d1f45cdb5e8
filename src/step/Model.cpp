#include "ifc-core/step/Model.hpp"
#include "ifc-core/step/Decoder.hpp"
#include "ifc-core/step/Units.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ifccore::step {

namespace {

const std::vector<EntityId> kNoIds;

// Share of the overall progress range given to each phase
constexpr double kScanEnd = 0.8;
constexpr double kSpatialEnd = 0.9;

} // anonymous namespace

Result<std::shared_ptr<Model>> Model::parseFile(const std::string& filepath,
                                                const ParseOptions& options,
                                                const ProgressCallback& progress) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::shared_ptr<Model>>::error(ErrorCode::Io,
            "Could not open file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::shared_ptr<Model>>::error(ErrorCode::Io,
            "Failed to read file: " + filepath);
    }
    return parse(buffer.str(), options, progress);
}

Result<std::shared_ptr<Model>> Model::parse(std::string content,
                                            const ParseOptions& options,
                                            const ProgressCallback& progress) {
    auto startTime = std::chrono::high_resolution_clock::now();

    std::shared_ptr<Model> model(new Model());
    model->content_ = std::move(content);
    model->header_ = parseHeader(model->content_, options.verbose);

    Scanner scanner(model->content_);
    if (progress) {
        scanner.setProgressCallback([&progress](const std::string& phase, double fraction) {
            progress(phase, fraction * kScanEnd);
        }, options.progressChunkBytes);
    }

    Result<RawEntity> record;
    while (scanner.next(record)) {
        if (record && model->raw_.count(record.value.id) > 0) {
            // First definition wins; the duplicate is reported as malformed
            EntityId id = record.value.id;
            size_t offset = record.value.offset;
            record = Result<RawEntity>::error(ErrorCode::ParseError,
                "Duplicate entity id #" + std::to_string(id) + " at byte " + std::to_string(offset));
            record.byteOffset = offset;
            record.entityId = id;
        }

        if (!record) {
            if (options.strict) {
                return Result<std::shared_ptr<Model>>::from(record);
            }
            ScanIssue issue;
            issue.byteOffset = record.byteOffset.value_or(0);
            issue.entityId = record.entityId;
            issue.message = record.errorMessage;
            if (options.verbose) {
                std::cerr << "Warning: " << issue.message << std::endl;
            }
            model->scanErrors_.push_back(std::move(issue));
            continue;
        }

        const RawEntity& raw = record.value;
        model->order_.push_back(raw.id);
        model->byType_[std::string(raw.typeName)].push_back(raw.id);
        model->raw_.emplace(raw.id, raw);
    }

    model->lengthUnitScale_ = extractLengthUnitScale(*model, options.verbose);

    if (options.buildSpatialTree) {
        if (progress) progress("spatial", kScanEnd);
        model->spatial_ = std::make_unique<SpatialTree>(SpatialTree::build(*model, options.verbose));
    }

    if (options.extractProperties) {
        if (progress) progress("properties", kSpatialEnd);
        model->properties_ = std::make_unique<PropertyIndex>(PropertyIndex::build(*model, options.verbose));
    }

    if (progress) progress("complete", 1.0);

    auto endTime = std::chrono::high_resolution_clock::now();
    model->parseDurationMs_ = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    if (options.verbose) {
        std::cout << "Parsed " << model->order_.size() << " entities ("
                  << model->byType_.size() << " types) in "
                  << model->parseDurationMs_ << " ms";
        if (!model->scanErrors_.empty()) {
            std::cout << ", " << model->scanErrors_.size() << " malformed records skipped";
        }
        std::cout << std::endl;
    }

    auto result = Result<std::shared_ptr<Model>>::ok(model);
    result.durationMs = model->parseDurationMs_;
    return result;
}

Result<EntityPtr> Model::get(EntityId id) const {
    auto rawIt = raw_.find(id);
    if (rawIt == raw_.end()) {
        return Result<EntityPtr>::entityNotFound(id);
    }

    CacheShard& shard = cache_[id % kCacheShards];
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto cached = shard.entries.find(id);
        if (cached != shard.entries.end()) {
            auto r = Result<EntityPtr>::ok(cached->second);
            r.wasCached = true;
            return r;
        }
    }

    // Decode outside the lock
    auto decoded = decodeEntity(rawIt->second);
    if (!decoded) {
        return Result<EntityPtr>::from(decoded);
    }
    EntityPtr entity = std::make_shared<const DecodedEntity>(std::move(decoded.value));

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto inserted = shard.entries.emplace(id, std::move(entity));
    return Result<EntityPtr>::ok(inserted.first->second);
}

const std::vector<EntityId>& Model::findByTypeName(const std::string& typeName) const {
    auto it = byType_.find(typeName);
    return it == byType_.end() ? kNoIds : it->second;
}

const RawEntity* Model::raw(EntityId id) const {
    auto it = raw_.find(id);
    return it == raw_.end() ? nullptr : &it->second;
}

std::string Model::typeName(EntityId id) const {
    auto it = raw_.find(id);
    return it == raw_.end() ? std::string() : std::string(it->second.typeName);
}

size_t Model::decodedCount() const {
    size_t count = 0;
    for (const auto& shard : cache_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        count += shard.entries.size();
    }
    return count;
}

std::map<std::string, size_t> Model::typeCounts() const {
    std::map<std::string, size_t> counts;
    for (const auto& entry : byType_) {
        counts[entry.first] = entry.second.size();
    }
    return counts;
}

} // namespace ifccore::step
