#pragma once

#include <array>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Header.hpp"
#include "Properties.hpp"
#include "Resolver.hpp"
#include "Scanner.hpp"
#include "Spatial.hpp"

namespace ifccore::step {

/**
 * @brief Parse configuration
 */
struct ParseOptions {
    bool strict = true;                     // abort on the first malformed record
    bool buildSpatialTree = true;
    bool extractProperties = true;
    size_t progressChunkBytes = 1 << 20;    // scanner progress granularity
    bool verbose = false;                   // log summaries to stdout
};

/**
 * @brief Malformed record skipped in lenient mode
 */
struct ScanIssue {
    size_t byteOffset = 0;
    EntityId entityId = 0;
    std::string message;
};

/**
 * @brief Parsed STEP file: raw entity index plus lazily decoded entities
 *
 * Owns the file content; raw records view into it. Decoded entities are
 * produced on first access and cached in a sharded map, so lookups from
 * many threads only contend within one shard. Concurrent first accesses to
 * the same id may decode twice; the first insert wins and every caller
 * receives the cached instance.
 */
class Model : public EntityResolver {
public:
    /**
     * @brief Scan content and build the requested indexes
     *
     * Progress phases: "scanning" (0..0.8), "spatial" (0.8..0.9),
     * "properties" (0.9..1.0), "complete" (1.0). The fraction never
     * decreases. Exceptions thrown by the callback propagate to the caller.
     */
    static Result<std::shared_ptr<Model>> parse(std::string content,
                                                const ParseOptions& options = ParseOptions(),
                                                const ProgressCallback& progress = nullptr);

    /**
     * @brief Read a file and parse it
     * @return IO_ERROR when the file cannot be read
     */
    static Result<std::shared_ptr<Model>> parseFile(const std::string& filepath,
                                                    const ParseOptions& options = ParseOptions(),
                                                    const ProgressCallback& progress = nullptr);

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    // EntityResolver
    Result<EntityPtr> get(EntityId id) const override;
    const std::vector<EntityId>& findByTypeName(const std::string& typeName) const override;

    /**
     * @brief Undecoded record, nullptr for unknown ids
     */
    const RawEntity* raw(EntityId id) const;

    bool contains(EntityId id) const { return raw_.count(id) > 0; }

    /**
     * @brief Type name without decoding, empty for unknown ids
     */
    std::string typeName(EntityId id) const;

    const std::vector<EntityId>& allIds() const { return order_; }
    size_t entityCount() const { return order_.size(); }
    size_t decodedCount() const;
    std::map<std::string, size_t> typeCounts() const;

    const HeaderInfo& header() const { return header_; }
    const std::vector<ScanIssue>& scanErrors() const { return scanErrors_; }

    /**
     * @brief Metres per file length unit, from IFCUNITASSIGNMENT
     */
    double lengthUnitScale() const { return lengthUnitScale_; }

    /**
     * @brief Spatial tree, nullptr when disabled in ParseOptions
     */
    const SpatialTree* spatialTree() const { return spatial_.get(); }

    /**
     * @brief Property index, nullptr when disabled in ParseOptions
     */
    const PropertyIndex* properties() const { return properties_.get(); }

    size_t contentSize() const { return content_.size(); }
    double parseDurationMs() const { return parseDurationMs_; }

private:
    Model() = default;

    static constexpr size_t kCacheShards = 64;

    struct CacheShard {
        mutable std::shared_mutex mutex;
        std::unordered_map<EntityId, EntityPtr> entries;
    };

    std::string content_;
    HeaderInfo header_;
    std::unordered_map<EntityId, RawEntity> raw_;
    std::vector<EntityId> order_;
    std::unordered_map<std::string, std::vector<EntityId>> byType_;
    std::vector<ScanIssue> scanErrors_;
    double lengthUnitScale_ = 1.0;
    double parseDurationMs_ = 0.0;

    std::unique_ptr<SpatialTree> spatial_;
    std::unique_ptr<PropertyIndex> properties_;

    mutable std::array<CacheShard, kCacheShards> cache_;
};

} // namespace ifccore::step
