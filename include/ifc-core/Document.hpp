#pragma once
#include <memory>
#include <string>
#include <vector>
#include "Types.hpp"
#include "geom/GeometryRouter.hpp"
#include "step/Model.hpp"

namespace ifccore {

    /**
     * @brief Mesh of one element, as returned by Document::getAllMeshes
     */
    struct ElementMesh {
        EntityId elementId = 0;
        std::string entityType;
        MeshData mesh;
    };

    /**
     * @brief One property or quantity flattened for display
     */
    struct PropertyRow {
        std::string setName;
        std::string name;
        std::string value;
        std::string unit;
    };

    /**
     * @brief High-level IFC document interface
     *
     * Parses a file once and answers model, spatial, property and geometry
     * queries on it. Wraps step::Model and geom::GeometryRouter for ease of
     * use in bindings.
     */
    class Document {
    public:
        Document();
        ~Document();

        // ========================================
        // Loading
        // ========================================

        /**
         * @brief Parse an IFC file from disk
         * @return true if successful; see getLastError() otherwise
         */
        bool loadFile(const std::string& filepath);

        /**
         * @brief Parse IFC content held in memory (for WASM)
         *
         * In JavaScript/WASM, you can pass a Uint8Array or binary string.
         * Emscripten will automatically convert it to std::string.
         */
        bool loadFromBytes(const std::string& data);

        bool isLoaded() const { return model != nullptr; }

        const std::string& getLastError() const { return lastError; }
        const std::string& getLastErrorCode() const { return lastErrorCode; }

        void setParseOptions(const step::ParseOptions& options) { parseOptions = options; }
        const step::ParseOptions& getParseOptions() const { return parseOptions; }

        /**
         * @brief Replace geometry options; takes effect immediately
         *
         * The unit scale is overwritten by the file's length unit on load.
         */
        void setGeometryOptions(const geom::GeometryOptions& options);
        const geom::GeometryOptions& getGeometryOptions() const { return geometryOptions; }

        void setProgressCallback(ProgressCallback callback) { progress = std::move(callback); }

        // ========================================
        // Model
        // ========================================

        std::string getSchema() const;
        step::HeaderInfo getHeader() const;
        size_t getEntityCount() const;

        /**
         * @brief Upper-case type name, empty for unknown ids
         */
        std::string getEntityType(EntityId id) const;

        /**
         * @brief Ids of a type in file order; the name is case-insensitive
         */
        std::vector<EntityId> findByType(const std::string& typeName) const;

        /**
         * @brief Metres per file length unit
         */
        double getUnitScale() const;

        std::vector<step::ScanIssue> getScanErrors() const;

        /**
         * @brief Underlying model, nullptr before a successful load
         */
        std::shared_ptr<const step::Model> getModel() const { return model; }

        // ========================================
        // Spatial structure
        // ========================================

        /**
         * @brief Project id, 0 when there is no spatial tree
         */
        EntityId getSpatialRoot() const;

        std::vector<EntityId> getChildren(EntityId id) const;

        /**
         * @brief IfcRoot.Name of any entity, empty when unset
         */
        std::string getName(EntityId id) const;

        std::vector<EntityId> search(const std::string& query) const;
        std::vector<step::StoreyInfo> getStoreys() const;
        std::vector<EntityId> getElementsInStorey(EntityId storeyId) const;

        // ========================================
        // Properties
        // ========================================

        std::vector<step::PropertySet> getPropertySets(EntityId elementId) const;

        /**
         * @brief Properties and quantities of all sets as display rows
         */
        std::vector<PropertyRow> getProperties(EntityId elementId) const;

        step::ElementAttributes getElementAttributes(EntityId elementId) const;

        // ========================================
        // Geometry
        // ========================================

        /**
         * @brief World-space mesh of one element in metres
         */
        Result<MeshData> getElementMesh(EntityId elementId) const;

        /**
         * @brief Mesh an element into the current mesh buffer
         *
         * The buffer stays valid until the next call, so bindings can hand
         * out views into it without copying.
         */
        bool meshElement(EntityId elementId);
        const MeshData& getCurrentMesh() const { return currentMesh; }

        /**
         * @brief Mesh every element with geometry; failures are skipped
         *
         * Skipped elements are logged to stderr when verbose and counted in
         * getSkippedCount().
         */
        std::vector<ElementMesh> getAllMeshes();
        size_t getSkippedCount() const { return skippedCount; }

        /**
         * @brief Elements in the spatial tree that carry a representation
         */
        std::vector<EntityId> getGeometryElements() const;

    private:
        bool finishLoad(Result<std::shared_ptr<step::Model>> result);
        void setError(const std::string& code, const std::string& message);

        std::shared_ptr<step::Model> model;
        std::unique_ptr<geom::GeometryRouter> router;
        step::ParseOptions parseOptions;
        geom::GeometryOptions geometryOptions;
        ProgressCallback progress;

        MeshData currentMesh;
        size_t skippedCount = 0;
        std::string lastError;
        std::string lastErrorCode;
    };
}
