#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "Vector3.hpp"

namespace ifccore {

// ===========================================================================
// Shared Value Types
// ===========================================================================

/**
 * @brief Unique entity identifier within one STEP file (the N in #N)
 */
using EntityId = uint32_t;

/**
 * @brief Progress hook invoked synchronously from the scanning thread
 *
 * Receives a phase label and a fraction in [0, 1]. Within one parse the
 * fraction never decreases. An exception thrown here aborts the parse.
 */
using ProgressCallback = std::function<void(const std::string& phase, double fraction)>;

/**
 * @brief Error codes carried by Result::errorCode
 */
namespace ErrorCode {
    constexpr const char* ParseError = "PARSE_ERROR";
    constexpr const char* EntityNotFound = "ENTITY_NOT_FOUND";
    constexpr const char* InvalidAttribute = "INVALID_ATTRIBUTE";
    constexpr const char* Profile = "PROFILE_ERROR";
    constexpr const char* Triangulation = "TRIANGULATION_ERROR";
    constexpr const char* Csg = "CSG_ERROR";
    constexpr const char* UnsupportedType = "UNSUPPORTED_TYPE";
    constexpr const char* Geometry = "GEOMETRY_ERROR";
    constexpr const char* Io = "IO_ERROR";
} // namespace ErrorCode

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    Vector3 min{0, 0, 0};
    Vector3 max{0, 0, 0};

    Vector3 center() const {
        return Vector3(
            (min.x + max.x) / 2.0,
            (min.y + max.y) / 2.0,
            (min.z + max.z) / 2.0
        );
    }

    Vector3 size() const {
        return Vector3(
            max.x - min.x,
            max.y - min.y,
            max.z - min.z
        );
    }

    double volume() const {
        auto s = size();
        return s.x * s.y * s.z;
    }
};

/**
 * @brief GPU-ready mesh buffers
 *
 * All arrays are stored contiguously for direct memory view access.
 */
struct MeshData {
    std::vector<float> positions;   // [x,y,z, x,y,z, ...]
    std::vector<float> normals;     // [nx,ny,nz, ...], same length as positions
    std::vector<uint32_t> indices;  // CCW triangles, stride 3

    size_t vertexCount() const { return positions.size() / 3; }
    size_t triangleCount() const { return indices.size() / 3; }
    bool isEmpty() const { return positions.empty(); }

    size_t byteSize() const {
        return positions.size() * sizeof(float) +
               normals.size() * sizeof(float) +
               indices.size() * sizeof(uint32_t);
    }

    /**
     * @brief Append another buffer set, offsetting its indices
     */
    void merge(const MeshData& other) {
        auto offset = static_cast<uint32_t>(vertexCount());
        positions.insert(positions.end(), other.positions.begin(), other.positions.end());
        normals.insert(normals.end(), other.normals.begin(), other.normals.end());
        indices.reserve(indices.size() + other.indices.size());
        for (uint32_t index : other.indices) {
            indices.push_back(index + offset);
        }
    }
};

/**
 * @brief Operation result with error handling
 */
template<typename T>
struct Result {
    bool success = false;
    T value{};
    std::string errorCode;
    std::string errorMessage;

    // Diagnostics
    EntityId entityId = 0;                // missing id for ENTITY_NOT_FOUND, owning entity otherwise
    std::optional<size_t> byteOffset;
    std::optional<size_t> attributeIndex;

    // Performance metrics for monitoring
    double durationMs = 0;
    bool wasCached = false;

    static Result<T> ok(T&& val) {
        Result<T> r;
        r.success = true;
        r.value = std::move(val);
        return r;
    }

    static Result<T> ok(const T& val) {
        Result<T> r;
        r.success = true;
        r.value = val;
        return r;
    }

    static Result<T> error(const std::string& code, const std::string& msg) {
        Result<T> r;
        r.success = false;
        r.errorCode = code;
        r.errorMessage = msg;
        return r;
    }

    /**
     * @brief Forward the error of a result with a different payload type
     */
    template<typename U>
    static Result<T> from(const Result<U>& other) {
        Result<T> r = error(other.errorCode, other.errorMessage);
        r.entityId = other.entityId;
        r.byteOffset = other.byteOffset;
        r.attributeIndex = other.attributeIndex;
        r.durationMs = other.durationMs;
        return r;
    }

    static Result<T> entityNotFound(EntityId id) {
        Result<T> r = error(ErrorCode::EntityNotFound, "Entity not found: #" + std::to_string(id));
        r.entityId = id;
        return r;
    }

    static Result<T> invalidAttribute(size_t index, const std::string& msg) {
        Result<T> r = error(ErrorCode::InvalidAttribute,
            "Invalid attribute at index " + std::to_string(index) + ": " + msg);
        r.attributeIndex = index;
        return r;
    }

    /**
     * @brief Attach the owning entity id if none is set yet
     */
    Result<T>& withEntity(EntityId id) {
        if (entityId == 0) {
            entityId = id;
        }
        return *this;
    }

    explicit operator bool() const { return success; }
};

} // namespace ifccore
