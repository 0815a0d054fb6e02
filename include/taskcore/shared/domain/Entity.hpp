/**
 * @file Entity.hpp
 * @brief Base class for Entities in DDD
 */

#pragma once

#include <chrono>
#include <string>

namespace taskcore::shared::domain {

/**
 * @brief Base template class for Entities
 *
 * Entities are defined by their identity (ID), not by their attributes.
 * Two entities with the same ID are the same entity.
 *
 * @tparam IdType The type of the entity's identifier
 */
template<typename IdType>
class Entity {
protected:
    IdType id_;
    std::chrono::system_clock::time_point createdAt_;
    std::chrono::system_clock::time_point updatedAt_;

    explicit Entity(IdType id)
        : id_(std::move(id)),
          createdAt_(std::chrono::system_clock::now()),
          updatedAt_(createdAt_) {}

    /**
     * @brief Update the modification timestamp
     */
    void touch() {
        updatedAt_ = std::chrono::system_clock::now();
    }

    /**
     * @brief Restore timestamps read from persistence
     */
    void restoreTimestamps(std::chrono::system_clock::time_point createdAt,
                           std::chrono::system_clock::time_point updatedAt) {
        createdAt_ = createdAt;
        updatedAt_ = updatedAt;
    }

public:
    virtual ~Entity() = default;

    // Entities should not be copied, only moved
    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;

    [[nodiscard]] const IdType& getId() const noexcept {
        return id_;
    }

    [[nodiscard]] std::chrono::system_clock::time_point getCreatedAt() const noexcept {
        return createdAt_;
    }

    [[nodiscard]] std::chrono::system_clock::time_point getUpdatedAt() const noexcept {
        return updatedAt_;
    }

    bool operator==(const Entity& other) const {
        return id_ == other.id_;
    }

    bool operator!=(const Entity& other) const {
        return !(*this == other);
    }
};

} // namespace taskcore::shared::domain
