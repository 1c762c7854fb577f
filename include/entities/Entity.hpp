/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "utils/Vector3D.hpp"
#include <cstdint>
#include <memory>

// Forward declarations
class Entity; // Forward declare for smart pointers

// Smart pointer type aliases
using EntityPtr = std::shared_ptr<Entity>;
using EntityWeakPtr = std::weak_ptr<Entity>;

// Type alias for entity ID. IDs are handed out by the host's entity registry.
using EntityID = uint64_t;
constexpr EntityID INVALID_ENTITY_ID = 0;

/**
 * @brief Pure virtual base class for simulated world objects.
 *
 * Holds the transform every entity shares (position, velocity, yaw) and the
 * identity the host registry assigns on registration. Rendering lives
 * outside the simulation core; the host reads transforms back each tick.
 */
class Entity : public std::enable_shared_from_this<Entity> {
 public:
  Entity() = default;

  /**
   * @brief Virtual destructor
   *
   * IMPORTANT: Do NOT call shared_from_this() or any method that uses it
   * (like shared_this()) in the destructor. By the time the destructor runs,
   * all shared_ptrs to this object have been destroyed, and calling
   * shared_from_this() will throw std::bad_weak_ptr.
   */
  virtual ~Entity() = default;

  Entity(const Entity&) = delete;
  Entity& operator=(const Entity&) = delete;

  /**
   * @brief Update the entity's state.
   *
   * Called once per fixed simulation step by whoever owns the entity.
   *
   * @param deltaTime The time elapsed since the last step, in seconds.
   */
  virtual void update(float deltaTime) = 0;

  /**
   * @brief Release the entity's external resources before destruction
   *
   * Called explicitly before an entity is discarded. It's safe to use
   * shared_from_this() here. Must be idempotent.
   */
  virtual void clean() = 0;

  /**
   * @brief Helper to get a shared_ptr to this object
   *
   * IMPORTANT: Never call this in constructors or destructors!
   * Only use this when the object is managed by a std::shared_ptr.
   *
   * @throws std::bad_weak_ptr if the object is not managed by a std::shared_ptr
   */
  EntityPtr shared_this() { return shared_from_this(); }

  /**
   * @brief Helper to get a weak_ptr to this object
   *
   * IMPORTANT: Never call this in constructors or destructors!
   */
  EntityWeakPtr weak_this() { return shared_from_this(); }

  // Accessor methods
  EntityID getID() const { return m_id; }
  Vector3D getPosition() const { return m_position; }
  Vector3D getVelocity() const { return m_velocity; }
  float getYaw() const { return m_yaw; }

  // Setter methods
  void assignID(EntityID id) { m_id = id; }
  virtual void setPosition(const Vector3D& position) { m_position = position; }
  virtual void setVelocity(const Vector3D& velocity) { m_velocity = velocity; }
  void setYaw(float yaw) { m_yaw = yaw; }

 protected:
  EntityID m_id{INVALID_ENTITY_ID};
  Vector3D m_position{0, 0, 0};
  Vector3D m_velocity{0, 0, 0};
  float m_yaw{0.0f}; // Radians around +Y; 0 faces +Z
};

#endif  // ENTITY_HPP
