// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Messages.h
 * @brief Application messages exchanged between probe client and server.
 */

#include <cstdint>
#include <string>
#include <variant>

namespace tickprobe::net {

struct Vector3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

struct Rotation {
    float yaw{0.0f};
    float pitch{0.0f};
};

/**
 * @brief Position update sent by the client over the unreliable channel.
 *
 * The probe encodes its sequence number into position.x.
 */
struct PlayerMove {
    Vector3 position{};
    Rotation rotation{};
};

/// One-time handshake sent by the client after it was admitted.
struct ConnectionInfo {
    std::string login;
    std::string version;
    std::string architecture;
    std::string rendering_device;
};

/// Server acknowledgement that the client may start sending.
struct AllowConnection {};

/**
 * @brief Echo of a PlayerMove sent back by the server.
 *
 * timestamp holds the seconds elapsed since the server's tick started.
 */
struct EntityMove {
    std::string world_slug;
    std::uint32_t id{0};
    Vector3 position{};
    Rotation rotation{};
    float timestamp{0.0f};
};

using ClientMessage = std::variant<PlayerMove, ConnectionInfo>;
using ServerMessage = std::variant<AllowConnection, EntityMove>;

/**
 * @brief Delivery guarantee requested for an outbound message.
 */
enum class DeliveryClass {
    ReliableOrdered, ///< In-order, exactly-once delivery.
    Unreliable       ///< May be dropped, duplicated or reordered.
};

inline const char* to_string(DeliveryClass cls) {
    return cls == DeliveryClass::ReliableOrdered ? "reliable_ordered" : "unreliable";
}

} // namespace tickprobe::net
