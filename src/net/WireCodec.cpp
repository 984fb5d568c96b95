// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/WireCodec.h"

#include "tickprobe_wire.pb.h"

#include <type_traits>
#include <utility>

namespace tickprobe::net {
namespace {

void to_wire(const Vector3& v, wire::Vector3* out) {
    out->set_x(v.x);
    out->set_y(v.y);
    out->set_z(v.z);
}

void to_wire(const Rotation& r, wire::Rotation* out) {
    out->set_yaw(r.yaw);
    out->set_pitch(r.pitch);
}

Vector3 from_wire(const wire::Vector3& v) {
    return Vector3{v.x(), v.y(), v.z()};
}

Rotation from_wire(const wire::Rotation& r) {
    return Rotation{r.yaw(), r.pitch()};
}

} // namespace

std::string encode_client_message(const ClientMessage& msg) {
    wire::ClientMessage out;
    std::visit([&out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PlayerMove>) {
            auto* pm = out.mutable_player_move();
            to_wire(m.position, pm->mutable_position());
            to_wire(m.rotation, pm->mutable_rotation());
        } else {
            auto* info = out.mutable_connection_info();
            info->set_login(m.login);
            info->set_version(m.version);
            info->set_architecture(m.architecture);
            info->set_rendering_device(m.rendering_device);
        }
    }, msg);
    return out.SerializeAsString();
}

std::optional<ClientMessage> decode_client_message(const std::string& bytes) {
    wire::ClientMessage in;
    if (!in.ParseFromString(bytes)) return std::nullopt;

    switch (in.body_case()) {
    case wire::ClientMessage::kPlayerMove: {
        const auto& pm = in.player_move();
        return ClientMessage{PlayerMove{from_wire(pm.position()), from_wire(pm.rotation())}};
    }
    case wire::ClientMessage::kConnectionInfo: {
        const auto& info = in.connection_info();
        return ClientMessage{ConnectionInfo{info.login(),
                                            info.version(),
                                            info.architecture(),
                                            info.rendering_device()}};
    }
    default:
        return std::nullopt;
    }
}

std::string encode_server_message(const ServerMessage& msg) {
    wire::ServerMessage out;
    std::visit([&out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AllowConnection>) {
            out.mutable_allow_connection();
        } else {
            auto* em = out.mutable_entity_move();
            em->set_world_slug(m.world_slug);
            em->set_id(m.id);
            to_wire(m.position, em->mutable_position());
            to_wire(m.rotation, em->mutable_rotation());
            em->set_timestamp(m.timestamp);
        }
    }, msg);
    return out.SerializeAsString();
}

std::optional<ServerMessage> decode_server_message(const std::string& bytes) {
    wire::ServerMessage in;
    if (!in.ParseFromString(bytes)) return std::nullopt;

    switch (in.body_case()) {
    case wire::ServerMessage::kAllowConnection:
        return ServerMessage{AllowConnection{}};
    case wire::ServerMessage::kEntityMove: {
        const auto& em = in.entity_move();
        EntityMove out;
        out.world_slug = em.world_slug();
        out.id = em.id();
        out.position = from_wire(em.position());
        out.rotation = from_wire(em.rotation());
        out.timestamp = em.timestamp();
        return ServerMessage{std::move(out)};
    }
    default:
        return std::nullopt;
    }
}

} // namespace tickprobe::net
