// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/WireCodec.h"

#include <cassert>
#include <string>
#include <variant>

using namespace tickprobe::net;

int main() {
    // PlayerMove keeps the sequence carried in position.x.
    PlayerMove move{Vector3{1234.0f, 0.0f, 0.0f}, Rotation{0.0f, 0.0f}};
    auto decoded = decode_client_message(encode_client_message(move));
    assert(decoded && std::holds_alternative<PlayerMove>(*decoded));
    assert(std::get<PlayerMove>(*decoded).position.x == 1234.0f);

    ConnectionInfo info{"consistency-test", "test", "test", "test"};
    decoded = decode_client_message(encode_client_message(info));
    assert(decoded && std::holds_alternative<ConnectionInfo>(*decoded));
    assert(std::get<ConnectionInfo>(*decoded).login == "consistency-test");

    // AllowConnection carries no fields but must still be distinguishable.
    const auto allow_bytes = encode_server_message(AllowConnection{});
    assert(!allow_bytes.empty());
    auto server = decode_server_message(allow_bytes);
    assert(server && std::holds_alternative<AllowConnection>(*server));

    EntityMove echo;
    echo.id = 1;
    echo.position = Vector3{7.0f, 0.0f, 0.0f};
    echo.timestamp = 0.25f;
    server = decode_server_message(encode_server_message(echo));
    assert(server && std::holds_alternative<EntityMove>(*server));
    const auto& e = std::get<EntityMove>(*server);
    assert(e.id == 1 && e.position.x == 7.0f && e.timestamp == 0.25f);
    assert(e.world_slug.empty());

    // No body set / garbage.
    assert(!decode_client_message(std::string{}));
    assert(!decode_server_message(std::string{}));
    assert(!decode_server_message(std::string("\xff\xff\xff\xff", 4)));

    return 0;
}
