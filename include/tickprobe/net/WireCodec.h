// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/net/Messages.h"

#include <optional>
#include <string>

namespace tickprobe::net {

/**
 * @brief Protobuf (tickprobe_wire.proto) serialisation of application messages.
 *
 * Decoding returns std::nullopt for malformed bytes or an unset oneof body, which
 * callers treat as an unexpected message and ignore.
 */
std::string encode_client_message(const ClientMessage& msg);
std::optional<ClientMessage> decode_client_message(const std::string& bytes);

std::string encode_server_message(const ServerMessage& msg);
std::optional<ServerMessage> decode_server_message(const std::string& bytes);

} // namespace tickprobe::net
