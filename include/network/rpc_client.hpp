// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/rpc_channel.hpp"
#include "network/server_address.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <msgpack.hpp>

namespace nvr {
namespace rpc {

// msgpack-RPC message type tags (first element of every message)
enum class MessageType : uint32_t {
  REQUEST = 0,
  RESPONSE = 1,
  NOTIFICATION = 2,
};

// Blocking msgpack-RPC client for a running editor.
// Connects over a Unix domain socket or TCP depending on the server address.
// All calls run on the caller's thread; there is no background reader.
class RPCClient : public network::RpcChannel {
public:
  explicit RPCClient(const network::ServerAddress& address);
  ~RPCClient() override;

  RPCClient(const RPCClient&) = delete;
  RPCClient& operator=(const RPCClient&) = delete;

  // Connect to the editor. Returns empty optional if connected successfully, error message otherwise.
  std::optional<std::string> Connect();

  // Send [0, msgid, method, params] and wait, without timeout, for the matching response.
  network::RpcResponse Request(const std::string& method, const std::vector<std::string>& params) override;

  // Send [2, method, params]. Returns once the message is written.
  void Notify(const std::string& method, const std::vector<std::string>& params) override;

  bool IsConnected() const { return socket_.is_open(); }

  void Disconnect();

private:
  void Send(const msgpack::sbuffer& buffer);
  msgpack::object_handle ReadMessage();
  void RejectServerRequest(const msgpack::object& message);

  network::ServerAddress address_;
  asio::io_context io_context_;
  asio::generic::stream_protocol::socket socket_;
  msgpack::unpacker unpacker_;
  uint32_t next_msgid_{1};
};

// Open a connected client for address. Returns nullptr and fills error on failure.
std::unique_ptr<network::RpcChannel> ConnectToServer(const std::string& address, std::string& error);

}  // namespace rpc
}  // namespace nvr
