// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/rpc_client.hpp"

#include "util/logging.hpp"

#include <sstream>

namespace nvr {
namespace rpc {

namespace {

// sockaddr_un::sun_path is 108 bytes on Linux, 104 on BSD/macOS
constexpr size_t MAX_SOCKET_PATH = 104;
constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

void PackParams(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<std::string>& params) {
  pk.pack_array(static_cast<uint32_t>(params.size()));
  for (const auto& param : params) {
    pk.pack(param);
  }
}

bool IsUnsigned(const msgpack::object& obj) {
  return obj.type == msgpack::type::POSITIVE_INTEGER;
}

}  // namespace

RPCClient::RPCClient(const network::ServerAddress& address) : address_(address), socket_(io_context_) {}

RPCClient::~RPCClient() {
  Disconnect();
}

std::optional<std::string> RPCClient::Connect() {
  if (IsConnected()) {
    return std::nullopt;  // Already connected
  }

  asio::error_code ec;

  if (address_.kind == network::ServerAddress::Kind::UNIX_SOCKET) {
    // Validate socket path length before asio rejects it with a less helpful error
    if (address_.text.empty()) {
      return std::string("Empty socket path");
    }
    if (address_.text.length() >= MAX_SOCKET_PATH) {
      std::ostringstream err;
      err << "Socket path too long (" << address_.text.length() << " bytes, max " << MAX_SOCKET_PATH - 1
          << "): " << address_.text;
      return err.str();
    }

    asio::local::stream_protocol::endpoint endpoint(address_.text);
    LOG_RPC_DEBUG("Connecting to unix socket {}", address_.text);
    socket_.connect(asio::generic::stream_protocol::endpoint(endpoint), ec);
  } else {
    asio::ip::tcp::resolver resolver(io_context_);
    auto results = resolver.resolve(address_.host, std::to_string(address_.port), ec);
    if (ec) {
      return "Cannot resolve " + address_.host + ": " + ec.message();
    }

    ec = asio::error::host_not_found;
    for (const auto& entry : results) {
      LOG_RPC_DEBUG("Connecting to {}:{}", entry.endpoint().address().to_string(), entry.endpoint().port());
      socket_.connect(asio::generic::stream_protocol::endpoint(entry.endpoint()), ec);
      if (!ec) {
        break;
      }
      asio::error_code ignored;
      socket_.close(ignored);
    }
  }

  if (ec) {
    asio::error_code ignored;
    socket_.close(ignored);
    return "Cannot connect to " + address_.text + ": " + ec.message();
  }

  LOG_RPC_INFO("Connected to {}", address_.text);
  return std::nullopt;
}

network::RpcResponse RPCClient::Request(const std::string& method, const std::vector<std::string>& params) {
  if (!IsConnected()) {
    throw network::RpcError("Not connected to server");
  }

  const uint32_t msgid = next_msgid_++;

  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(buffer);
  pk.pack_array(4);
  pk.pack(static_cast<uint32_t>(MessageType::REQUEST));
  pk.pack(msgid);
  pk.pack(method);
  PackParams(pk, params);

  LOG_RPC_DEBUG("-> request #{} {}", msgid, method);
  Send(buffer);

  // The server may interleave notifications and its own requests before our reply
  while (true) {
    msgpack::object_handle handle = ReadMessage();
    const msgpack::object& message = handle.get();

    if (message.type != msgpack::type::ARRAY || message.via.array.size < 3 ||
        !IsUnsigned(message.via.array.ptr[0])) {
      throw network::RpcError("Malformed message from server");
    }

    const msgpack::object* fields = message.via.array.ptr;
    const uint64_t type = fields[0].via.u64;

    if (type == static_cast<uint32_t>(MessageType::RESPONSE)) {
      if (message.via.array.size != 4 || !IsUnsigned(fields[1])) {
        throw network::RpcError("Malformed response from server");
      }
      if (fields[1].via.u64 != msgid) {
        LOG_RPC_WARN("Discarding response to unknown request #{}", fields[1].via.u64);
        continue;
      }

      network::RpcResponse response;
      if (fields[2].type != msgpack::type::NIL) {
        response.error = remote::FromMsgpack(fields[2]);
        LOG_RPC_DEBUG("<- error #{}", msgid);
      } else {
        response.result = remote::FromMsgpack(fields[3]);
        LOG_RPC_DEBUG("<- response #{}", msgid);
      }
      return response;
    }

    if (type == static_cast<uint32_t>(MessageType::NOTIFICATION)) {
      LOG_RPC_TRACE("Ignoring notification while waiting for #{}", msgid);
      continue;
    }

    if (type == static_cast<uint32_t>(MessageType::REQUEST)) {
      RejectServerRequest(message);
      continue;
    }

    throw network::RpcError("Unknown message type " + std::to_string(type) + " from server");
  }
}

void RPCClient::Notify(const std::string& method, const std::vector<std::string>& params) {
  if (!IsConnected()) {
    throw network::RpcError("Not connected to server");
  }

  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(buffer);
  pk.pack_array(3);
  pk.pack(static_cast<uint32_t>(MessageType::NOTIFICATION));
  pk.pack(method);
  PackParams(pk, params);

  LOG_RPC_DEBUG("-> notification {}", method);
  Send(buffer);
}

void RPCClient::Disconnect() {
  if (socket_.is_open()) {
    asio::error_code ignored;
    socket_.shutdown(asio::socket_base::shutdown_both, ignored);
    socket_.close(ignored);
  }
}

void RPCClient::Send(const msgpack::sbuffer& buffer) {
  asio::error_code ec;
  asio::write(socket_, asio::buffer(buffer.data(), buffer.size()), ec);
  if (ec) {
    throw network::RpcError("Failed to send to " + address_.text + ": " + ec.message());
  }
}

msgpack::object_handle RPCClient::ReadMessage() {
  msgpack::object_handle handle;
  while (true) {
    try {
      if (unpacker_.next(handle)) {
        return handle;
      }
    } catch (const msgpack::unpack_error& e) {
      throw network::RpcError(std::string("Malformed message from server: ") + e.what());
    }

    unpacker_.reserve_buffer(READ_CHUNK_SIZE);
    asio::error_code ec;
    size_t received = socket_.read_some(asio::buffer(unpacker_.buffer(), unpacker_.buffer_capacity()), ec);
    if (ec == asio::error::eof) {
      throw network::RpcError("Connection closed by server");
    }
    if (ec) {
      throw network::RpcError("Failed to receive from " + address_.text + ": " + ec.message());
    }
    unpacker_.buffer_consumed(received);
  }
}

void RPCClient::RejectServerRequest(const msgpack::object& message) {
  // [0, msgid, method, params]; answer so the server does not wait on us
  if (message.via.array.size != 4 || !IsUnsigned(message.via.array.ptr[1])) {
    throw network::RpcError("Malformed request from server");
  }

  const uint64_t server_msgid = message.via.array.ptr[1].via.u64;
  LOG_RPC_WARN("Rejecting request #{} from server", server_msgid);

  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(buffer);
  pk.pack_array(4);
  pk.pack(static_cast<uint32_t>(MessageType::RESPONSE));
  pk.pack(server_msgid);
  pk.pack(std::string("nvr does not handle requests"));
  pk.pack_nil();
  Send(buffer);
}

std::unique_ptr<network::RpcChannel> ConnectToServer(const std::string& address, std::string& error) {
  auto client = std::make_unique<RPCClient>(network::ServerAddress::Parse(address));
  auto connect_error = client->Connect();
  if (connect_error) {
    LOG_RPC_DEBUG("Connection to {} failed: {}", address, *connect_error);
    error = *connect_error;
    return nullptr;
  }
  return client;
}

}  // namespace rpc
}  // namespace nvr
