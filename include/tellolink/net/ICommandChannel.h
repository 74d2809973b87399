// Repository: TelloLink
// Component: Command Channel Interface
// Purpose: Datagram command/reply link to the drone, created fresh per connect attempt.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_NET_I_COMMAND_CHANNEL_H_
#define TELLOLINK_NET_I_COMMAND_CHANNEL_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tellolink::net {

struct ChannelResult {
  bool success;
  int error_code;  // errno where one applies, 0 otherwise
  std::string message;

  ChannelResult(bool s, int code, const std::string& msg)
      : success(s), error_code(code), message(msg) {}
};

// One datagram from the drone.
struct CommandReply {
  std::string text;  // trailing whitespace stripped
  std::string from_address;
  uint16_t from_port = 0;
  std::chrono::steady_clock::time_point received_at;
};

using ReplyListener = std::function<void(const CommandReply& reply)>;
using ChannelErrorListener = std::function<void(const std::string& message)>;

// ICommandChannel is owned by exactly one connect attempt. Listeners run on
// the channel's receive thread and must not block; the orchestrator only
// posts them to its mailbox.
class ICommandChannel {
 public:
  virtual ~ICommandChannel() = default;

  // Binds the local endpoint (0 = ephemeral) and starts receiving.
  virtual ChannelResult Open(uint16_t local_port) = 0;

  // Sends one command datagram. Fails if the channel is not open.
  virtual ChannelResult Send(const std::string& command) = 0;

  // Stops the receive loop and releases the socket. Idempotent. No listener
  // is invoked after Close() returns.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // Set before Open().
  virtual void SetReplyListener(ReplyListener listener) = 0;
  virtual void SetErrorListener(ChannelErrorListener listener) = 0;

  // Locally bound port after a successful Open(), 0 otherwise.
  virtual uint16_t LocalPort() const = 0;
};

using CommandChannelFactory = std::function<std::unique_ptr<ICommandChannel>()>;

}  // namespace tellolink::net

#endif  // TELLOLINK_NET_I_COMMAND_CHANNEL_H_
