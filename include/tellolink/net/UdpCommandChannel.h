// Repository: TelloLink
// Component: UDP Command Channel
// Purpose: POSIX datagram socket with a receive thread for drone command replies.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_NET_UDP_COMMAND_CHANNEL_H_
#define TELLOLINK_NET_UDP_COMMAND_CHANNEL_H_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "tellolink/net/ICommandChannel.h"

namespace tellolink::net {

// UdpCommandChannel sends text commands to <device_address>:<device_port>
// and delivers every datagram received on the bound socket to the reply
// listener. The receive thread polls with a short timeout so Close() can
// stop it without racing the descriptor.
//
// Thread model:
//   - Open/Send/Close from the orchestrator dispatch thread
//   - Listeners from the receive thread
class UdpCommandChannel : public ICommandChannel {
 public:
  UdpCommandChannel(std::string device_address, uint16_t device_port);
  ~UdpCommandChannel() override;

  UdpCommandChannel(const UdpCommandChannel&) = delete;
  UdpCommandChannel& operator=(const UdpCommandChannel&) = delete;

  ChannelResult Open(uint16_t local_port) override;
  ChannelResult Send(const std::string& command) override;
  void Close() override;
  bool IsOpen() const override;

  void SetReplyListener(ReplyListener listener) override;
  void SetErrorListener(ChannelErrorListener listener) override;

  uint16_t LocalPort() const override { return local_port_.load(std::memory_order_acquire); }

  static constexpr int kPollTimeoutMs = 100;
  static constexpr size_t kMaxDatagram = 2048;

 private:
  void ReceiveLoop();

  std::string device_address_;
  uint16_t device_port_;

  int fd_ = -1;
  std::atomic<bool> open_{false};
  std::atomic<bool> stop_{false};
  std::atomic<uint16_t> local_port_{0};
  std::thread receive_thread_;

  std::mutex send_mutex_;
  ReplyListener reply_listener_;
  ChannelErrorListener error_listener_;
};

}  // namespace tellolink::net

#endif  // TELLOLINK_NET_UDP_COMMAND_CHANNEL_H_
