// Repository: TelloLink
// Component: UDP Command Channel
// Purpose: POSIX datagram socket with a receive thread for drone command replies.
// Copyright (c) 2026 TelloLink

#include "tellolink/net/UdpCommandChannel.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "tellolink/util/Logger.hpp"

namespace tellolink::net {

using util::Logger;

namespace {

std::string ErrnoMessage(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

std::string TrimTrailing(const char* data, size_t len) {
  while (len > 0) {
    const char c = data[len - 1];
    if (c != '\r' && c != '\n' && c != ' ' && c != '\t' && c != '\0') break;
    --len;
  }
  return std::string(data, len);
}

}  // namespace

UdpCommandChannel::UdpCommandChannel(std::string device_address, uint16_t device_port)
    : device_address_(std::move(device_address)), device_port_(device_port) {}

UdpCommandChannel::~UdpCommandChannel() {
  Close();
}

void UdpCommandChannel::SetReplyListener(ReplyListener listener) {
  reply_listener_ = std::move(listener);
}

void UdpCommandChannel::SetErrorListener(ChannelErrorListener listener) {
  error_listener_ = std::move(listener);
}

bool UdpCommandChannel::IsOpen() const {
  return open_.load(std::memory_order_acquire);
}

ChannelResult UdpCommandChannel::Open(uint16_t local_port) {
  if (open_.load(std::memory_order_acquire)) {
    return ChannelResult(false, 0, "channel already open");
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    const int err = errno;
    return ChannelResult(false, err, ErrnoMessage("socket", err));
  }

  // No SO_REUSEADDR: a port held by another process must fail the bind.
  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  local.sin_port = htons(local_port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    return ChannelResult(false, err,
                         ErrnoMessage(("bind port " + std::to_string(local_port)).c_str(), err));
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    local_port_.store(ntohs(bound.sin_port), std::memory_order_release);
  }

  stop_.store(false, std::memory_order_release);
  open_.store(true, std::memory_order_release);
  receive_thread_ = std::thread(&UdpCommandChannel::ReceiveLoop, this);

  Logger::Info("[UdpCommandChannel] Bound local port " + std::to_string(LocalPort()) +
               ", device " + device_address_ + ":" + std::to_string(device_port_));
  return ChannelResult(true, 0, "");
}

ChannelResult UdpCommandChannel::Send(const std::string& command) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (!open_.load(std::memory_order_acquire) || fd_ < 0) {
    return ChannelResult(false, 0, "channel not open");
  }

  sockaddr_in remote{};
  remote.sin_family = AF_INET;
  remote.sin_port = htons(device_port_);
  if (::inet_pton(AF_INET, device_address_.c_str(), &remote.sin_addr) != 1) {
    return ChannelResult(false, EINVAL, "invalid device address '" + device_address_ + "'");
  }

  const ssize_t sent = ::sendto(fd_, command.data(), command.size(), 0,
                                reinterpret_cast<sockaddr*>(&remote), sizeof(remote));
  if (sent < 0) {
    const int err = errno;
    return ChannelResult(false, err, ErrnoMessage("sendto", err));
  }
  if (static_cast<size_t>(sent) != command.size()) {
    return ChannelResult(false, 0, "short datagram write");
  }

  Logger::Info("[UdpCommandChannel] Sent '" + command + "' to " + device_address_ + ":" +
               std::to_string(device_port_));
  return ChannelResult(true, 0, "");
}

void UdpCommandChannel::Close() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  stop_.store(true, std::memory_order_release);
  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (open_.exchange(false, std::memory_order_acq_rel)) {
    Logger::Info("[UdpCommandChannel] Closed");
  }
  local_port_.store(0, std::memory_order_release);
}

void UdpCommandChannel::ReceiveLoop() {
  std::vector<char> buffer(kMaxDatagram);

  while (!stop_.load(std::memory_order_acquire)) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
    if (ready == 0) continue;
    if (ready < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      if (!stop_.load(std::memory_order_acquire) && error_listener_) {
        error_listener_(ErrnoMessage("poll", err));
      }
      return;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
      if (!stop_.load(std::memory_order_acquire) && error_listener_) {
        error_listener_("command socket error");
      }
      return;
    }

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                        reinterpret_cast<sockaddr*>(&from), &from_len);
    if (received < 0) {
      const int err = errno;
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) continue;
      if (!stop_.load(std::memory_order_acquire) && error_listener_) {
        error_listener_(ErrnoMessage("recvfrom", err));
      }
      return;
    }

    CommandReply reply;
    reply.text = TrimTrailing(buffer.data(), static_cast<size_t>(received));
    char address[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &from.sin_addr, address, sizeof(address)) != nullptr) {
      reply.from_address = address;
    }
    reply.from_port = ntohs(from.sin_port);
    reply.received_at = std::chrono::steady_clock::now();

    Logger::Info("[UdpCommandChannel] Received '" + reply.text + "' from " +
                 reply.from_address + ":" + std::to_string(reply.from_port));
    if (reply_listener_ && !stop_.load(std::memory_order_acquire)) {
      reply_listener_(reply);
    }
  }
}

}  // namespace tellolink::net
