// Repository: TelloLink
// Component: Command Channel Stub
// Purpose: In-memory command channel with a factory that tracks instance and open counts.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_TESTS_FIXTURES_COMMAND_CHANNEL_STUB_H_
#define TELLOLINK_TESTS_FIXTURES_COMMAND_CHANNEL_STUB_H_

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tellolink/net/ICommandChannel.h"

namespace tellolink::tests::fixtures {

// Behaviour applied to every channel the factory creates from now on.
struct ChannelStubScript {
  bool fail_open = false;
  std::string fail_send_command;  // Send() of exactly this command fails
  std::string auto_reply;         // delivered synchronously after every Send; empty = none
};

class CommandChannelStub;

// Shared bookkeeping between the factory and the channels it made.
struct ChannelStubState {
  std::mutex mutex;
  ChannelStubScript script;
  int created = 0;
  int live = 0;
  int open_now = 0;
  int max_open = 0;
  int close_calls = 0;
  std::vector<std::string> sent;
  CommandChannelStub* current = nullptr;  // the open channel, if any
};

class CommandChannelStub : public net::ICommandChannel {
 public:
  explicit CommandChannelStub(std::shared_ptr<ChannelStubState> state) : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    script_ = state_->script;
    ++state_->created;
    ++state_->live;
  }

  ~CommandChannelStub() override {
    Close();
    std::lock_guard<std::mutex> lock(state_->mutex);
    --state_->live;
  }

  net::ChannelResult Open(uint16_t local_port) override {
    if (script_.fail_open) {
      return net::ChannelResult(false, 98, "bind port " + std::to_string(local_port) +
                                               ": Address already in use");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (open_) return net::ChannelResult(false, 0, "channel already open");
    open_ = true;
    ++state_->open_now;
    state_->max_open = std::max(state_->max_open, state_->open_now);
    state_->current = this;
    return net::ChannelResult(true, 0, "");
  }

  net::ChannelResult Send(const std::string& command) override {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!open_) return net::ChannelResult(false, 0, "channel not open");
      if (!script_.fail_send_command.empty() && command == script_.fail_send_command) {
        return net::ChannelResult(false, 101, "sendto: Network is unreachable");
      }
      state_->sent.push_back(command);
    }
    if (!script_.auto_reply.empty() && reply_listener_) {
      reply_listener_(MakeReply(script_.auto_reply));
    }
    return net::ChannelResult(true, 0, "");
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->close_calls;
    if (!open_) return;
    open_ = false;
    --state_->open_now;
    if (state_->current == this) state_->current = nullptr;
  }

  bool IsOpen() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return open_;
  }

  void SetReplyListener(net::ReplyListener listener) override { reply_listener_ = std::move(listener); }
  void SetErrorListener(net::ChannelErrorListener listener) override { error_listener_ = std::move(listener); }

  uint16_t LocalPort() const override { return open_ ? 40000 : 0; }

  static net::CommandReply MakeReply(const std::string& text) {
    net::CommandReply reply;
    reply.text = text;
    reply.from_address = "192.168.10.1";
    reply.from_port = 8889;
    reply.received_at = std::chrono::steady_clock::now();
    return reply;
  }

  const net::ReplyListener& reply_listener() const { return reply_listener_; }
  const net::ChannelErrorListener& error_listener() const { return error_listener_; }

 private:
  std::shared_ptr<ChannelStubState> state_;
  ChannelStubScript script_;
  bool open_ = false;  // guarded by state_->mutex
  net::ReplyListener reply_listener_;
  net::ChannelErrorListener error_listener_;
};

// Hands out CommandChannelStubs and answers questions about them.
class CommandChannelStubFactory {
 public:
  CommandChannelStubFactory() : state_(std::make_shared<ChannelStubState>()) {}

  net::CommandChannelFactory AsFactory() const {
    std::shared_ptr<ChannelStubState> state = state_;
    return [state]() -> std::unique_ptr<net::ICommandChannel> {
      return std::make_unique<CommandChannelStub>(state);
    };
  }

  void SetScript(const ChannelStubScript& script) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->script = script;
  }

  int created() const { return Read([](const ChannelStubState& s) { return s.created; }); }
  int live() const { return Read([](const ChannelStubState& s) { return s.live; }); }
  int open_now() const { return Read([](const ChannelStubState& s) { return s.open_now; }); }
  int max_open() const { return Read([](const ChannelStubState& s) { return s.max_open; }); }

  std::vector<std::string> SentCommands() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sent;
  }

  // Delivers a datagram to the open channel's reply listener, as its
  // receive thread would. Returns false when no channel is open.
  bool InjectReply(const std::string& text) {
    net::ReplyListener listener;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->current) return false;
      listener = state_->current->reply_listener();
    }
    if (listener) listener(CommandChannelStub::MakeReply(text));
    return static_cast<bool>(listener);
  }

  bool InjectError(const std::string& message) {
    net::ChannelErrorListener listener;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->current) return false;
      listener = state_->current->error_listener();
    }
    if (listener) listener(message);
    return static_cast<bool>(listener);
  }

 private:
  template <typename F>
  int Read(F f) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return f(*state_);
  }

  std::shared_ptr<ChannelStubState> state_;
};

}  // namespace tellolink::tests::fixtures

#endif  // TELLOLINK_TESTS_FIXTURES_COMMAND_CHANNEL_STUB_H_
