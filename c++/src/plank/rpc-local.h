// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include "rpc.h"
#include <deque>

namespace plank {
namespace rpc {

class MessageQueue {
  // Single-producer, single-consumer queue of messages with a capacity.  push() resolves
  // immediately while the queue holds at most `capacity` messages and otherwise waits until the
  // consumer catches up.

public:
  explicit MessageQueue(uint capacity);
  KJ_DISALLOW_COPY(MessageQueue);
  ~MessageQueue() noexcept(false);

  kj::Promise<void> push(kj::Array<const byte> message);

  kj::Promise<kj::Maybe<kj::Array<const byte>>> pop();
  // Resolves to null after close() once all queued messages are consumed.

  void close();
  // No more messages will be pushed.

  void fail(kj::Exception&& exception);
  // The producer failed.  Messages already queued are still delivered, then pop() rejects.

  inline size_t size() const { return messages.size(); }

private:
  uint capacity;
  std::deque<kj::Array<const byte>> messages;
  bool closed = false;
  kj::Maybe<kj::Exception> error;

  kj::Maybe<kj::Own<kj::PromiseFulfiller<kj::Maybe<kj::Array<const byte>>>>> waitingReader;
  std::deque<kj::Own<kj::PromiseFulfiller<void>>> waitingWriters;
  // One per message beyond `capacity`, front first.
};

class LocalChannel final: public Channel {
  // A Channel that runs calls against a Service on the same event loop.  Each call gets a pair of
  // bounded queues; the service handler runs as a separate task that is canceled as soon as the
  // client drops its end of the call.
  //
  // Used in tests, and as the reference for how transports must treat cancellation.

public:
  explicit LocalChannel(Service& service, uint queueCapacity = 4);
  KJ_DISALLOW_COPY(LocalChannel);
  ~LocalChannel() noexcept(false);

  kj::Own<CallStream> startCall(kj::StringPtr service, kj::StringPtr method) override;

  inline uint getOpenCallCount() const { return openCalls; }
  // Calls whose client end hasn't been destroyed yet.

  inline uint getCanceledCallCount() const { return canceledCalls; }
  // Calls destroyed before the server finished them.

private:
  class LocalCall;

  Service& service;
  uint queueCapacity;
  uint openCalls = 0;
  uint canceledCalls = 0;
};

}  // namespace rpc
}  // namespace plank
