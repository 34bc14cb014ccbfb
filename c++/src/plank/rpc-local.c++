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

#include "rpc-local.h"

namespace plank {
namespace rpc {

MessageQueue::MessageQueue(uint capacity): capacity(capacity) {}
MessageQueue::~MessageQueue() noexcept(false) {}

kj::Promise<void> MessageQueue::push(kj::Array<const byte> message) {
  KJ_REQUIRE(!closed, "can't send after the stream was finished");
  KJ_IF_MAYBE(e, error) {
    return kj::cp(*e);
  }

  KJ_IF_MAYBE(reader, waitingReader) {
    (*reader)->fulfill(kj::Maybe<kj::Array<const byte>>(kj::mv(message)));
    waitingReader = nullptr;
    return kj::READY_NOW;
  }

  messages.push_back(kj::mv(message));
  if (messages.size() <= capacity) {
    return kj::READY_NOW;
  }

  auto paf = kj::newPromiseAndFulfiller<void>();
  waitingWriters.push_back(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

kj::Promise<kj::Maybe<kj::Array<const byte>>> MessageQueue::pop() {
  KJ_REQUIRE(waitingReader == nullptr, "only one receive() may be outstanding at a time");

  if (!messages.empty()) {
    auto message = kj::mv(messages.front());
    messages.pop_front();
    if (!waitingWriters.empty()) {
      waitingWriters.front()->fulfill();
      waitingWriters.pop_front();
    }
    return kj::Maybe<kj::Array<const byte>>(kj::mv(message));
  }

  KJ_IF_MAYBE(e, error) {
    return kj::cp(*e);
  }
  if (closed) {
    return kj::Maybe<kj::Array<const byte>>(nullptr);
  }

  auto paf = kj::newPromiseAndFulfiller<kj::Maybe<kj::Array<const byte>>>();
  waitingReader = kj::mv(paf.fulfiller);
  return kj::mv(paf.promise);
}

void MessageQueue::close() {
  closed = true;
  KJ_IF_MAYBE(reader, waitingReader) {
    (*reader)->fulfill(kj::Maybe<kj::Array<const byte>>(nullptr));
    waitingReader = nullptr;
  }
}

void MessageQueue::fail(kj::Exception&& exception) {
  KJ_IF_MAYBE(reader, waitingReader) {
    (*reader)->reject(kj::cp(exception));
    waitingReader = nullptr;
  }
  for (auto& writer: waitingWriters) {
    writer->reject(kj::cp(exception));
  }
  waitingWriters.clear();
  error = kj::mv(exception);
}

// =======================================================================================

class LocalChannel::LocalCall final: public CallStream {
public:
  LocalCall(LocalChannel& channel, kj::StringPtr serviceName, kj::StringPtr methodName)
      : channel(channel),
        serviceName(kj::heapString(serviceName)),
        methodName(kj::heapString(methodName)),
        requests(channel.queueCapacity),
        responses(channel.queueCapacity),
        serverSide(*this) {
    ++channel.openCalls;

    // Start the handler on a later turn of the event loop so that startCall() never runs
    // application code.
    serverTask = kj::evalLater([this]() -> kj::Promise<void> {
      if (this->serviceName != this->channel.service.getServiceName()) {
        return KJ_EXCEPTION(UNIMPLEMENTED, "no such service", this->serviceName);
      }
      KJ_IF_MAYBE(task, this->channel.service.dispatch(this->methodName, serverSide)) {
        return kj::mv(*task);
      } else {
        return KJ_EXCEPTION(UNIMPLEMENTED, "no such method", this->serviceName, this->methodName);
      }
    }).then([this]() {
      serverDone = true;
      responses.close();
    }, [this](kj::Exception&& exception) {
      serverDone = true;
      responses.fail(kj::mv(exception));
    }).eagerlyEvaluate(nullptr);
  }

  ~LocalCall() noexcept(false) {
    if (!serverDone) {
      KJ_LOG(INFO, "call canceled by client", serviceName, methodName);
      ++channel.canceledCalls;
    }
    // Cancel the handler before the queues and the server side it refers to go away.
    serverTask = nullptr;
    --channel.openCalls;
  }

  kj::Promise<void> send(kj::Array<const byte> message) override {
    return requests.push(kj::mv(message));
  }

  void finishSending() override {
    requests.close();
  }

  kj::Promise<kj::Maybe<kj::Array<const byte>>> receive() override {
    return responses.pop();
  }

private:
  class ServerSide final: public ServerCall {
  public:
    explicit ServerSide(LocalCall& call): call(call) {}

    kj::Promise<kj::Maybe<kj::Array<const byte>>> receive() override {
      return call.requests.pop();
    }

    kj::Promise<void> send(kj::Array<const byte> message) override {
      return call.responses.push(kj::mv(message));
    }

  private:
    LocalCall& call;
  };

  LocalChannel& channel;
  kj::String serviceName;
  kj::String methodName;
  MessageQueue requests;
  MessageQueue responses;
  ServerSide serverSide;
  bool serverDone = false;
  kj::Promise<void> serverTask = nullptr;
};

LocalChannel::LocalChannel(Service& service, uint queueCapacity)
    : service(service), queueCapacity(queueCapacity) {}

LocalChannel::~LocalChannel() noexcept(false) {
  if (openCalls > 0) {
    KJ_LOG(ERROR, "LocalChannel destroyed while calls are still open", openCalls);
  }
}

kj::Own<CallStream> LocalChannel::startCall(kj::StringPtr serviceName, kj::StringPtr methodName) {
  return kj::heap<LocalCall>(*this, serviceName, methodName);
}

}  // namespace rpc
}  // namespace plank
