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

#include "message.h"
#include <kj/async.h>

namespace plank {
namespace rpc {

// =======================================================================================
// Transport interface
//
// A transport moves opaque finished buffers.  Everything typed lives in the wrappers further
// down and in generated code.

class CallStream {
  // Client side of one call in progress.
  //
  // Destroying the CallStream cancels the call if the server hasn't finished it and releases
  // whatever the transport holds for it (connection, stream, queues).  Destruction never blocks.

public:
  virtual ~CallStream() noexcept(false);

  virtual kj::Promise<void> send(kj::Array<const byte> message) = 0;
  // Sends one request.  The returned promise resolves when the transport is willing to accept
  // another message; transports use this for flow control.

  virtual void finishSending() = 0;
  // Signals that no more requests follow.  May be called while sends are still outstanding;
  // the end-of-stream marker is ordered after them.

  virtual kj::Promise<kj::Maybe<kj::Array<const byte>>> receive() = 0;
  // Waits for the next response.  Resolves to null once the server has finished, or rejects if
  // the call failed.
};

class Channel {
  // Something calls can be made on, typically a connection to one server.

public:
  virtual kj::Own<CallStream> startCall(kj::StringPtr service, kj::StringPtr method) = 0;
};

class ServerCall {
  // Server side of one call in progress.  Owned by the transport; valid until the promise
  // returned by Service::dispatch() completes or is canceled.

public:
  virtual kj::Promise<kj::Maybe<kj::Array<const byte>>> receive() = 0;
  // Next request, or null once the client has finished sending.

  virtual kj::Promise<void> send(kj::Array<const byte> message) = 0;
  // Sends one response.
};

class Service {
  // Base class of generated `Foo::Server` classes.

public:
  virtual ~Service() noexcept(false);

  virtual kj::StringPtr getServiceName() = 0;
  // Fully-qualified name of the service, e.g. "example.Greeter".

  virtual kj::Maybe<kj::Promise<void>> dispatch(kj::StringPtr method, ServerCall& call) = 0;
  // Starts handling a call.  Returns null if the method doesn't exist.  The promise completes
  // once the handler has sent everything it is going to send; canceling it cancels the handler.
};

// =======================================================================================
// Typed client-side streams

namespace _ {  // private

template <typename T>
kj::Maybe<Message<T>> toMaybeMessage(kj::Maybe<kj::Array<const byte>>&& payload) {
  KJ_IF_MAYBE(bytes, payload) {
    return Message<T>(kj::mv(*bytes));
  } else {
    return nullptr;
  }
}

template <typename T>
Message<T> requireMessage(kj::Maybe<kj::Array<const byte>>&& payload) {
  KJ_IF_MAYBE(bytes, payload) {
    return Message<T>(kj::mv(*bytes));
  } else {
    kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "stream ended without a message"));
  }
}

}  // namespace _ (private)

template <typename T>
class ResponseStream {
  // Lazily-consumed stream of responses from a server-streaming call.
  //
  // Each call to next() waits for one more response; null means the server finished the stream.
  // The stream may also be unbounded.  Dropping the ResponseStream, or calling cancel(), cancels
  // the call and releases the transport stream right away, whether or not the server has more to
  // send.  A promise returned by next() that is still pending at that point rejects with
  // DISCONNECTED.

public:
  ResponseStream(kj::Own<CallStream> call, kj::Promise<void> requestSent)
      : call(kj::mv(call)), requestSent(kj::mv(requestSent)) {}
  ResponseStream(ResponseStream&&) = default;
  ResponseStream& operator=(ResponseStream&& other) {
    cancel();
    call = kj::mv(other.call);
    requestSent = kj::mv(other.requestSent);
    canceler = kj::mv(other.canceler);
    return *this;
  }
  KJ_DISALLOW_COPY(ResponseStream);

  kj::Promise<kj::Maybe<Message<T>>> next() {
    KJ_IF_MAYBE(c, call) {
      CallStream& stream = **c;
      kj::Promise<kj::Maybe<kj::Array<const byte>>> received = nullptr;
      KJ_IF_MAYBE(sent, requestSent) {
        received = sent->then([&stream]() { return stream.receive(); });
        requestSent = nullptr;
      } else {
        received = stream.receive();
      }
      return canceler->wrap(received.then([](kj::Maybe<kj::Array<const byte>>&& payload) {
        return _::toMaybeMessage<T>(kj::mv(payload));
      }));
    } else {
      return kj::Maybe<Message<T>>(nullptr);
    }
  }

  void cancel() {
    // Outstanding reads refer to the call, so they go first.
    if (canceler.get() != nullptr) {
      canceler->cancel("stream was canceled");
    }
    requestSent = nullptr;
    call = nullptr;
  }

  inline bool isCanceled() const { return call == nullptr; }

private:
  kj::Maybe<kj::Own<CallStream>> call;
  kj::Maybe<kj::Promise<void>> requestSent;
  kj::Own<kj::Canceler> canceler = kj::heap<kj::Canceler>();
  // Declared last so that it is destroyed, canceling pending reads, before the call.
};

template <typename Request, typename Response>
class RequestStream {
  // Client side of a client-streaming call: write any number of requests, then finish() to get
  // the single response.  Dropping the RequestStream cancels the call.

public:
  explicit RequestStream(kj::Own<CallStream> call): call(kj::mv(call)) {}
  RequestStream(RequestStream&&) = default;
  RequestStream& operator=(RequestStream&& other) {
    if (canceler.get() != nullptr) {
      canceler->cancel("stream was canceled");
    }
    call = kj::mv(other.call);
    canceler = kj::mv(other.canceler);
    return *this;
  }
  KJ_DISALLOW_COPY(RequestStream);

  kj::Promise<void> write(Message<Request>&& message) {
    return canceler->wrap(call->send(message.releaseBytes()));
  }

  kj::Promise<Message<Response>> finish() {
    call->finishSending();
    return canceler->wrap(call->receive().then([](kj::Maybe<kj::Array<const byte>>&& payload) {
      return _::requireMessage<Response>(kj::mv(payload));
    }));
  }

private:
  kj::Own<CallStream> call;
  kj::Own<kj::Canceler> canceler = kj::heap<kj::Canceler>();
};

template <typename Request, typename Response>
class BidiStream {
  // Both directions streaming.  Writes and reads may be interleaved freely.  Dropping the
  // BidiStream, or calling cancel(), cancels the call.

public:
  explicit BidiStream(kj::Own<CallStream> call): call(kj::mv(call)) {}
  BidiStream(BidiStream&&) = default;
  BidiStream& operator=(BidiStream&& other) {
    cancel();
    call = kj::mv(other.call);
    canceler = kj::mv(other.canceler);
    return *this;
  }
  KJ_DISALLOW_COPY(BidiStream);

  kj::Promise<void> write(Message<Request>&& message) {
    return canceler->wrap(getCall().send(message.releaseBytes()));
  }

  void finishWrites() { getCall().finishSending(); }

  kj::Promise<kj::Maybe<Message<Response>>> next() {
    KJ_IF_MAYBE(c, call) {
      return canceler->wrap((*c)->receive().then(
          [](kj::Maybe<kj::Array<const byte>>&& payload) {
        return _::toMaybeMessage<Response>(kj::mv(payload));
      }));
    } else {
      return kj::Maybe<Message<Response>>(nullptr);
    }
  }

  void cancel() {
    if (canceler.get() != nullptr) {
      canceler->cancel("stream was canceled");
    }
    call = nullptr;
  }

private:
  kj::Maybe<kj::Own<CallStream>> call;
  kj::Own<kj::Canceler> canceler = kj::heap<kj::Canceler>();

  CallStream& getCall() {
    KJ_IF_MAYBE(c, call) {
      return **c;
    } else {
      KJ_FAIL_REQUIRE("stream was canceled");
    }
  }
};

template <typename Response, typename Request>
kj::Promise<Message<Response>> callUnary(
    Channel& channel, kj::StringPtr service, kj::StringPtr method, Message<Request>&& request) {
  auto call = channel.startCall(service, method);
  CallStream& stream = *call;
  auto sent = stream.send(request.releaseBytes());
  stream.finishSending();
  return sent.then([&stream]() { return stream.receive(); })
      .then([](kj::Maybe<kj::Array<const byte>>&& payload) {
    return _::requireMessage<Response>(kj::mv(payload));
  }).attach(kj::mv(call));
}

template <typename Response, typename Request>
ResponseStream<Response> callServerStreaming(
    Channel& channel, kj::StringPtr service, kj::StringPtr method, Message<Request>&& request) {
  auto call = channel.startCall(service, method);
  auto sent = call->send(request.releaseBytes());
  call->finishSending();
  return ResponseStream<Response>(kj::mv(call), kj::mv(sent));
}

template <typename Request, typename Response>
RequestStream<Request, Response> callClientStreaming(
    Channel& channel, kj::StringPtr service, kj::StringPtr method) {
  return RequestStream<Request, Response>(channel.startCall(service, method));
}

template <typename Request, typename Response>
BidiStream<Request, Response> callBidiStreaming(
    Channel& channel, kj::StringPtr service, kj::StringPtr method) {
  return BidiStream<Request, Response>(channel.startCall(service, method));
}

// =======================================================================================
// Typed server-side streams

template <typename T>
class StreamReader {
  // Incoming requests of a client-streaming or bidi call, as seen by the handler.

public:
  explicit StreamReader(ServerCall& call): call(call) {}
  KJ_DISALLOW_COPY(StreamReader);

  kj::Promise<kj::Maybe<Message<T>>> next() {
    return call.receive().then([](kj::Maybe<kj::Array<const byte>>&& payload) {
      return _::toMaybeMessage<T>(kj::mv(payload));
    });
  }

private:
  ServerCall& call;
};

template <typename T>
class StreamWriter {
  // Outgoing responses of a server-streaming or bidi call, as seen by the handler.  Wait for
  // each write() before issuing the next one to respect the transport's flow control.

public:
  explicit StreamWriter(ServerCall& call): call(call) {}
  KJ_DISALLOW_COPY(StreamWriter);

  kj::Promise<void> write(Message<T>&& message) {
    return call.send(message.releaseBytes());
  }

private:
  ServerCall& call;
};

template <typename Request, typename Response, typename Handler>
kj::Promise<void> serveUnary(ServerCall& call, Handler handler) {
  return call.receive().then([handler](kj::Maybe<kj::Array<const byte>>&& payload) mutable {
    return handler(_::requireMessage<Request>(kj::mv(payload)));
  }).then([&call](Message<Response>&& response) {
    return call.send(response.releaseBytes());
  });
}

template <typename Request, typename Response, typename Handler>
kj::Promise<void> serveServerStreaming(ServerCall& call, Handler handler) {
  return call.receive().then(
      [&call, handler](kj::Maybe<kj::Array<const byte>>&& payload) mutable {
    auto writer = kj::heap<StreamWriter<Response>>(call);
    auto promise = handler(_::requireMessage<Request>(kj::mv(payload)), *writer);
    return promise.attach(kj::mv(writer));
  });
}

template <typename Request, typename Response, typename Handler>
kj::Promise<void> serveClientStreaming(ServerCall& call, Handler handler) {
  auto reader = kj::heap<StreamReader<Request>>(call);
  auto promise = handler(*reader);
  return promise.then([&call](Message<Response>&& response) {
    return call.send(response.releaseBytes());
  }).attach(kj::mv(reader));
}

template <typename Request, typename Response, typename Handler>
kj::Promise<void> serveBidiStreaming(ServerCall& call, Handler handler) {
  auto reader = kj::heap<StreamReader<Request>>(call);
  auto writer = kj::heap<StreamWriter<Response>>(call);
  auto promise = handler(*reader, *writer);
  return promise.attach(kj::mv(reader), kj::mv(writer));
}

}  // namespace rpc
}  // namespace plank
