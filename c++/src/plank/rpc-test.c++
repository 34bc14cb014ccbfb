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
#include <plank/test.fbs.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace plank {
namespace test {
namespace {

Message<HelloRequest> makeRequest(kj::StringPtr name) {
  BufferBuilder builder;
  HelloRequest::Args args;
  args.name = builder.createString(name);
  return finishMessage(builder, HelloRequest::create(builder, args));
}

Message<ManyHellosRequest> makeManyRequest(kj::StringPtr name, int32_t count) {
  BufferBuilder builder;
  ManyHellosRequest::Args args;
  args.name = builder.createString(name);
  args.numGreetings = count;
  return finishMessage(builder, ManyHellosRequest::create(builder, args));
}

Message<HelloReply> makeReply(kj::StringPtr text) {
  BufferBuilder builder;
  HelloReply::Args args;
  args.message = builder.createString(text);
  return finishMessage(builder, HelloReply::create(builder, args));
}

class TestGreeter final: public Greeter::Server {
public:
  uint sentGreetings = 0;

protected:
  kj::Promise<Message<HelloReply>> sayHello(Message<HelloRequest>&& request) override {
    return makeReply(kj::str("Hello, ", request.getRoot().getName()));
  }

  kj::Promise<void> sayManyHellos(Message<ManyHellosRequest>&& request,
                                  rpc::StreamWriter<HelloReply>& responses) override {
    // A count of zero means "until canceled".
    auto root = request.getRoot();
    return greet(kj::heapString(root.getName()), root.getNumGreetings(), 0, responses);
  }

  kj::Promise<Message<HelloReply>> collectHellos(
      rpc::StreamReader<HelloRequest>& requests) override {
    return collect(requests, kj::Vector<kj::String>());
  }

  kj::Promise<void> chat(rpc::StreamReader<HelloRequest>& requests,
                         rpc::StreamWriter<HelloReply>& responses) override {
    return requests.next().then(
        [this, &requests, &responses](kj::Maybe<Message<HelloRequest>>&& request)
        -> kj::Promise<void> {
      KJ_IF_MAYBE(r, request) {
        return responses.write(makeReply(kj::str("Hi, ", r->getRoot().getName())))
            .then([this, &requests, &responses]() {
          return chat(requests, responses);
        });
      } else {
        return kj::READY_NOW;
      }
    });
  }

private:
  kj::Promise<void> greet(kj::String name, int32_t count, int32_t index,
                          rpc::StreamWriter<HelloReply>& responses) {
    if (count > 0 && index >= count) {
      return kj::READY_NOW;
    }
    auto written = responses.write(makeReply(kj::str("Hello #", index, ", ", name)));
    ++sentGreetings;
    return written.then([this, name = kj::mv(name), count, index, &responses]() mutable {
      return greet(kj::mv(name), count, index + 1, responses);
    });
  }

  kj::Promise<Message<HelloReply>> collect(rpc::StreamReader<HelloRequest>& requests,
                                           kj::Vector<kj::String> names) {
    return requests.next().then(
        [this, &requests, names = kj::mv(names)](kj::Maybe<Message<HelloRequest>>&& request)
        mutable -> kj::Promise<Message<HelloReply>> {
      KJ_IF_MAYBE(r, request) {
        names.add(kj::heapString(r->getRoot().getName()));
        return collect(requests, kj::mv(names));
      } else {
        return makeReply(kj::str("Hello, ", kj::strArray(names, " and ")));
      }
    });
  }
};

class EmptyGreeter final: public Greeter::Server {};

void turnEventLoop(kj::WaitScope& waitScope) {
  for (uint i = 0; i < 10; i++) {
    kj::evalLater([]() {}).wait(waitScope);
  }
}

KJ_TEST("unary call") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  auto reply = client.sayHello(makeRequest("world")).wait(waitScope);
  KJ_EXPECT(reply.getRoot().getMessage() == "Hello, world");
  KJ_EXPECT(channel.getOpenCallCount() == 0);
}

KJ_TEST("server streaming call runs to completion") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  {
    auto stream = client.sayManyHellos(makeManyRequest("Ann", 3));
    kj::Vector<kj::String> received;
    for (;;) {
      auto reply = stream.next().wait(waitScope);
      KJ_IF_MAYBE(r, reply) {
        received.add(kj::heapString(r->getRoot().getMessage()));
      } else {
        break;
      }
    }
    KJ_EXPECT(kj::strArray(received, "|") == "Hello #0, Ann|Hello #1, Ann|Hello #2, Ann");

    // Reading past the end keeps returning null.
    KJ_EXPECT(stream.next().wait(waitScope) == nullptr);
  }

  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 0);
}

KJ_TEST("canceling a server stream releases the call") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server, 2);
  Greeter::Client client(channel);

  auto stream = client.sayManyHellos(makeManyRequest("Bob", 0));
  for (uint i = 0; i < 3; i++) {
    auto reply = stream.next().wait(waitScope);
    KJ_EXPECT(KJ_ASSERT_NONNULL(reply).getRoot().getMessage() == kj::str("Hello #", i, ", Bob"));
  }
  KJ_EXPECT(channel.getOpenCallCount() == 1);

  // The server is ahead of the client only by what the queue holds.
  turnEventLoop(waitScope);
  uint sentBeforeCancel = server.sentGreetings;
  KJ_EXPECT(sentBeforeCancel <= 3 + 2 + 1, sentBeforeCancel);

  stream.cancel();
  KJ_EXPECT(stream.isCanceled());
  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 1);

  turnEventLoop(waitScope);
  KJ_EXPECT(server.sentGreetings == sentBeforeCancel);
  KJ_EXPECT(stream.next().wait(waitScope) == nullptr);

  // Each call gets its own stream.
  auto again = client.sayManyHellos(makeManyRequest("Cy", 0));
  auto first = again.next().wait(waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(first).getRoot().getMessage() == "Hello #0, Cy");
  KJ_EXPECT(channel.getOpenCallCount() == 1);
}

KJ_TEST("dropping a server stream cancels it") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  {
    auto stream = client.sayManyHellos(makeManyRequest("Dee", 0));
    auto reply = stream.next().wait(waitScope);
    KJ_EXPECT(reply != nullptr);
  }
  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 1);
}

KJ_TEST("canceling a stream rejects reads still in flight") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  {
    auto stream = client.sayManyHellos(makeManyRequest("Eve", 0));
    auto pending = stream.next();
    stream.cancel();
    KJ_EXPECT(channel.getOpenCallCount() == 0);

    auto exception = kj::runCatchingExceptions([&]() { pending.wait(waitScope); });
    auto& e = KJ_ASSERT_NONNULL(exception);
    KJ_EXPECT(e.getType() == kj::Exception::Type::DISCONNECTED);
    KJ_EXPECT(e.getDescription() == "stream was canceled", e.getDescription());
  }

  {
    // Nothing has been written, so the read can't complete before the cancel.
    auto chat = client.chat();
    auto pending = chat.next();
    chat.cancel();
    KJ_EXPECT_THROW_MESSAGE("stream was canceled", pending.wait(waitScope));
  }

  {
    // Dropping the stream itself has the same effect.
    kj::Maybe<rpc::ResponseStream<HelloReply>> stream =
        client.sayManyHellos(makeManyRequest("Fay", 0));
    auto pending = KJ_ASSERT_NONNULL(stream).next();
    stream = nullptr;
    auto exception = kj::runCatchingExceptions([&]() { pending.wait(waitScope); });
    KJ_EXPECT(KJ_ASSERT_NONNULL(exception).getType() == kj::Exception::Type::DISCONNECTED);
  }

  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 3);
}

KJ_TEST("client streaming call") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  {
    auto stream = client.collectHellos();
    stream.write(makeRequest("Ann")).wait(waitScope);
    stream.write(makeRequest("Bob")).wait(waitScope);
    stream.write(makeRequest("Cy")).wait(waitScope);
    auto reply = stream.finish().wait(waitScope);
    KJ_EXPECT(reply.getRoot().getMessage() == "Hello, Ann and Bob and Cy");
  }
  KJ_EXPECT(channel.getOpenCallCount() == 0);
}

KJ_TEST("bidirectional streaming call") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  {
    auto chat = client.chat();
    chat.write(makeRequest("Ann")).wait(waitScope);
    auto first = chat.next().wait(waitScope);
    KJ_EXPECT(KJ_ASSERT_NONNULL(first).getRoot().getMessage() == "Hi, Ann");

    chat.write(makeRequest("Bob")).wait(waitScope);
    auto second = chat.next().wait(waitScope);
    KJ_EXPECT(KJ_ASSERT_NONNULL(second).getRoot().getMessage() == "Hi, Bob");

    chat.finishWrites();
    KJ_EXPECT(chat.next().wait(waitScope) == nullptr);
  }
  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 0);

  {
    auto chat = client.chat();
    chat.cancel();
    KJ_EXPECT(chat.next().wait(waitScope) == nullptr);
    KJ_EXPECT_THROW_MESSAGE("stream was canceled", chat.finishWrites());
  }
  KJ_EXPECT(channel.getOpenCallCount() == 0);
}

KJ_TEST("methods a server doesn't implement fail with UNIMPLEMENTED") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  EmptyGreeter server;
  rpc::LocalChannel channel(server);
  Greeter::Client client(channel);

  KJ_EXPECT_THROW_MESSAGE("method not implemented",
                          client.sayHello(makeRequest("x")).wait(waitScope));

  auto stream = client.sayManyHellos(makeManyRequest("x", 1));
  auto exception = kj::runCatchingExceptions([&]() { stream.next().wait(waitScope); });
  KJ_EXPECT(KJ_ASSERT_NONNULL(exception).getType() == kj::Exception::Type::UNIMPLEMENTED);
}

KJ_TEST("unknown service or method") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestGreeter server;
  rpc::LocalChannel channel(server);

  {
    auto call = channel.startCall("plank.test.Greeter", "SayGoodbye");
    call->finishSending();
    KJ_EXPECT_THROW_MESSAGE("no such method", call->receive().wait(waitScope));
  }
  {
    auto call = channel.startCall("plank.test.Nope", "SayHello");
    call->finishSending();
    KJ_EXPECT_THROW_MESSAGE("no such service", call->receive().wait(waitScope));
  }
  KJ_EXPECT(channel.getOpenCallCount() == 0);
  KJ_EXPECT(channel.getCanceledCallCount() == 0);
}

KJ_TEST("message queue applies back-pressure") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  rpc::MessageQueue queue(1);

  queue.push(kj::heapArray<byte>({ 1 })).wait(waitScope);

  bool secondAccepted = false;
  auto second = queue.push(kj::heapArray<byte>({ 2 }))
      .then([&]() { secondAccepted = true; }).eagerlyEvaluate(nullptr);
  turnEventLoop(waitScope);
  KJ_EXPECT(!secondAccepted);
  KJ_EXPECT(queue.size() == 2);

  auto first = queue.pop().wait(waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(first)[0] == 1);
  second.wait(waitScope);
  KJ_EXPECT(secondAccepted);

  queue.close();
  auto last = queue.pop().wait(waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(last)[0] == 2);
  KJ_EXPECT(queue.pop().wait(waitScope) == nullptr);
  KJ_EXPECT_THROW_MESSAGE("after the stream was finished", queue.push(kj::heapArray<byte>({ 3 })));
}

KJ_TEST("message queue failure is delivered after queued messages") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  rpc::MessageQueue queue(4);

  queue.push(kj::heapArray<byte>({ 7 })).wait(waitScope);
  queue.fail(KJ_EXCEPTION(DISCONNECTED, "peer went away"));

  auto message = queue.pop().wait(waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(message)[0] == 7);
  KJ_EXPECT_THROW_MESSAGE("peer went away", queue.pop().wait(waitScope));
}

}  // namespace
}  // namespace test
}  // namespace plank
