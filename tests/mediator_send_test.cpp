#include "courier/core/IHandlerFactory.hpp"
#include "courier/core/Message.hpp"
#include "courier/core/RequestHandler.hpp"
#include "courier/core/TaskScheduler.hpp"
#include "courier/exceptions/HandlerAmbiguityException.h"
#include "courier/exceptions/HandlerNotFoundException.h"
#include "courier/exceptions/HandlerResolutionException.h"
#include "courier/exceptions/OperationCancelledException.h"
#include "courier/mediator/Mediator.hpp"
#include "courier/registry/HandlerRegistry.hpp"

#include <gtest/gtest.h>

#include <any>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using courier::core::CancellationSource;
using courier::core::CancellationToken;
using courier::core::TaskScheduler;
using courier::core::Unit;
using courier::mediator::Mediator;
using courier::registry::HandlerRegistry;

struct Greeting {
    std::string text;
};

struct GreetRequest : courier::core::Request<Greeting> {
    std::string name;
};

struct OrphanRequest : courier::core::Request<int> {};

struct ResetRequest : courier::core::Request<Unit> {};

struct SlowRequest : courier::core::Request<int> {
    int value = 0;
};

class GreetingRejected : public std::runtime_error {
public:
    explicit GreetingRejected(const std::string& who) : std::runtime_error("rejected " + who), who_(who) {}
    const std::string& who() const noexcept { return who_; }

private:
    std::string who_;
};

class GreetHandler : public courier::core::RequestHandler<GreetRequest> {
public:
    std::atomic<int> calls{0};

protected:
    Greeting handleCore(const GreetRequest& request) override {
        ++calls;
        if (request.name == "mallory") {
            throw GreetingRejected(request.name);
        }
        return Greeting{"Hello, " + request.name};
    }
};

class ResetHandler : public courier::core::RequestHandler<ResetRequest> {
public:
    bool reset = false;

protected:
    Unit handleCore(const ResetRequest&) override {
        reset = true;
        return Unit{};
    }
};

// waits for gate before answering, on a scheduler thread
class SlowHandler : public courier::core::AsyncRequestHandler<SlowRequest> {
public:
    SlowHandler(std::shared_ptr<TaskScheduler> scheduler, std::shared_future<void> gate)
        : AsyncRequestHandler(std::move(scheduler)), gate_(std::move(gate)) {}

    std::atomic<bool> finished{false};
    std::atomic<std::thread::id> worker{};

protected:
    int handleCore(const SlowRequest& request, const CancellationToken&) override {
        worker = std::this_thread::get_id();
        gate_.wait();
        finished = true;
        return request.value * 2;
    }

private:
    std::shared_future<void> gate_;
};

// factory wired to hand back something that is not a handler
class MiswiredFactory : public courier::core::IHandlerFactory {
public:
    std::any resolveOne(const courier::core::TypeKey&) const override { return std::any(42); }
    std::vector<std::any> resolveMany(const courier::core::TypeKey&) const override { return {}; }
};

class MediatorSendTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<HandlerRegistry>();
        mediator = std::make_shared<Mediator>(registry);
        greeter = std::make_shared<GreetHandler>();
        registry->addRequestHandler<GreetRequest>(greeter);
    }

    std::shared_ptr<HandlerRegistry> registry;
    std::shared_ptr<Mediator> mediator;
    std::shared_ptr<GreetHandler> greeter;
};

} // namespace

TEST_F(MediatorSendTest, ReturnsHandlerResultUnchanged) {
    GreetRequest request;
    request.name = "alice";
    auto response = mediator->send(request);
    EXPECT_EQ(response.text, "Hello, alice");
    EXPECT_EQ(greeter->calls.load(), 1);
}

TEST_F(MediatorSendTest, MissingHandlerRaisesHandlerNotFound) {
    EXPECT_THROW(mediator->send(OrphanRequest{}), courier::HandlerNotFoundException);
}

TEST_F(MediatorSendTest, SecondHandlerRaisesAmbiguityInsteadOfPickingOne) {
    registry->addRequestHandler<GreetRequest>(std::make_shared<GreetHandler>());
    GreetRequest request;
    request.name = "alice";
    EXPECT_THROW(mediator->send(request), courier::HandlerAmbiguityException);
    EXPECT_EQ(greeter->calls.load(), 0);
}

TEST_F(MediatorSendTest, HandlerFailurePropagatesOriginalException) {
    GreetRequest request;
    request.name = "mallory";
    try {
        mediator->send(request);
        FAIL() << "expected GreetingRejected";
    } catch (const GreetingRejected& ex) {
        EXPECT_EQ(ex.who(), "mallory");
        EXPECT_STREQ(ex.what(), "rejected mallory");
    }
}

TEST_F(MediatorSendTest, EqualRequestsAreHandledIndependently) {
    GreetRequest first;
    first.name = "bob";
    GreetRequest second;
    second.name = "bob";
    EXPECT_EQ(mediator->send(first).text, "Hello, bob");
    EXPECT_EQ(mediator->send(second).text, "Hello, bob");
    EXPECT_EQ(greeter->calls.load(), 2);
}

TEST_F(MediatorSendTest, UnitRequestRunsHandler) {
    auto reset = std::make_shared<ResetHandler>();
    registry->addRequestHandler<ResetRequest>(reset);
    EXPECT_EQ(mediator->send(ResetRequest{}), Unit{});
    EXPECT_TRUE(reset->reset);
}

TEST_F(MediatorSendTest, AsyncHandlerRunsOnSchedulerThread) {
    auto scheduler = std::make_shared<TaskScheduler>(2);
    std::promise<void> gate;
    auto slow = std::make_shared<SlowHandler>(scheduler, gate.get_future().share());
    registry->addRequestHandler<SlowRequest>(slow);

    SlowRequest request;
    request.value = 21;
    auto fut = mediator->sendAsync(request);
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    gate.set_value();
    EXPECT_EQ(fut.get(), 42);
    EXPECT_NE(slow->worker.load(), std::this_thread::get_id());
    scheduler->stop();
}

TEST_F(MediatorSendTest, CancelledTokenStopsBeforeDispatch) {
    CancellationSource source;
    source.cancel();
    GreetRequest request;
    request.name = "alice";
    EXPECT_THROW(mediator->send(request, source.token()), courier::OperationCancelledException);
    EXPECT_EQ(greeter->calls.load(), 0);
}

TEST_F(MediatorSendTest, TimeoutStopsWaitingWithoutUndoingHandler) {
    auto scheduler = std::make_shared<TaskScheduler>(2);
    std::promise<void> gate;
    auto slow = std::make_shared<SlowHandler>(scheduler, gate.get_future().share());
    registry->addRequestHandler<SlowRequest>(slow);

    CancellationSource source(std::chrono::milliseconds(30));
    EXPECT_THROW(mediator->send(SlowRequest{}, source.token()), courier::OperationCancelledException);
    EXPECT_FALSE(slow->finished.load());

    // the started handler still runs to completion
    gate.set_value();
    scheduler->stop();
    EXPECT_TRUE(slow->finished.load());
}

TEST(MediatorResolutionTest, WrongHandlerTypeFromFactoryIsResolutionError) {
    Mediator mediator(std::make_shared<MiswiredFactory>());
    GreetRequest request;
    EXPECT_THROW(mediator.send(request), courier::HandlerResolutionException);
}

TEST(MediatorResolutionTest, NullFactoryIsRejected) {
    EXPECT_THROW(Mediator(nullptr), std::invalid_argument);
}
