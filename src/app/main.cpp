#include "courier/config/Config.hpp"
#include "courier/core/Message.hpp"
#include "courier/core/RequestHandler.hpp"
#include "courier/core/TaskScheduler.hpp"
#include "courier/exceptions/PublishException.h"
#include "courier/mediator/Mediator.hpp"
#include "courier/registry/HandlerRegistry.hpp"
#include "courier/strategy/FollowUpRequestStrategy.hpp"
#include "courier/strategy/StrategyNotificationHandler.hpp"

#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace {

struct PingResponse {
    std::string message;
};

struct PingRequest : courier::core::Request<PingResponse> {
    std::string message;
};

struct PingNotification : courier::strategy::StrategyNotification<PingRequest> {
    using StrategyNotification::StrategyNotification;
};

/**
 * @brief Writes every request message it receives as one line to the output sink.
 */
class PingHandler : public courier::core::RequestHandler<PingRequest> {
public:
    explicit PingHandler(std::ostream& out) : out_(out) {}

protected:
    PingResponse handleCore(const PingRequest& request) override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            out_ << request.message << std::endl;
        }
        return PingResponse{request.message};
    }

private:
    std::ostream& out_;
    std::mutex mtx_;
};

} // namespace

/**
 * @brief Sends "Ping" directly, then publishes a notification whose strategy sends the follow-up.
 */
int main(int argc, char* argv[]) {
    spdlog::set_level(courier::config::DEFAULT_LOG_LEVEL);
    if (argc > 1 && std::string(argv[1]) == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::info("Starting courier demo.");
    try {
        auto scheduler = std::make_shared<courier::core::TaskScheduler>();
        auto registry = std::make_shared<courier::registry::HandlerRegistry>();
        auto mediator = std::make_shared<const courier::mediator::Mediator>(registry);

        registry->addRequestHandler<PingRequest>(std::make_shared<PingHandler>(std::cout));
        courier::strategy::addStrategyHandler<PingNotification>(*registry, mediator, scheduler);

        PingRequest ping;
        ping.message = "Ping";
        auto response = mediator->send(ping);
        spdlog::info("Response: {}", response.message);

        mediator->publish(PingNotification(ping));

        scheduler->stop();
        spdlog::info("Demo finished.");
    } catch (const courier::PublishException& e) {
        spdlog::error("Exception: {} ({} failure(s))", e.what(), e.failures().size());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Exception: {}", e.what());
        return 1;
    }

    return 0;
}
