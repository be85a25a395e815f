#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "../src/Core/EventBus.h"
#include "../src/Logging/Logger.h"
#include "../src/Workflow/IWorkflowEventSink.h"
#include "../src/Workflow/WorkflowRegistry.h"

using namespace MaestroEngine::Core;
using namespace MaestroEngine::Core::Workflow;
using namespace std::chrono_literals;

namespace {
    WorkflowStep step(std::string id, std::vector<std::string> dependencies, StepHandler handler) {
        WorkflowStep s;
        s.id = std::move(id);
        s.dependencies = std::move(dependencies);
        s.handler = std::move(handler);
        return s;
    }
}

int main() {
    Logging::Logger::global().setMinLevel(Logging::LogLevel::Info);

    // Print every lifecycle event as it happens
    auto bus = std::make_shared<EventBus>();
    bus->subscribe<WorkflowEvent>([](const WorkflowEvent& e) {
        std::cout << "  [" << e.name() << "]";
        if (e.stepId) std::cout << " " << *e.stepId;
        if (e.error) std::cout << " (" << *e.error << ")";
        std::cout << "\n";
    });

    WorkflowRegistryConfig config;
    config.defaultStepTimeout = 2s;
    config.defaultRetryDelay = 50ms;
    config.eventSink = std::make_shared<EventBusSink>(bus);
    WorkflowRegistry registry(config);

    // Example 1: order pipeline with a diamond of dependencies
    {
        std::cout << "\n=== Example 1: Order pipeline ===\n";
        WorkflowDefinition order;
        order.id = "order";
        order.name = "Order Fulfilment";
        order.version = "1.0.0";
        order.tags = {"shop"};

        order.steps.push_back(step("validate", {}, [](const StepValue& input, const StepContext&) -> StepValue {
            return std::any_cast<std::string>(input);
        }));
        order.steps.push_back(step("reserve", {"validate"}, [](const StepValue&, const StepContext& ctx) -> StepValue {
            ctx.state->set("reservation", std::string("R-1001"));
            std::this_thread::sleep_for(50ms);
            return std::string("reserved");
        }));
        order.steps.back().rollback = [](const StepValue&, const StepContext&) {
            std::cout << "  releasing reservation\n";
        };
        order.steps.push_back(step("charge", {"validate"}, [](const StepValue&, const StepContext&) -> StepValue {
            std::this_thread::sleep_for(50ms);
            return std::string("charged");
        }));
        order.steps.push_back(step("ship", {"reserve", "charge"}, [](const StepValue&, const StepContext& ctx) -> StepValue {
            auto reservation = ctx.state->getAs<std::string>("reservation").value_or("?");
            return "shipped " + reservation;
        }));

        registry.registerWorkflow(std::move(order));
        auto result = registry.execute("order", std::string("order-42"));
        std::cout << "Result: " << executionStatusToString(result.status())
                  << ", output " << std::any_cast<std::string>(result.execution.output) << "\n";
    }

    // Example 2: a failure triggers rollback of what already completed
    {
        std::cout << "\n=== Example 2: Rollback on failure ===\n";
        WorkflowDefinition refund;
        refund.id = "refund";
        refund.name = "Refund";
        refund.version = "1.0.0";

        refund.steps.push_back(step("lock", {}, [](const StepValue&, const StepContext&) -> StepValue {
            return std::string("locked");
        }));
        refund.steps.back().rollback = [](const StepValue&, const StepContext&) {
            std::cout << "  unlocking account\n";
        };
        refund.steps.push_back(step("transfer", {"lock"}, [](const StepValue&, const StepContext&) -> StepValue {
            throw std::runtime_error("bank unavailable");
        }));
        refund.steps.back().maxRetries = 2;

        registry.registerWorkflow(std::move(refund));
        auto result = registry.execute("refund");
        std::cout << "Result: " << executionStatusToString(result.status())
                  << ", " << result.stats.retries << " retries, error: "
                  << (result.execution.error ? result.execution.error->message : "none") << "\n";
    }

    // Example 3: cancel a long running execution
    {
        std::cout << "\n=== Example 3: Cancellation ===\n";
        WorkflowDefinition batch;
        batch.id = "batch";
        batch.name = "Batch Import";
        batch.version = "0.9.0";
        batch.steps.push_back(step("import", {}, [](const StepValue&, const StepContext& ctx) -> StepValue {
            while (!ctx.stopRequested()) {
                std::this_thread::sleep_for(10ms);
            }
            throw std::runtime_error("import interrupted");
        }));

        registry.registerWorkflow(std::move(batch));
        auto pending = registry.executeAsync("batch");
        std::this_thread::sleep_for(100ms);
        registry.cancel(pending.executionId);
        std::cout << "Result: " << executionStatusToString(pending.get().status()) << "\n";
    }

    std::cout << "\nHistory holds " << registry.getHistory().size() << " executions\n";
    return 0;
}
