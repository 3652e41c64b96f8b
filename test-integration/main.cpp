#include <logfunnel/log.hpp>
#include <logfunnel/log_aggregator.hpp>

using namespace logfunnel;

int main()
{
    log_funnel funnel({.name = "IT"});

    {
        scoped_aggregation session(funnel);
        if (!session.started()) return 1;

        // Test basic logging
        LOG(get_logger("integration"), info) << "Integration test successful!";
        LOG(get_logger("integration"), warn).add("user_id", 12345).add("ip", "192.168.1.1") << "User login";

        // Test a worker process
        auto worker = process_context::instance().create([] { get_logger("integration.worker").info("Worker reporting"); });
        worker->start();
        if (worker->join() != 0) return 1;
    }

    return funnel.stats().forwarded == 3 ? 0 : 1;
}
