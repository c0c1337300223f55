#pragma once

#include <di.hpp>

#include <reporting/events.hpp>

#include <mutex>

template <typename RendererType>
class ReportEngine {
    using services_t = di::Deps<RendererType>;

    services_t services_;
    bool sync_output_;
    std::mutex mtx_; // tasks report from pool threads

public:
    ReportEngine(services_t services, bool sync_output)
        : services_{ services }
        , sync_output_{ sync_output } {
    }

    template <typename EventType>
    void record(EventType &&ev) {
        if(not sync_output_)
            return;

        std::scoped_lock l{ mtx_ };
        services_.template get<RendererType>().get()(ev);
    }
};
