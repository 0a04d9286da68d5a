#include "simulation_ticker.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/asio/post.hpp>

namespace auvctl {

SimulationTicker::SimulationTicker(net::io_context& ioc, VehicleStateMachine& vehicle,
                                   std::chrono::milliseconds interval)
    : strand_(net::make_strand(ioc))
    , timer_(strand_)
    , vehicle_(vehicle)
    , interval_(interval)
    , dt_(std::chrono::duration<double>(interval).count())
{}

SimulationTicker::~SimulationTicker() {
    running_ = false;
}

void SimulationTicker::start() {
    if (running_.exchange(true)) {
        return;
    }
    net::post(strand_, [this] {
        next_deadline_ = std::chrono::steady_clock::now() + interval_;
        schedule();
    });
}

void SimulationTicker::stop() {
    running_ = false;
    net::post(strand_, [this] {
        timer_.cancel();
    });
}

void SimulationTicker::schedule() {
    timer_.expires_at(next_deadline_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        on_tick(ec);
    });
}

void SimulationTicker::on_tick(const boost::system::error_code& ec) {
    if (ec || !running_) {
        return;
    }

    try {
        vehicle_.tick(dt_);
        MetricsRegistry::instance().increment_counter("sim_ticks_total");
    } catch (const std::exception& e) {
        // The previous state is kept; the loop keeps its cadence.
        MetricsRegistry::instance().increment_counter("sim_tick_faults_total");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR,
                            "internal", std::string("Simulation step failed: ") + e.what());
    }

    const auto now = std::chrono::steady_clock::now();
    next_deadline_ += interval_;
    if (now - next_deadline_ > interval_ * max_catch_up_ticks) {
        next_deadline_ = now + interval_;
    }
    schedule();
}

}
